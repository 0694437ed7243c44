#pragma once
#include <string>
#include <optional>
#include <chrono>

namespace util {
std::string trim(const std::string &s);
bool is_blank(const std::string &s);

// Parses a hardware scan timestamp ("M/d/yyyy H:mm" and the other forms the
// inventory export produces) as UTC. Returns nullopt for anything malformed,
// including out-of-range dates such as 2/30/2023.
std::optional<std::chrono::system_clock::time_point> parse_scan_time(const std::string &s);
}
