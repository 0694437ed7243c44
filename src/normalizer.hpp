#pragma once
#include <string>

namespace inventory {

// Comparison key for a workstation name: trimmed, NFC, case-folded.
// Two names refer to the same workstation iff their keys are equal.
// Blank input yields "".
std::string normalize_name(const std::string &raw);

// True when the name is empty after stripping Unicode whitespace, i.e. when
// normalize_name() would return "".
bool is_blank_name(const std::string &raw);

}
