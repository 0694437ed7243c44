#include "selector.hpp"
#include "normalizer.hpp"
#include "util_time.hpp"

#include <fmt/format.h>

#include <chrono>
#include <optional>
#include <unordered_map>
#include <utility>

namespace inventory {

namespace {

using Stamp = std::optional<std::chrono::system_clock::time_point>;

struct Candidate {
    const ScanRecord *record;
    Stamp stamp;
};

std::string describe_row(std::size_t row) {
    return row ? fmt::format(" (row {})", row) : std::string{};
}

Stamp stamp_of(const ScanRecord &r) {
    if (util::is_blank(r.lastHardwareScan)) return std::nullopt;
    auto t = util::parse_scan_time(r.lastHardwareScan);
    if (!t) throw MalformedTimestampError(r.workstationName, r.lastHardwareScan, r.sourceRow);
    return t;
}

// nullopt orders before every parsed time; equal stamps keep the incumbent.
bool newer(const Stamp &challenger, const Stamp &incumbent) {
    if (!challenger) return false;
    if (!incumbent) return true;
    return *challenger > *incumbent;
}

} // namespace

MalformedTimestampError::MalformedTimestampError(std::string workstation, std::string value, std::size_t row)
    : std::runtime_error(fmt::format("malformed Last Hardware Scan '{}' for workstation '{}'{}",
                                     value, workstation, describe_row(row))),
      workstation_(std::move(workstation)),
      value_(std::move(value)),
      row_(row) {}

Selection select_latest(const std::vector<ScanRecord> &records, KeyPolicy policy) {
    Selection out;
    std::vector<Candidate> groups;
    std::unordered_map<std::string, std::size_t> slot;

    for (const auto &r : records) {
        if (is_blank_name(r.workstationName)) {
            ++out.skippedBlankNames;
            continue;
        }

        Stamp stamp = stamp_of(r);
        std::string key = policy == KeyPolicy::Normalized ? normalize_name(r.workstationName)
                                                          : r.workstationName;

        auto it = slot.find(key);
        if (it == slot.end()) {
            slot.emplace(std::move(key), groups.size());
            groups.push_back({&r, stamp});
            continue;
        }

        Candidate &best = groups[it->second];
        if (newer(stamp, best.stamp)) {
            best.record = &r;
            best.stamp = stamp;
        }
    }

    out.records.reserve(groups.size());
    for (const auto &g : groups) out.records.push_back(make_canonical(*g.record));
    return out;
}

}
