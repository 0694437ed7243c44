#pragma once
#include "models.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace inventory {

// How the selector decides two records belong to the same workstation.
enum class KeyPolicy {
    Raw,        // workstation name taken verbatim
    Normalized  // normalize_name() of the workstation name
};

// A non-blank scan timestamp that does not parse. Fatal for the whole
// selection: a silently dropped row could hide the real latest scan.
class MalformedTimestampError : public std::runtime_error {
public:
    MalformedTimestampError(std::string workstation, std::string value, std::size_t row);

    const std::string &workstation() const { return workstation_; }
    const std::string &value() const { return value_; }
    std::size_t row() const { return row_; }

private:
    std::string workstation_;
    std::string value_;
    std::size_t row_;
};

// Keeps the most recent record per workstation. Blank timestamps lose to any
// parsed one; ties keep the first record seen. Output follows first
// appearance of each workstation.
Selection select_latest(const std::vector<ScanRecord> &records,
                        KeyPolicy policy = KeyPolicy::Raw);

}
