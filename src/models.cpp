#include "models.hpp"

bool operator==(const CanonicalRecord &a, const CanonicalRecord &b) {
    return a.workstationName == b.workstationName &&
           a.lastHardwareScan == b.lastHardwareScan &&
           a.lastLoggedUserId == b.lastLoggedUserId &&
           a.primaryUserId == b.primaryUserId &&
           a.ipAddress == b.ipAddress &&
           a.subnet == b.subnet;
}

bool operator!=(const CanonicalRecord &a, const CanonicalRecord &b) {
    return !(a == b);
}

CanonicalRecord make_canonical(const ScanRecord &row) {
    CanonicalRecord c;
    c.workstationName = row.workstationName;
    c.lastHardwareScan = row.lastHardwareScan;
    c.lastLoggedUserId = row.lastLoggedUserId;
    c.primaryUserId = row.primaryUserId;
    c.ipAddress = row.ipAddress;
    c.subnet = row.subnet;
    return c;
}

const std::vector<std::string> &canonical_headers() {
    static const std::vector<std::string> headers = {
        "Workstation Name","Last Hardware Scan","Last Logged User ID",
        "Primary User ID","IP Address","Subnet"};
    return headers;
}

std::vector<std::string> to_cells(const CanonicalRecord &row) {
    return {row.workstationName,row.lastHardwareScan,row.lastLoggedUserId,
            row.primaryUserId,row.ipAddress,row.subnet};
}

// Entries read from one roster share the same extra columns; the first
// entry decides the layout.
std::vector<std::string> roster_headers(const std::vector<RosterEntry> &rows) {
    std::vector<std::string> headers = {"PC Name"};
    if (!rows.empty()) {
        for (const auto &f : rows.front().extra) headers.push_back(f.name);
    }
    return headers;
}

std::vector<std::string> to_cells(const RosterEntry &row) {
    std::vector<std::string> cells;
    cells.reserve(row.extra.size() + 1);
    cells.push_back(row.pcName);
    for (const auto &f : row.extra) cells.push_back(f.value);
    return cells;
}
