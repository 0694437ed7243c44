#pragma once
#include <cstddef>
#include <string>
#include <vector>

// A named cell carried through from a source row.
struct Field {
    std::string name;
    std::string value;
};

// One inventory observation (one row of the scan report).
struct ScanRecord {
    std::string workstationName;
    std::string lastHardwareScan;   // blank = no scan recorded
    std::string lastLoggedUserId;
    std::string primaryUserId;
    std::string ipAddress;
    std::string subnet;
    std::vector<Field> extra;
    std::size_t sourceRow = 0;      // 1-based data row, 0 if not from a table
};

// Latest known state of one workstation.
struct CanonicalRecord {
    std::string workstationName;
    std::string lastHardwareScan;
    std::string lastLoggedUserId;
    std::string primaryUserId;
    std::string ipAddress;
    std::string subnet;
};

bool operator==(const CanonicalRecord &a, const CanonicalRecord &b);
bool operator!=(const CanonicalRecord &a, const CanonicalRecord &b);

struct RosterEntry {
    std::string pcName;
    std::vector<Field> extra;
};

struct Selection {
    std::vector<CanonicalRecord> records;
    std::size_t skippedBlankNames = 0;
};

struct Reconciliation {
    std::vector<CanonicalRecord> matched;
    std::vector<RosterEntry> unmatched;
    std::size_t ambiguousKeys = 0;
};

CanonicalRecord make_canonical(const ScanRecord &row);

// Column headings used for every canonical table written out.
const std::vector<std::string> &canonical_headers();
std::vector<std::string> to_cells(const CanonicalRecord &row);

std::vector<std::string> roster_headers(const std::vector<RosterEntry> &rows);
std::vector<std::string> to_cells(const RosterEntry &row);
