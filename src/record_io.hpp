#pragma once
#include "models.hpp"
#include "table_io.hpp"

#include <string>
#include <vector>

namespace table {

// Column binding for inventory exports. Header names are matched loosely
// (see header_key); columns that are not bound are kept as Field extras.
std::vector<ScanRecord> scans_from(const Table &t, const std::string &origin = "<memory>");
std::vector<CanonicalRecord> reference_from(const Table &t, const std::string &origin = "<memory>");
std::vector<RosterEntry> roster_from(const Table &t, const std::string &origin = "<memory>");

std::vector<ScanRecord> read_scans(const std::string &path, char delimiter = ',');
std::vector<CanonicalRecord> read_reference(const std::string &path, char delimiter = ',');
std::vector<RosterEntry> read_roster(const std::string &path, char delimiter = ',');

void write_canonical(const std::string &path, const std::vector<CanonicalRecord> &rows, char delimiter = ',');
void write_roster(const std::string &path, const std::vector<RosterEntry> &rows, char delimiter = ',');

} // namespace table
