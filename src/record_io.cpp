#include "record_io.hpp"

#include <fmt/format.h>

#include <string>
#include <vector>

namespace {

const std::vector<std::string> kNameAliases = {"Workstation Name","Workstation","Computer Name","Name"};
const std::vector<std::string> kScanAliases = {"Last Hardware Scan"};
const std::vector<std::string> kLoggedUserAliases = {"Last Logged User ID","Last Logged User"};
const std::vector<std::string> kPrimaryUserAliases = {"Primary User ID","Primary User"};
const std::vector<std::string> kIpAliases = {"IP Address","IP"};
const std::vector<std::string> kSubnetAliases = {"Subnet"};
const std::vector<std::string> kRosterAliases = {"PC Name","Workstation Name","Computer Name","Name"};

constexpr std::size_t npos = std::string::npos;

// Column positions of the canonical fields; npos when absent.
struct Binding {
    std::size_t name, scan, loggedUser, primaryUser, ip, subnet;

    bool bound(std::size_t col) const {
        return col == name || col == scan || col == loggedUser ||
               col == primaryUser || col == ip || col == subnet;
    }
};

Binding bind_canonical(const table::Table &t, const std::string &origin) {
    Binding b{};
    b.name = table::find_column(t.headers, kNameAliases);
    if (b.name == npos)
        throw table::TableError(fmt::format("{}: no workstation name column (expected \"Workstation Name\")", origin));
    b.scan = table::find_column(t.headers, kScanAliases);
    b.loggedUser = table::find_column(t.headers, kLoggedUserAliases);
    b.primaryUser = table::find_column(t.headers, kPrimaryUserAliases);
    b.ip = table::find_column(t.headers, kIpAliases);
    b.subnet = table::find_column(t.headers, kSubnetAliases);
    return b;
}

inline std::string cell(const std::vector<std::string> &row, std::size_t col) {
    return col < row.size() ? row[col] : std::string{};
}

std::vector<Field> extras(const table::Table &t, const std::vector<std::string> &row,
                          std::size_t skip, const Binding *b = nullptr) {
    std::vector<Field> out;
    for (std::size_t c = 0; c < t.headers.size(); ++c) {
        if (c == skip) continue;
        if (b && b->bound(c)) continue;
        out.push_back({t.headers[c], cell(row, c)});
    }
    return out;
}

} // namespace

namespace table {

std::vector<ScanRecord> scans_from(const Table &t, const std::string &origin) {
    const Binding b = bind_canonical(t, origin);
    std::vector<ScanRecord> out;
    out.reserve(t.rows.size());
    for (std::size_t i = 0; i < t.rows.size(); ++i) {
        const auto &row = t.rows[i];
        ScanRecord r;
        r.workstationName = cell(row, b.name);
        r.lastHardwareScan = cell(row, b.scan);
        r.lastLoggedUserId = cell(row, b.loggedUser);
        r.primaryUserId = cell(row, b.primaryUser);
        r.ipAddress = cell(row, b.ip);
        r.subnet = cell(row, b.subnet);
        r.extra = extras(t, row, npos, &b);
        r.sourceRow = i + 1;
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<CanonicalRecord> reference_from(const Table &t, const std::string &origin) {
    const Binding b = bind_canonical(t, origin);
    std::vector<CanonicalRecord> out;
    out.reserve(t.rows.size());
    for (const auto &row : t.rows) {
        out.push_back({cell(row, b.name), cell(row, b.scan), cell(row, b.loggedUser),
                       cell(row, b.primaryUser), cell(row, b.ip), cell(row, b.subnet)});
    }
    return out;
}

std::vector<RosterEntry> roster_from(const Table &t, const std::string &origin) {
    const std::size_t col = find_column(t.headers, kRosterAliases);
    if (col == npos)
        throw TableError(fmt::format("{}: no PC name column (expected \"PC Name\")", origin));
    std::vector<RosterEntry> out;
    out.reserve(t.rows.size());
    for (const auto &row : t.rows) out.push_back({cell(row, col), extras(t, row, col)});
    return out;
}

std::vector<ScanRecord> read_scans(const std::string &path, char delimiter) {
    return scans_from(read_delimited(path, delimiter), path);
}

std::vector<CanonicalRecord> read_reference(const std::string &path, char delimiter) {
    return reference_from(read_delimited(path, delimiter), path);
}

std::vector<RosterEntry> read_roster(const std::string &path, char delimiter) {
    return roster_from(read_delimited(path, delimiter), path);
}

void write_canonical(const std::string &path, const std::vector<CanonicalRecord> &rows, char delimiter) {
    std::vector<std::vector<std::string>> cells;
    cells.reserve(rows.size());
    for (const auto &r : rows) cells.push_back(to_cells(r));
    write_delimited(path, canonical_headers(), cells, delimiter);
}

void write_roster(const std::string &path, const std::vector<RosterEntry> &rows, char delimiter) {
    std::vector<std::vector<std::string>> cells;
    cells.reserve(rows.size());
    for (const auto &r : rows) cells.push_back(to_cells(r));
    write_delimited(path, roster_headers(rows), cells, delimiter);
}

} // namespace table
