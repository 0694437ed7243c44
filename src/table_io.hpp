#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace table {

// In-memory delimited table: one header row plus data rows.
struct Table {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
};

class TableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reads <path> as delimited text. Quoted fields may contain the delimiter,
// doubled quotes and line breaks. A UTF-8 BOM and blank lines are skipped.
// Throws TableError when the file cannot be read or is malformed.
Table read_delimited(const std::string &path, char delimiter = ',');
Table parse_delimited(const std::string &text, char delimiter = ',',
                      const std::string &origin = "<memory>");

// Writes header + rows, quoting cells that need it. Creates the parent
// directory if missing.
void write_delimited(const std::string &path,
                     const std::vector<std::string> &headers,
                     const std::vector<std::vector<std::string>> &rows,
                     char delimiter = ',');
std::string format_row(const std::vector<std::string> &cells, char delimiter = ',');

// Lowercase with spaces, underscores and hyphens removed, so that
// "Last Hardware Scan" and "last_hardware_scan" compare equal.
std::string header_key(const std::string &header);

// Index of the first header matching any alias, or npos.
std::size_t find_column(const std::vector<std::string> &headers,
                        const std::vector<std::string> &aliases);

} // namespace table
