#include "table_io.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct RowBuilder {
  std::vector<std::string> cells;
  std::string field;
  bool quoted = false;      // current row has seen a quoted field

  void end_field() {
    cells.push_back(std::move(field));
    field.clear();
  }
  bool blank() const {
    return !quoted && cells.size() == 1 && cells.front().empty();
  }
  void reset() {
    cells.clear();
    field.clear();
    quoted = false;
  }
};

inline bool needs_quotes(const std::string& v, char delimiter) {
  for (char c : v)
    if (c == delimiter || c == '"' || c == '\r' || c == '\n') return true;
  return false;
}

} // namespace

namespace table {

Table parse_delimited(const std::string& text, char delimiter, const std::string& origin) {
  Table t;
  bool have_header = false;

  std::size_t pos = 0;
  // Excel writes a BOM in front of "CSV UTF-8" exports.
  if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) pos = 3;

  RowBuilder row;
  bool in_quotes = false;
  std::size_t line_no = 1;
  std::size_t row_start_line = 1;

  auto finish_row = [&]() {
    row.end_field();
    if (!row.blank()) {
      if (!have_header) {
        t.headers = std::move(row.cells);
        have_header = true;
      } else {
        row.cells.resize(std::max(row.cells.size(), t.headers.size()));
        t.rows.push_back(std::move(row.cells));
      }
    }
    row.reset();
  };

  for (; pos < text.size(); ++pos) {
    const char c = text[pos];

    if (in_quotes) {
      if (c == '"') {
        // Escaped quote inside quoted field: "" -> "
        if (pos + 1 < text.size() && text[pos + 1] == '"') {
          row.field.push_back('"');
          ++pos;
        } else {
          in_quotes = false;
        }
      } else {
        if (c == '\n') ++line_no;
        row.field.push_back(c);
      }
      continue;
    }

    if (c == '"' && row.field.empty()) {
      in_quotes = true;
      row.quoted = true;
      continue;
    }
    if (c == delimiter) {
      row.end_field();
      continue;
    }
    if (c == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') continue;
    if (c == '\n') {
      finish_row();
      ++line_no;
      row_start_line = line_no;
      continue;
    }
    row.field.push_back(c);
  }

  if (in_quotes)
    throw TableError(fmt::format("{}:{}: unterminated quoted field", origin, row_start_line));
  if (!row.field.empty() || !row.cells.empty() || row.quoted) finish_row();

  if (!have_header)
    throw TableError(fmt::format("{}: empty file (no header)", origin));
  return t;
}

Table read_delimited(const std::string& path, char delimiter) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw TableError(fmt::format("failed to open {}", path));
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw TableError(fmt::format("failed to read {}", path));
  return parse_delimited(ss.str(), delimiter, path);
}

std::string format_row(const std::vector<std::string>& cells, char delimiter) {
  std::string out;
  for (size_t i = 0; i < cells.size(); ++i) {
    const std::string& v = cells[i];
    if (needs_quotes(v, delimiter)) {
      out.push_back('"');
      for (char c : v) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
      }
      out.push_back('"');
    } else {
      out += v;
    }
    if (i + 1 < cells.size()) out.push_back(delimiter);
  }
  return out;
}

void write_delimited(const std::string& path,
                     const std::vector<std::string>& headers,
                     const std::vector<std::vector<std::string>>& rows,
                     char delimiter) {
  const fs::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec) throw TableError(fmt::format("cannot create {}: {}", p.parent_path().string(), ec.message()));
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw TableError(fmt::format("failed to open {} for writing", path));

  out << format_row(headers, delimiter) << "\n";
  for (const auto& r : rows) out << format_row(r, delimiter) << "\n";

  out.flush();
  if (!out) throw TableError(fmt::format("failed to write {}", path));
}

std::string header_key(const std::string& header) {
  std::string k;
  k.reserve(header.size());
  for (char c : header) {
    const unsigned char u = static_cast<unsigned char>(c);
    if (std::isspace(u) || c == '_' || c == '-') continue;
    k.push_back(static_cast<char>(std::tolower(u)));
  }
  return k;
}

std::size_t find_column(const std::vector<std::string>& headers,
                        const std::vector<std::string>& aliases) {
  for (const auto& a : aliases) {
    const std::string want = header_key(a);
    for (size_t i = 0; i < headers.size(); ++i)
      if (header_key(headers[i]) == want) return i;
  }
  return std::string::npos;
}

} // namespace table
