#include "excel_writer.hpp"
#include <xlsxwriter.h>
#include <fmt/format.h>
#include <stdexcept>
#include <utility>

namespace excel {

static void write_rows(lxw_worksheet *ws, const std::vector<std::string> &headers, const std::vector<std::vector<std::string>> &rows) {
    for (size_t c=0;c<headers.size();++c)
        worksheet_write_string(ws,0,static_cast<lxw_col_t>(c),headers[c].c_str(),NULL);
    for (size_t r=0;r<rows.size();++r)
        for (size_t c=0;c<rows[r].size();++c)
            worksheet_write_string(ws,static_cast<lxw_row_t>(r+1),static_cast<lxw_col_t>(c),rows[r][c].c_str(),NULL);
    // A table needs at least one data row.
    if (!rows.empty())
        worksheet_add_table(ws,0,0,static_cast<lxw_row_t>(rows.size()),static_cast<lxw_col_t>(headers.size()-1),NULL);
    worksheet_freeze_panes(ws,1,0);
    worksheet_set_column(ws,0,static_cast<lxw_col_t>(headers.size()-1),22,NULL);
}

static void add_blank_scan_format(lxw_workbook *wb, lxw_worksheet *ws, size_t rows) {
    if (rows == 0) return;
    lxw_format *amber = workbook_add_format(wb);
    format_set_bg_color(amber, LXW_COLOR_YELLOW);
    lxw_conditional_format cf{};
    cf.type = LXW_CONDITIONAL_TYPE_BLANKS;
    cf.format = amber;
    // column 1 is "Last Hardware Scan"
    worksheet_conditional_format_range(ws,1,1,static_cast<lxw_row_t>(rows),1,&cf);
}

static std::vector<std::vector<std::string>> canonical_rows(const std::vector<CanonicalRecord> &rs) {
    std::vector<std::vector<std::string>> out;
    out.reserve(rs.size());
    for (const auto &r: rs) out.push_back(to_cells(r));
    return out;
}

void write_workbook(const std::string &path, const WorkbookContent &content) {
    lxw_workbook *wb = workbook_new(path.c_str());
    if (!wb) throw std::runtime_error(fmt::format("cannot create workbook {}", path));

    std::vector<std::pair<std::string,size_t>> counts;

    if (content.latest) {
        const auto &sel = *content.latest;
        lxw_worksheet *ws = workbook_add_worksheet(wb, "Latest");
        auto rows = canonical_rows(sel.records);
        write_rows(ws,canonical_headers(),rows);
        add_blank_scan_format(wb,ws,rows.size());
        counts.push_back({"Workstations",sel.records.size()});
        counts.push_back({"Skipped (blank name)",sel.skippedBlankNames});
    }

    if (content.reconciliation) {
        const auto &rec = *content.reconciliation;
        lxw_worksheet *ws_match = workbook_add_worksheet(wb, "Matched");
        write_rows(ws_match,canonical_headers(),canonical_rows(rec.matched));

        lxw_worksheet *ws_miss = workbook_add_worksheet(wb, "Not_Found");
        std::vector<std::vector<std::string>> miss;
        miss.reserve(rec.unmatched.size());
        for (const auto &r: rec.unmatched) miss.push_back(to_cells(r));
        write_rows(ws_miss,roster_headers(rec.unmatched),miss);

        counts.push_back({"Roster entries",rec.matched.size()+rec.unmatched.size()});
        counts.push_back({"Matched",rec.matched.size()});
        counts.push_back({"Not found",rec.unmatched.size()});
        counts.push_back({"Ambiguous reference names",rec.ambiguousKeys});
    }

    lxw_worksheet *ws_sum = workbook_add_worksheet(wb, "Summary");
    lxw_format *bold = workbook_add_format(wb);
    format_set_bold(bold);
    worksheet_write_string(ws_sum,0,0,"Metric",bold);
    worksheet_write_string(ws_sum,0,1,"Count",bold);
    lxw_row_t r=1;
    for (const auto &c: counts) {
        worksheet_write_string(ws_sum,r,0,c.first.c_str(),NULL);
        worksheet_write_number(ws_sum,r,1,static_cast<double>(c.second),NULL);
        ++r;
    }
    worksheet_set_column(ws_sum,0,0,30,NULL);

    lxw_error err = workbook_close(wb);
    if (err != LXW_NO_ERROR)
        throw std::runtime_error(fmt::format("cannot save workbook {}: {}", path, lxw_strerror(err)));
}

} // namespace excel
