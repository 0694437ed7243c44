#pragma once
#include "models.hpp"
#include <optional>
#include <vector>
#include <string>

namespace excel {

// Sheets present in the workbook are the ones the run produced.
struct WorkbookContent {
    std::optional<Selection> latest;
    std::optional<Reconciliation> reconciliation;
};

// Throws std::runtime_error if libxlsxwriter cannot create or save the file.
void write_workbook(const std::string &path, const WorkbookContent &content);
}
