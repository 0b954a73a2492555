#pragma once

#include "file_type.h"
#include "table.h"
#include "value.h"
#include <string>
#include <vector>

// Tracy profiler integration
#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#else
#define ZoneScoped
#define ZoneScopedN(name)
#define ZoneName(name, size)
#define TracyPlot(name, value)
#define FrameMark
#define FrameMarkNamed(name)
#endif

namespace xlnt {
class cell;
}

// Reads worksheets (.xlsx) and csv files into Tables. The first non-empty
// row of a sheet is the header; every later non-empty row is a data row.
// A csv file exposes a single sheet named DEFAULT_SHEET.
class WorkbookLoader {
public:
    static constexpr const char* DEFAULT_SHEET = "Sheet1";

    static std::vector<std::string> sheetNames(const std::string& filename);
    static std::vector<std::string> columnNames(const std::string& filename, const std::string& sheet);
    static Table loadTable(const std::string& filename, const std::string& sheet);

    // Fills blank header names and makes repeated ones unique
    static std::vector<std::string> uniqueColumnNames(const std::vector<std::string>& header);

    static Value cellValue(const xlnt::cell& cell);

private:
    static FileType requireType(const std::string& filename);

    static Table readCSV(const std::string& filename, const std::string& sheet);
    static Table readXLSX(const std::string& filename, const std::string& sheet);
};
