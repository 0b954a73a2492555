#include "workbook_loader.h"
#include "csv_parser.h"
#include "errors.h"
#include <filesystem>
#include <fstream>
#include <unordered_set>
#include <xlnt/xlnt.hpp>

FileType WorkbookLoader::requireType(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        throw LoadError("Could not open file: " + filename);
    }

    FileType type = FileTypeDetector::detect(filename);
    if (type == FileType::UNKNOWN) {
        throw LoadError("Unsupported file type: " + filename);
    }
    return type;
}

std::vector<std::string> WorkbookLoader::sheetNames(const std::string& filename) {
    ZoneScoped;
    ZoneName("List Sheets", 11);

    if (requireType(filename) == FileType::CSV) {
        return { DEFAULT_SHEET };
    }

    try {
        xlnt::workbook wb;
        wb.load(filename);
        return wb.sheet_titles();
    }
    catch (const xlnt::exception& e) {
        throw LoadError("Error reading XLSX file " + filename + ": " + std::string(e.what()));
    }
    catch (const std::exception& e) {
        throw LoadError("Error reading XLSX file " + filename + ": " + std::string(e.what()));
    }
}

std::vector<std::string> WorkbookLoader::columnNames(const std::string& filename, const std::string& sheet) {
    return loadTable(filename, sheet).columns();
}

Table WorkbookLoader::loadTable(const std::string& filename, const std::string& sheet) {
    switch (requireType(filename)) {
    case FileType::CSV:
        return readCSV(filename, sheet);
    case FileType::XLSX:
        return readXLSX(filename, sheet);
    default:
        throw LoadError("Unsupported file type: " + filename);
    }
}

std::vector<std::string> WorkbookLoader::uniqueColumnNames(const std::vector<std::string>& header) {
    std::vector<std::string> names;
    names.reserve(header.size());
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < header.size(); ++i) {
        std::string base = header[i].empty() ? "Unnamed: " + std::to_string(i) : header[i];
        std::string name = base;
        for (int suffix = 1; seen.count(name) > 0; ++suffix) {
            name = base + "." + std::to_string(suffix);
        }
        seen.insert(name);
        names.push_back(std::move(name));
    }

    return names;
}

// ============ CSV ============

Table WorkbookLoader::readCSV(const std::string& filename, const std::string& sheet) {
    ZoneScoped;
    ZoneName("Read CSV", 8);

    if (sheet != DEFAULT_SHEET) {
        throw LoadError("Sheet not found in " + filename + ": " + sheet);
    }

    std::ifstream file(filename);
    if (!file.is_open()) {
        throw LoadError("Could not open file: " + filename);
    }

    std::vector<std::string> header;
    std::vector<Row> rows;

    try {
        CSVParser parser(file);
        std::vector<std::string> fields;

        if (parser.next(fields)) {
            header = fields;
        }

        while (parser.next(fields)) {
            if (fields.size() > header.size()) {
                throw LoadError("line " + std::to_string(parser.recordLine()) +
                    " has more fields than the header");
            }

            Row row;
            // Annotated copies of csv input are written compactly from row 2
            row.sheetRow = rows.size() + 2;
            for (auto& field : fields) {
                row.cells.push_back(field.empty() ? Value::null() : Value::text(std::move(field)));
            }
            rows.push_back(std::move(row));
        }
    }
    catch (const LoadError& e) {
        throw LoadError("Error reading CSV file " + filename + ": " + std::string(e.what()));
    }

#ifdef TRACY_ENABLE
    TracyPlot("Row Count CSV", static_cast<int64_t>(rows.size()));
#endif

    std::vector<size_t> sheetColumns(header.size());
    for (size_t i = 0; i < sheetColumns.size(); ++i) {
        sheetColumns[i] = i + 1;
    }

    return Table(sheet, uniqueColumnNames(header), std::move(sheetColumns), std::move(rows));
}

// ============ XLSX ============

Value WorkbookLoader::cellValue(const xlnt::cell& cell) {
    if (!cell.has_value()) {
        return Value::null();
    }

    switch (cell.data_type()) {
    case xlnt::cell::type::number:
        if (cell.is_date()) {
            return Value::text(cell.value<xlnt::datetime>().to_iso_string());
        }
        return Value::number(cell.value<double>());

    case xlnt::cell::type::shared_string:
    case xlnt::cell::type::inline_string: {
        auto text = cell.value<std::string>();
        return text.empty() ? Value::null() : Value::text(std::move(text));
    }

    case xlnt::cell::type::boolean:
        return Value::boolean(cell.value<bool>());

    case xlnt::cell::type::date:
        return Value::text(cell.value<xlnt::datetime>().to_iso_string());

    case xlnt::cell::type::empty:
        return Value::null();

    default:
        // Formula results and error values are compared as displayed
        return Value::text(cell.to_string());
    }
}

Table WorkbookLoader::readXLSX(const std::string& filename, const std::string& sheet) {
    ZoneScoped;
    ZoneName("Read XLSX", 9);

    try {
        xlnt::workbook wb;

        {
            ZoneScoped;
            ZoneName("Load XLSX Workbook", 18);
            wb.load(filename);
        }

        if (!wb.contains(sheet)) {
            throw LoadError("Sheet not found in " + filename + ": " + sheet);
        }

        auto ws = wb.sheet_by_title(sheet);

        const xlnt::row_t firstRow = ws.lowest_row();
        const xlnt::row_t lastRow = ws.highest_row();
        const auto firstColumn = ws.lowest_column().index;
        const auto lastColumn = ws.highest_column().index;

        auto readRow = [&](xlnt::row_t r, bool& any) {
            std::vector<Value> cells;
            cells.reserve(lastColumn - firstColumn + 1);
            any = false;
            for (auto c = firstColumn; c <= lastColumn; ++c) {
                xlnt::cell_reference ref(xlnt::column_t(c), r);
                if (!ws.has_cell(ref)) {
                    cells.push_back(Value::null());
                    continue;
                }
                Value value = cellValue(ws.cell(ref));
                any = any || !value.isNull();
                cells.push_back(std::move(value));
            }
            return cells;
        };

        std::vector<std::string> header;
        std::vector<size_t> sheetColumns;
        std::vector<Row> rows;
        bool haveHeader = false;

        {
            ZoneScoped;
            ZoneName("Parse XLSX Rows", 15);

            for (xlnt::row_t r = firstRow; r <= lastRow; ++r) {
                bool any = false;
                auto cells = readRow(r, any);
                if (!any) continue;

                if (!haveHeader) {
                    for (size_t i = 0; i < cells.size(); ++i) {
                        header.push_back(cells[i].toString());
                        sheetColumns.push_back(firstColumn + i);
                    }
                    haveHeader = true;
                    continue;
                }

                Row row;
                row.cells = std::move(cells);
                row.sheetRow = r;
                rows.push_back(std::move(row));
            }
        }

#ifdef TRACY_ENABLE
        TracyPlot("Row Count XLSX", static_cast<int64_t>(rows.size()));
#endif

        return Table(sheet, uniqueColumnNames(header), std::move(sheetColumns), std::move(rows));
    }
    catch (const LoadError&) {
        throw;
    }
    catch (const xlnt::exception& e) {
        throw LoadError("Error reading XLSX file " + filename + ": " + std::string(e.what()));
    }
    catch (const std::exception& e) {
        // zip and xml errors below xlnt do not always derive from xlnt::exception
        throw LoadError("Error reading XLSX file " + filename + ": " + std::string(e.what()));
    }
}
