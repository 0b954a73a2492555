#pragma once

#include <string>
#include <vector>
#include <xlnt/xlnt.hpp>

class XLSXTestHelper {
public:
    using SheetData = std::vector<std::vector<std::string>>;

    // Cells that parse completely as numbers are stored as numbers,
    // empty strings are left blank.
    static void fillSheet(xlnt::worksheet ws, const SheetData& data) {
        for (size_t r = 0; r < data.size(); ++r) {
            for (size_t c = 0; c < data[r].size(); ++c) {
                const std::string& text = data[r][c];
                if (text.empty()) continue;

                auto cell = ws.cell(xlnt::column_t(static_cast<xlnt::column_t::index_t>(c + 1)),
                    static_cast<xlnt::row_t>(r + 1));
                try {
                    size_t pos;
                    double d = std::stod(text, &pos);
                    if (pos == text.length()) {
                        cell.value(d);
                        continue;
                    }
                }
                catch (const std::logic_error&) {
                    // not a number
                }
                cell.value(text);
            }
        }
    }

    static void createTestFile(const std::string& filename, const SheetData& data,
        const std::string& sheet = "Sheet1") {
        xlnt::workbook wb;
        auto ws = wb.active_sheet();
        if (ws.title() != sheet) ws.title(sheet);
        fillSheet(ws, data);
        wb.save(filename);
    }

    static void createMultiSheetFile(const std::string& filename,
        const std::vector<std::pair<std::string, SheetData>>& sheets) {
        xlnt::workbook wb;
        for (size_t i = 0; i < sheets.size(); ++i) {
            auto ws = i == 0 ? wb.active_sheet() : wb.create_sheet();
            if (ws.title() != sheets[i].first) ws.title(sheets[i].first);
            fillSheet(ws, sheets[i].second);
        }
        wb.save(filename);
    }
};
