#include "annotated_writer.h"
#include "errors.h"
#include "file_type.h"
#include <filesystem>
#include <xlnt/xlnt.hpp>

namespace {

// Keeps the source sheet with its styles, drops the other sheets.
xlnt::workbook openSourceSheet(const std::string& sourcePath, const std::string& sheet) {
    xlnt::workbook wb;
    wb.load(sourcePath);

    if (!wb.contains(sheet)) {
        throw LoadError("Sheet not found in " + sourcePath + ": " + sheet);
    }

    for (const auto& title : wb.sheet_titles()) {
        if (title != sheet) {
            wb.remove_sheet(wb.sheet_by_title(title));
        }
    }
    wb.active_sheet(0);
    return wb;
}

// Csv input has no styles to keep: header on row 1, data rows below.
xlnt::workbook buildSheet(const Table& table) {
    xlnt::workbook wb;
    auto ws = wb.active_sheet();
    if (ws.title() != table.sheetName()) {
        ws.title(table.sheetName());
    }

    for (size_t c = 0; c < table.columnCount(); ++c) {
        ws.cell(xlnt::column_t(static_cast<xlnt::column_t::index_t>(table.sheetColumn(c))), 1)
            .value(table.columns()[c]);
    }

    for (const auto& row : table.rows()) {
        for (size_t c = 0; c < row.cells.size(); ++c) {
            const Value& value = row.cells[c];
            if (value.isNull()) continue;

            auto cell = ws.cell(
                xlnt::column_t(static_cast<xlnt::column_t::index_t>(table.sheetColumn(c))),
                static_cast<xlnt::row_t>(row.sheetRow));
            switch (value.kind()) {
            case Value::Kind::Boolean: cell.value(value.asBool()); break;
            case Value::Kind::Number:  cell.value(value.asNumber()); break;
            default:                   cell.value(value.asText()); break;
            }
        }
    }

    return wb;
}

xlnt::cell cellAt(xlnt::worksheet& ws, size_t column, size_t row) {
    return ws.cell(
        xlnt::column_t(static_cast<xlnt::column_t::index_t>(column)),
        static_cast<xlnt::row_t>(row));
}

void applyMarks(xlnt::worksheet ws, const Table& table, const AnnotatedTable& annotated) {
    const auto uniqueFill = xlnt::fill::solid(xlnt::rgb_color(AnnotatedWriter::UNIQUE_ROW_FILL));
    const auto diffFill = xlnt::fill::solid(xlnt::rgb_color(AnnotatedWriter::DIFF_CELL_FILL));

    for (const auto& mark : annotated.rowMarks) {
        for (size_t c = 0; c < table.columnCount(); ++c) {
            cellAt(ws, table.sheetColumn(c), mark.sheetRow).fill(uniqueFill);
        }
        if (table.columnCount() > 0) {
            cellAt(ws, table.sheetColumn(mark.noteColumn), mark.sheetRow)
                .comment(mark.note, AnnotatedWriter::AUTHOR);
        }
    }

    for (const auto& mark : annotated.cellMarks) {
        auto cell = cellAt(ws, mark.sheetColumn, mark.sheetRow);

        xlnt::font font = cell.has_format() ? cell.font() : xlnt::font();
        font.color(xlnt::rgb_color(AnnotatedWriter::DIFF_CELL_FONT));

        cell.fill(diffFill);
        cell.font(font);
        cell.comment(mark.note, AnnotatedWriter::AUTHOR);
    }
}

} // namespace

void AnnotatedWriter::write(const std::string& sourcePath,
    const Table& table,
    const AnnotatedTable& annotated,
    const std::string& outputPath,
    const ScopedWorkDir& workDir) {

    ZoneScoped;
    ZoneName("Write Annotated XLSX", 20);

    auto staged = workDir.file(std::filesystem::path(outputPath).filename().string());

    try {
        xlnt::workbook wb = FileTypeDetector::detect(sourcePath) == FileType::XLSX
            ? openSourceSheet(sourcePath, table.sheetName())
            : buildSheet(table);

        applyMarks(wb.sheet_by_title(table.sheetName()), table, annotated);
        wb.save(staged.string());
    }
    catch (const xlnt::exception& e) {
        throw std::runtime_error("Error writing annotated copy of " + sourcePath + ": " +
            std::string(e.what()));
    }

    ScopedWorkDir::publish(staged, outputPath);
}

std::string AnnotatedWriter::markedFileName(const std::string& sourcePath, Side side,
    const std::string& sheet) {
    std::string name = std::filesystem::path(sourcePath).stem().string();
    if (!sheet.empty()) {
        name += "_" + sheet;
    }
    name += side == Side::Left ? "_file1_marked.xlsx" : "_file2_marked.xlsx";
    return name;
}
