#include "report_builder.h"
#include <sstream>

namespace {

const std::string HEAVY_RULE(60, '=');
const std::string LIGHT_RULE(60, '-');

std::string duplicateNote(const Table& table, const std::string& label, const DuplicateKey& dup) {
    std::ostringstream oss;
    oss << "  [" << label << "] key: " << dup.key.toString()
        << " rows " << table.rows()[dup.keptRow].sheetRow;
    for (size_t row : dup.ignoredRows) {
        oss << ", " << table.rows()[row].sheetRow;
    }
    oss << " (using row " << table.rows()[dup.keptRow].sheetRow << ")";
    return oss.str();
}

} // namespace

std::string ReportBuilder::formatList(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    out += "]";
    return out;
}

Report ReportBuilder::build(const Table& left,
    const Table& right,
    const std::vector<std::string>& keyColumns,
    const SheetComparator::ComparisonResult& result) {

    ZoneScoped;
    ZoneName("Build Report", 12);

    Report report;
    report.keyColumns = keyColumns;

    report.left.sheet = left.sheetName();
    report.left.rows = left.rowCount();
    report.left.columns = left.columnCount();
    report.left.uniqueRows = result.partition.onlyLeft.size();
    report.left.differingCells = result.leftToRight.size();
    report.left.duplicateKeys = result.leftDuplicates.size();

    report.right.sheet = right.sheetName();
    report.right.rows = right.rowCount();
    report.right.columns = right.columnCount();
    report.right.uniqueRows = result.partition.onlyRight.size();
    report.right.differingCells = result.rightToLeft.size();
    report.right.duplicateKeys = result.rightDuplicates.size();

    report.commonRows = result.partition.common.size();

    for (const auto& rows : result.partition.onlyLeft) {
        report.onlyLeftLines.push_back("  [file 1 row " +
            std::to_string(left.rows()[rows.leftRow].sheetRow) + "] key: " + rows.key.toString());
    }

    for (const auto& rows : result.partition.onlyRight) {
        report.onlyRightLines.push_back("  [file 2 row " +
            std::to_string(right.rows()[rows.rightRow].sheetRow) + "] key: " + rows.key.toString());
    }

    size_t lastRow = RowIndex::npos;
    for (const auto& diff : result.leftToRight) {
        if (diff.thisRow != lastRow) {
            ++report.differingRows;
            lastRow = diff.thisRow;
        }
        report.diffLines.push_back("  key: " + diff.key.toString() +
            " [file 1 row " + std::to_string(diff.thisSheetRow) +
            " vs file 2 row " + std::to_string(diff.otherSheetRow) + "]" +
            " column [" + diff.column + "]: file 1='" + diff.thisValue.toString() +
            "' vs file 2='" + diff.otherValue.toString() + "'");
    }

    if (!result.schema.onlyLeft.empty()) {
        report.schemaNotes.push_back("  Columns only in file 1: " + formatList(result.schema.onlyLeft));
    }
    if (!result.schema.onlyRight.empty()) {
        report.schemaNotes.push_back("  Columns only in file 2: " + formatList(result.schema.onlyRight));
    }

    for (const auto& dup : result.leftDuplicates) {
        report.duplicateNotes.push_back(duplicateNote(left, "file 1", dup));
    }
    for (const auto& dup : result.rightDuplicates) {
        report.duplicateNotes.push_back(duplicateNote(right, "file 2", dup));
    }

    return report;
}

void Report::render(std::ostream& out) const {
    out << HEAVY_RULE << "\n";
    out << "Sheet comparison result\n";
    out << HEAVY_RULE << "\n";
    out << "File 1 sheet: " << left.sheet << "\n";
    out << "File 2 sheet: " << right.sheet << "\n";
    out << "Key columns: " << ReportBuilder::formatList(keyColumns) << "\n";
    out << LIGHT_RULE << "\n";
    out << "File 1 rows: " << left.rows << ", columns: " << left.columns << "\n";
    out << "File 2 rows: " << right.rows << ", columns: " << right.columns << "\n";

    out << LIGHT_RULE << "\n";
    out << "Row-level summary:\n";
    out << "  Rows only in file 1: " << left.uniqueRows << "\n";
    out << "  Rows only in file 2: " << right.uniqueRows << "\n";
    out << "  Rows in both files: " << commonRows << "\n";
    out << "  Rows with differences: " << differingRows << "\n";
    out << "  Differing cells: " << left.differingCells << "\n";
    out << "  Duplicate keys in file 1: " << left.duplicateKeys << "\n";
    out << "  Duplicate keys in file 2: " << right.duplicateKeys << "\n";

    if (!onlyLeftLines.empty()) {
        out << LIGHT_RULE << "\n";
        out << "Rows only in file 1:\n";
        for (const auto& line : onlyLeftLines) out << line << "\n";
    }

    if (!onlyRightLines.empty()) {
        out << LIGHT_RULE << "\n";
        out << "Rows only in file 2:\n";
        for (const auto& line : onlyRightLines) out << line << "\n";
    }

    out << LIGHT_RULE << "\n";
    out << "Differences in common rows:\n";
    if (diffLines.empty()) {
        out << "  No differences\n";
    }
    for (const auto& line : diffLines) out << line << "\n";

    if (!schemaNotes.empty()) {
        out << LIGHT_RULE << "\n";
        out << "Column-level differences:\n";
        for (const auto& line : schemaNotes) out << line << "\n";
    }

    if (!duplicateNotes.empty()) {
        out << LIGHT_RULE << "\n";
        out << "Duplicate keys:\n";
        for (const auto& line : duplicateNotes) out << line << "\n";
    }

    out << HEAVY_RULE << "\n";
    out << "Comparison finished\n";
    out << HEAVY_RULE << "\n";
}

std::string Report::toString() const {
    std::ostringstream oss;
    render(oss);
    return oss.str();
}
