#include "annotator.h"
#include <stdexcept>

const RowMark* AnnotatedTable::findRowMark(size_t row) const {
    for (const auto& mark : rowMarks) {
        if (mark.row == row) return &mark;
    }
    return nullptr;
}

const CellMark* AnnotatedTable::findCellMark(size_t row, size_t column) const {
    for (const auto& mark : cellMarks) {
        if (mark.row == row && mark.column == column) return &mark;
    }
    return nullptr;
}

std::string Annotator::sideLabel(Side side) {
    return side == Side::Left ? "file 1" : "file 2";
}

std::string Annotator::cellNote(const CellDiff& diff, Side side) {
    std::string other = sideLabel(opposite(side));
    return "Differs from " + other + " row " + std::to_string(diff.otherSheetRow) +
        " [" + diff.column + "]\n" +
        other + " value: " + diff.otherValue.toString();
}

AnnotatedTable Annotator::annotate(const Table& table,
    Side side,
    const PartitionResult& partition,
    const std::vector<CellDiff>& diffs,
    const std::vector<std::string>& keyColumns) {

    ZoneScoped;
    ZoneName("Annotate Table", 14);

    AnnotatedTable annotated;
    annotated.side = side;

    size_t noteColumn = 0;
    if (!keyColumns.empty()) {
        if (auto index = table.columnIndex(keyColumns.front())) {
            noteColumn = *index;
        }
    }

    const auto& unique = side == Side::Left ? partition.onlyLeft : partition.onlyRight;
    for (const auto& rows : unique) {
        size_t row = side == Side::Left ? rows.leftRow : rows.rightRow;
        if (row >= table.rowCount()) {
            throw std::out_of_range("Partition row outside of table: " + std::to_string(row));
        }
        annotated.rowMarks.push_back(RowMark{
            row, table.rows()[row].sheetRow, noteColumn, UNIQUE_ROW_NOTE });
    }

    for (const auto& diff : diffs) {
        if (diff.thisRow >= table.rowCount() || diff.thisColumn >= table.columnCount()) {
            throw std::out_of_range("Cell difference outside of table: " + diff.column);
        }
        annotated.cellMarks.push_back(CellMark{
            diff.thisRow,
            diff.thisColumn,
            table.rows()[diff.thisRow].sheetRow,
            table.sheetColumn(diff.thisColumn),
            cellNote(diff, side) });
    }

    return annotated;
}
