#pragma once

#include "sheet_comparator.h"
#include "table.h"
#include <string>
#include <vector>

// Whole-row marker for a row whose key exists only in this table.
struct RowMark {
    size_t row;
    size_t sheetRow;
    size_t noteColumn;  // table column that carries the note
    std::string note;
};

// Marker for a single cell whose value differs from the counterpart table.
struct CellMark {
    size_t row;
    size_t column;
    size_t sheetRow;
    size_t sheetColumn;
    std::string note;
};

// Overlay on a Table. Never holds or changes cell values.
struct AnnotatedTable {
    Side side = Side::Left;
    std::vector<RowMark> rowMarks;
    std::vector<CellMark> cellMarks;

    bool empty() const { return rowMarks.empty() && cellMarks.empty(); }
    const RowMark* findRowMark(size_t row) const;
    const CellMark* findCellMark(size_t row, size_t column) const;
};

class Annotator {
public:
    static constexpr const char* UNIQUE_ROW_NOTE = "Row exists only in this file";

    // diffs must be seen from this table's side
    // (ComparisonResult::leftToRight for Side::Left, rightToLeft for Side::Right).
    static AnnotatedTable annotate(const Table& table,
        Side side,
        const PartitionResult& partition,
        const std::vector<CellDiff>& diffs,
        const std::vector<std::string>& keyColumns = {});

    static std::string cellNote(const CellDiff& diff, Side side);
    static std::string sideLabel(Side side);
    static Side opposite(Side side) { return side == Side::Left ? Side::Right : Side::Left; }
};
