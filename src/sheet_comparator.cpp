#include "sheet_comparator.h"
#include <algorithm>

PartitionResult SheetComparator::partition(const RowIndex& left, const RowIndex& right) {
    ZoneScoped;
    ZoneName("Partition Keys", 14);

    PartitionResult result;

    for (const auto& key : left.keys()) {
        size_t leftRow = left.find(key);
        size_t rightRow = right.find(key);
        if (rightRow == RowIndex::npos) {
            result.onlyLeft.push_back(KeyedRows{ key, leftRow, RowIndex::npos });
        }
        else {
            result.common.push_back(KeyedRows{ key, leftRow, rightRow });
        }
    }

    for (const auto& key : right.keys()) {
        if (!left.contains(key)) {
            result.onlyRight.push_back(KeyedRows{ key, RowIndex::npos, right.find(key) });
        }
    }

    return result;
}

std::vector<CellDiff> SheetComparator::diffRows(const Table& left, const Table& right,
    const Schema& schema, const KeyedRows& rows) {

    std::vector<CellDiff> diffs;

    const Row& leftRow = left.rows()[rows.leftRow];
    const Row& rightRow = right.rows()[rows.rightRow];

    for (const auto& column : schema.shared) {
        const Value& v1 = leftRow.cells[column.leftIndex];
        const Value& v2 = rightRow.cells[column.rightIndex];

        if (!Value::compareValues(v1, v2)) {
            diffs.push_back(CellDiff{
                rows.key, column.name,
                rows.leftRow, rows.rightRow,
                column.leftIndex, column.rightIndex,
                leftRow.sheetRow, rightRow.sheetRow,
                v1, v2 });
        }
    }

    return diffs;
}

std::vector<CellDiff> SheetComparator::mirror(const std::vector<CellDiff>& diffs) {

    std::vector<CellDiff> mirrored;
    mirrored.reserve(diffs.size());

    for (const auto& diff : diffs) {
        mirrored.push_back(CellDiff{
            diff.key, diff.column,
            diff.otherRow, diff.thisRow,
            diff.otherColumn, diff.thisColumn,
            diff.otherSheetRow, diff.thisSheetRow,
            diff.otherValue, diff.thisValue });
    }

    // Right table order: row first, then the right table's column order
    std::stable_sort(mirrored.begin(), mirrored.end(),
        [](const CellDiff& a, const CellDiff& b) {
            if (a.thisRow != b.thisRow) return a.thisRow < b.thisRow;
            return a.thisColumn < b.thisColumn;
        });

    return mirrored;
}

SheetComparator::ComparisonResult SheetComparator::compare(
    const Table& left,
    const Table& right,
    const std::vector<std::string>& keyColumns) {

    ZoneScoped;
    ZoneName("Sheet Compare", 13);

    // Column checks happen once, before any row is indexed
    Schema schema = reconcileSchema(left, right, keyColumns);

    RowIndex leftIndex;
    RowIndex rightIndex;

    {
        ZoneScoped;
        ZoneName("Index File 1", 12);
        leftIndex = RowIndex::build(left, keyColumns, "file 1");
#ifdef TRACY_ENABLE
        TracyPlot("File 1 Keys", static_cast<int64_t>(leftIndex.size()));
#endif
    }

    {
        ZoneScoped;
        ZoneName("Index File 2", 12);
        rightIndex = RowIndex::build(right, keyColumns, "file 2");
#ifdef TRACY_ENABLE
        TracyPlot("File 2 Keys", static_cast<int64_t>(rightIndex.size()));
#endif
    }

    ComparisonResult result;
    result.leftRowCount = left.rowCount();
    result.rightRowCount = right.rowCount();
    result.partition = partition(leftIndex, rightIndex);
    result.leftDuplicates = leftIndex.duplicates();
    result.rightDuplicates = rightIndex.duplicates();

    {
        ZoneScoped;
        ZoneName("Find Cell Differences", 21);

        for (const auto& rows : result.partition.common) {
            auto diffs = diffRows(left, right, schema, rows);
            result.leftToRight.insert(result.leftToRight.end(),
                std::make_move_iterator(diffs.begin()),
                std::make_move_iterator(diffs.end()));
        }
    }

    result.rightToLeft = mirror(result.leftToRight);
    result.schema = std::move(schema);

    result.tablesMatch = result.partition.onlyLeft.empty() &&
        result.partition.onlyRight.empty() &&
        result.leftToRight.empty();

#ifdef TRACY_ENABLE
    TracyPlot("Tables Match", result.tablesMatch ? static_cast<int64_t>(1) : static_cast<int64_t>(0));
    TracyPlot("Cell Differences", static_cast<int64_t>(result.leftToRight.size()));
#endif

    return result;
}
