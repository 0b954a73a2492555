#pragma once

#include "key.h"
#include "row_indexer.h"
#include "schema.h"
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

enum class Side {
    Left,
    Right
};

struct KeyedRows {
    Key key;
    size_t leftRow;     // RowIndex::npos when absent
    size_t rightRow;    // RowIndex::npos when absent
};

struct PartitionResult {
    std::vector<KeyedRows> onlyLeft;    // left table order
    std::vector<KeyedRows> onlyRight;   // right table order
    std::vector<KeyedRows> common;      // left table order
};

// One differing value. "this" is the table being annotated, "other" is the
// counterpart table.
struct CellDiff {
    Key key;
    std::string column;
    size_t thisRow;
    size_t otherRow;
    size_t thisColumn;
    size_t otherColumn;
    size_t thisSheetRow;
    size_t otherSheetRow;
    Value thisValue;
    Value otherValue;
};

class SheetComparator {
public:
    SheetComparator() = default;
    ~SheetComparator() = default;

    struct ComparisonResult {
        bool tablesMatch = false;
        size_t leftRowCount = 0;
        size_t rightRowCount = 0;
        Schema schema;
        PartitionResult partition;
        std::vector<CellDiff> leftToRight;  // left row order, "this" = left
        std::vector<CellDiff> rightToLeft;  // right row order, "this" = right
        std::vector<DuplicateKey> leftDuplicates;
        std::vector<DuplicateKey> rightDuplicates;
    };

    ComparisonResult compare(const Table& left, const Table& right,
        const std::vector<std::string>& keyColumns);

    static PartitionResult partition(const RowIndex& left, const RowIndex& right);

    // Differences between two rows over the shared columns, "this" = left.
    static std::vector<CellDiff> diffRows(const Table& left, const Table& right,
        const Schema& schema, const KeyedRows& rows);

    // Same differences seen from the right table
    static std::vector<CellDiff> mirror(const std::vector<CellDiff>& diffs);
};
