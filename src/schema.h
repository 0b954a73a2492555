#pragma once

#include "table.h"
#include <string>
#include <vector>

struct SharedColumn {
    std::string name;
    size_t leftIndex;
    size_t rightIndex;
};

// Column-level view of two tables, computed once per comparison.
struct Schema {
    std::vector<SharedColumn> shared;       // left table order
    std::vector<std::string> onlyLeft;      // left table order
    std::vector<std::string> onlyRight;     // right table order

    bool matches() const { return onlyLeft.empty() && onlyRight.empty(); }
};

// Throws MissingColumn when a key column is absent from either table.
Schema reconcileSchema(const Table& left, const Table& right,
    const std::vector<std::string>& keyColumns);
