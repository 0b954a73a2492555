#include "schema.h"
#include "errors.h"

Schema reconcileSchema(const Table& left, const Table& right,
    const std::vector<std::string>& keyColumns) {

    for (const auto& key : keyColumns) {
        if (!left.hasColumn(key)) {
            throw MissingColumn(key, "file 1");
        }
        if (!right.hasColumn(key)) {
            throw MissingColumn(key, "file 2");
        }
    }

    Schema schema;

    const auto& leftColumns = left.columns();
    for (size_t i = 0; i < leftColumns.size(); ++i) {
        auto rightIndex = right.columnIndex(leftColumns[i]);
        if (rightIndex) {
            schema.shared.push_back(SharedColumn{ leftColumns[i], i, *rightIndex });
        }
        else {
            schema.onlyLeft.push_back(leftColumns[i]);
        }
    }

    for (const auto& column : right.columns()) {
        if (!left.hasColumn(column)) {
            schema.onlyRight.push_back(column);
        }
    }

    return schema;
}
