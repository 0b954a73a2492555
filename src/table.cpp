#include "table.h"
#include <stdexcept>

Table::Table(std::string sheetName,
    std::vector<std::string> columns,
    std::vector<size_t> sheetColumns,
    std::vector<Row> rows)
    : sheetName_(std::move(sheetName)),
      columns_(std::move(columns)),
      sheetColumns_(std::move(sheetColumns)),
      rows_(std::move(rows)) {

    if (sheetColumns_.size() != columns_.size()) {
        throw std::invalid_argument("Column positions do not match column names");
    }

    for (size_t i = 0; i < columns_.size(); ++i) {
        // Loaders make header names unique; keep the first if they did not
        columnLookup_.emplace(columns_[i], i);
    }

    for (auto& row : rows_) {
        row.cells.resize(columns_.size());
    }
}

std::optional<size_t> Table::columnIndex(const std::string& name) const {
    auto it = columnLookup_.find(name);
    if (it == columnLookup_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Table::hasColumn(const std::string& name) const {
    return columnLookup_.count(name) > 0;
}

const Value& Table::value(size_t row, size_t column) const {
    return rows_.at(row).cells.at(column);
}
