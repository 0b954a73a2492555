#pragma once

#include "value.h"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct Row {
    std::vector<Value> cells;   // aligned to Table::columns()
    size_t sheetRow = 0;        // 1-based row number in the source sheet
};

// A loaded worksheet: a closed list of column names and the data rows below
// the header. Read-only once built.
class Table {
public:
    Table() = default;
    Table(std::string sheetName,
        std::vector<std::string> columns,
        std::vector<size_t> sheetColumns,
        std::vector<Row> rows);

    const std::string& sheetName() const { return sheetName_; }
    const std::vector<std::string>& columns() const { return columns_; }
    const std::vector<Row>& rows() const { return rows_; }

    size_t rowCount() const { return rows_.size(); }
    size_t columnCount() const { return columns_.size(); }

    std::optional<size_t> columnIndex(const std::string& name) const;
    bool hasColumn(const std::string& name) const;

    // 1-based column number of the column in the source sheet
    size_t sheetColumn(size_t column) const { return sheetColumns_[column]; }

    const Value& value(size_t row, size_t column) const;

private:
    std::string sheetName_;
    std::vector<std::string> columns_;
    std::vector<size_t> sheetColumns_;
    std::vector<Row> rows_;
    std::unordered_map<std::string, size_t> columnLookup_;
};
