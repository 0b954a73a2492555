#pragma once

#include "key.h"
#include "table.h"
#include <string>
#include <unordered_map>
#include <vector>

// A key seen on more than one row of the same table. The first row is the
// one used for matching; later rows are ignored.
struct DuplicateKey {
    Key key;
    size_t keptRow;
    std::vector<size_t> ignoredRows;
};

class RowIndex {
public:
    static RowIndex build(const Table& table,
        const std::vector<std::string>& keyColumns,
        const std::string& tableLabel = "table");

    // Row position for the key, or npos
    size_t find(const Key& key) const;
    bool contains(const Key& key) const { return find(key) != npos; }

    // Distinct keys, in the order they first appear in the table
    const std::vector<Key>& keys() const { return order_; }
    const std::vector<DuplicateKey>& duplicates() const { return duplicates_; }

    size_t size() const { return order_.size(); }

    static constexpr size_t npos = static_cast<size_t>(-1);

private:
    std::unordered_map<Key, size_t, Key::Hash> positions_;
    std::vector<Key> order_;
    std::vector<DuplicateKey> duplicates_;
};
