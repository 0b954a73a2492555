#include "row_indexer.h"

RowIndex RowIndex::build(const Table& table,
    const std::vector<std::string>& keyColumns,
    const std::string& tableLabel) {

    KeyExtractor extractor(table, keyColumns, tableLabel);

    RowIndex index;
    index.positions_.reserve(table.rowCount());
    index.order_.reserve(table.rowCount());

    // key -> slot in duplicates_
    std::unordered_map<Key, size_t, Key::Hash> duplicateSlots;

    const auto& rows = table.rows();
    for (size_t i = 0; i < rows.size(); ++i) {
        Key key = extractor.extract(rows[i]);

        auto [it, inserted] = index.positions_.emplace(key, i);
        if (inserted) {
            index.order_.push_back(std::move(key));
            continue;
        }

        auto slot = duplicateSlots.find(key);
        if (slot == duplicateSlots.end()) {
            duplicateSlots.emplace(key, index.duplicates_.size());
            index.duplicates_.push_back(DuplicateKey{ it->first, it->second, { i } });
        }
        else {
            index.duplicates_[slot->second].ignoredRows.push_back(i);
        }
    }

    return index;
}

size_t RowIndex::find(const Key& key) const {
    auto it = positions_.find(key);
    return it == positions_.end() ? npos : it->second;
}
