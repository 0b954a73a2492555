#include "key.h"
#include "errors.h"
#include <wyhash.h>

std::string Key::toString() const {
    const auto& shown = display.size() == parts.size() ? display : parts;

    std::string out;
    for (size_t i = 0; i < shown.size(); ++i) {
        if (i > 0) out += "||";
        out += shown[i];
    }
    return out;
}

size_t Key::Hash::operator()(const Key& key) const {
    uint64_t hash = 0;

    for (const auto& part : key.parts) {
        // Previous hash is used as seed for next part
        hash = wyhash(part.data(), part.size(), hash, _wyp);

        // Delimiter so that ("ab", "c") and ("a", "bc") hash differently
        const char delimiter = '\0';
        hash = wyhash(&delimiter, 1, hash, _wyp);
    }

    return static_cast<size_t>(hash);
}

KeyExtractor::KeyExtractor(const Table& table,
    const std::vector<std::string>& keyColumns,
    const std::string& tableLabel) {

    positions_.reserve(keyColumns.size());
    for (const auto& name : keyColumns) {
        auto index = table.columnIndex(name);
        if (!index) {
            throw MissingColumn(name, tableLabel);
        }
        positions_.push_back(*index);
    }
}

Key KeyExtractor::extract(const Row& row) const {
    Key key;
    key.parts.reserve(positions_.size());
    key.display.reserve(positions_.size());
    for (size_t pos : positions_) {
        key.parts.push_back(row.cells[pos].canonical());
        key.display.push_back(row.cells[pos].toString());
    }
    return key;
}
