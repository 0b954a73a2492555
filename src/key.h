#pragma once

#include "table.h"
#include <string>
#include <vector>

// Composite matching key: the canonical values of the key columns, in
// key-column order. Only parts take part in equality and hashing; display
// holds the cells as written, for reports.
struct Key {
    std::vector<std::string> parts;
    std::vector<std::string> display;

    bool operator==(const Key& other) const { return parts == other.parts; }
    bool operator!=(const Key& other) const { return !(*this == other); }

    std::string toString() const;

    struct Hash {
        size_t operator()(const Key& key) const;
    };
};

class KeyExtractor {
public:
    // Throws MissingColumn if any key column is not in the table.
    KeyExtractor(const Table& table,
        const std::vector<std::string>& keyColumns,
        const std::string& tableLabel = "table");

    Key extract(const Row& row) const;

private:
    std::vector<size_t> positions_;
};
