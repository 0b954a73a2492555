#pragma once

#include <stdexcept>
#include <string>

// A file could not be read as tabular data, or a named sheet is missing.
class LoadError : public std::runtime_error {
public:
    explicit LoadError(const std::string& message)
        : std::runtime_error(message) {}
};

// A key column is absent from one of the tables.
class MissingColumn : public std::runtime_error {
public:
    MissingColumn(const std::string& column, const std::string& tableLabel)
        : std::runtime_error("Column not found in " + tableLabel + ": " + column),
          column_(column) {}

    const std::string& column() const { return column_; }

private:
    std::string column_;
};

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message) {}
};
