#pragma once

#include <string>
#include <string_view>
#include <variant>

// A single cell value as read from a worksheet or csv field.
class Value {
public:
    enum class Kind {
        Null,
        Boolean,
        Number,
        Text
    };

    Value() = default;

    static Value null();
    static Value boolean(bool b);
    static Value number(double d);
    static Value text(std::string s);

    Kind kind() const;
    bool isNull() const { return kind() == Kind::Null; }

    bool asBool() const;
    double asNumber() const;
    const std::string& asText() const;

    // Display form, used in reports and comments.
    std::string toString() const;

    // Canonical form. Two values are equal for comparison purposes
    // if and only if their canonical forms are equal.
    std::string canonical() const;

    static bool compareValues(const Value& v1, const Value& v2);
    static std::string canonicalNumber(double d);
    static std::string displayNumber(double d);

private:
    std::variant<std::monostate, bool, double, std::string> data_;
};
