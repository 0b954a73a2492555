#include "value.h"
#include <charconv>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace {

std::string_view trimWhitespace(std::string_view s) {
    const char* ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// Parses the whole of s as a finite decimal number.
bool parseNumber(std::string_view s, double& out) {
    if (s.empty()) return false;

    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size() && std::isfinite(out);
}

// Digits a double holds exactly
constexpr size_t MAX_EXACT_DIGITS = 15;

// Significant digits in the mantissa of a decimal string ("0.0120e3" -> 2).
size_t significantDigits(std::string_view s) {
    std::string_view mantissa = s.substr(0, s.find_first_of("eE"));
    if (!mantissa.empty() && mantissa.front() == '-') {
        mantissa.remove_prefix(1);
    }
    if (mantissa.find('.') != std::string_view::npos) {
        mantissa = mantissa.substr(0, mantissa.find_last_not_of('0') + 1);
    }

    size_t count = 0;
    bool leading = true;
    for (char c : mantissa) {
        if (c == '.') continue;
        if (leading && c == '0') continue;
        leading = false;
        ++count;
    }
    return count;
}

std::string stripTrailingZeros(std::string value) {
    if (value.find('.') == std::string::npos) {
        return value;
    }
    value.erase(value.find_last_not_of('0') + 1);
    if (value.back() == '.') {
        value.pop_back();
    }
    return value;
}

} // namespace

Value Value::null() {
    return Value();
}

Value Value::boolean(bool b) {
    Value v;
    v.data_ = b;
    return v;
}

Value Value::number(double d) {
    Value v;
    v.data_ = d;
    return v;
}

Value Value::text(std::string s) {
    Value v;
    v.data_ = std::move(s);
    return v;
}

Value::Kind Value::kind() const {
    switch (data_.index()) {
    case 1:  return Kind::Boolean;
    case 2:  return Kind::Number;
    case 3:  return Kind::Text;
    default: return Kind::Null;
    }
}

bool Value::asBool() const {
    return std::get<bool>(data_);
}

double Value::asNumber() const {
    return std::get<double>(data_);
}

const std::string& Value::asText() const {
    return std::get<std::string>(data_);
}

std::string Value::toString() const {
    switch (kind()) {
    case Kind::Boolean: return asBool() ? "true" : "false";
    case Kind::Number:  return displayNumber(asNumber());
    case Kind::Text:    return asText();
    default:            return "";
    }
}

std::string Value::canonical() const {
    switch (kind()) {
    case Kind::Boolean:
        return asBool() ? "true" : "false";

    case Kind::Number:
        return canonicalNumber(asNumber());

    case Kind::Text: {
        std::string_view trimmed = trimWhitespace(asText());
        // Long digit strings (account numbers, ids) stay text
        double d;
        if (significantDigits(trimmed) <= MAX_EXACT_DIGITS && parseNumber(trimmed, d)) {
            return canonicalNumber(d);
        }
        return std::string(trimmed);
    }

    default:
        return "";
    }
}

bool Value::compareValues(const Value& v1, const Value& v2) {
    return v1.canonical() == v2.canonical();
}

// Numbers compare equal when they agree to 4 decimal places.
std::string Value::canonicalNumber(double d) {
    double rounded = std::abs(d) < 1e15 ? std::round(d * 10000.0) / 10000.0 : d;
    if (rounded == 0.0) {
        rounded = 0.0;  // folds -0
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << rounded;
    return stripTrailingZeros(oss.str());
}

std::string Value::displayNumber(double d) {
    // Check if it's actually an integer
    if (d == std::floor(d) && std::abs(d) < 1e15) {
        return std::to_string(static_cast<long long>(d));
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(10) << d;
    return stripTrailingZeros(oss.str());
}
