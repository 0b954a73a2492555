#include "csv_parser.h"
#include "errors.h"

namespace {

std::string_view trimBlanks(std::string_view s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    return s.substr(first, s.find_last_not_of(" \t") - first + 1);
}

// Text from pos up to the next delimiter (or the end).
std::string_view untilDelimiter(std::string_view text, size_t pos, char delimiter) {
    size_t end = text.find(delimiter, pos);
    return text.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos);
}

} // namespace

CSVParser::CSVParser(std::istream& in, char delimiter)
    : in_(in), delimiter_(delimiter) {}

bool CSVParser::next(std::vector<std::string>& fields) {
    std::string raw;

    while (std::getline(in_, raw)) {
        std::string_view line = cleanLine(raw, lineNumber_ == 0);
        ++lineNumber_;
        if (line.empty()) continue;

        recordLine_ = lineNumber_;
        if (delimiter_ == '\0') {
            delimiter_ = detectDelimiter(line);
        }

        std::string record(line);
        while (!splitRecord(record, delimiter_, fields)) {
            if (!std::getline(in_, raw)) {
                throw LoadError("Unterminated quoted field starting on line " + std::to_string(recordLine_));
            }
            ++lineNumber_;
            record += '\n';
            record += cleanLine(raw, false);
        }
        return true;
    }

    return false;
}

char CSVParser::detectDelimiter(std::string_view line) {
    size_t commas = 0, semicolons = 0, tabs = 0;
    bool inQuotes = false;

    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (inQuotes) continue;

        if (c == ',') ++commas;
        else if (c == ';') ++semicolons;
        else if (c == '\t') ++tabs;
    }

    if (semicolons > commas && semicolons >= tabs) return ';';
    if (tabs > commas && tabs > semicolons) return '\t';
    return ',';
}

bool CSVParser::splitRecord(std::string_view text, char delimiter, std::vector<std::string>& fields) {
    fields.clear();
    size_t pos = 0;

    while (true) {
        while (pos < text.size() && text[pos] != delimiter && (text[pos] == ' ' || text[pos] == '\t')) {
            ++pos;
        }

        std::string field;
        if (pos < text.size() && text[pos] == '"') {
            bool closed = false;
            for (++pos; pos < text.size(); ++pos) {
                if (text[pos] != '"') {
                    field.push_back(text[pos]);
                }
                else if (pos + 1 < text.size() && text[pos + 1] == '"') {
                    field.push_back('"');
                    ++pos;
                }
                else {
                    closed = true;
                    ++pos;
                    break;
                }
            }
            if (!closed) {
                return false;
            }

            // Stray text between the closing quote and the delimiter is kept
            std::string_view rest = untilDelimiter(text, pos, delimiter);
            field += trimBlanks(rest);
            pos += rest.size();
        }
        else {
            std::string_view rest = untilDelimiter(text, pos, delimiter);
            field = std::string(trimBlanks(rest));
            pos += rest.size();
        }

        fields.push_back(std::move(field));
        if (pos >= text.size()) {
            return true;
        }
        ++pos;  // delimiter
    }
}

std::string_view CSVParser::cleanLine(std::string_view line, bool firstLine) {
    if (firstLine && line.size() >= 3 &&
        static_cast<unsigned char>(line[0]) == 0xEF &&
        static_cast<unsigned char>(line[1]) == 0xBB &&
        static_cast<unsigned char>(line[2]) == 0xBF) {
        line.remove_prefix(3);
    }
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}
