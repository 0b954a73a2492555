#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <vector>

// Reads csv records from a stream. A quoted field may span several lines;
// unquoted fields are trimmed and "" inside quotes is a literal quote.
class CSVParser {
public:
    // A zero delimiter is detected from the first record.
    explicit CSVParser(std::istream& in, char delimiter = '\0');

    // Reads the next record, skipping blank lines. Returns false at end of
    // input; throws LoadError on a quoted field that is never closed.
    bool next(std::vector<std::string>& fields);

    char delimiter() const { return delimiter_; }

    // Physical line (1-based) the last record started on.
    size_t recordLine() const { return recordLine_; }

    // Most frequent of ',', ';' and tab outside quotes; ',' when none occur.
    static char detectDelimiter(std::string_view line);

    // Splits text into fields. Returns false if a quoted field is still open.
    static bool splitRecord(std::string_view text, char delimiter, std::vector<std::string>& fields);

    // Drops a trailing '\r' and a leading UTF-8 byte order mark.
    static std::string_view cleanLine(std::string_view line, bool firstLine);

private:
    std::istream& in_;
    char delimiter_;
    size_t lineNumber_ = 0;
    size_t recordLine_ = 0;
};
