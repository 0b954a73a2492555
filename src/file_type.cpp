#include "file_type.h"
#include <algorithm>
#include <cctype>
#include <fstream>

FileType FileTypeDetector::detect(const std::string& filename) {
    FileType type = detectByExtension(filename);
    if (type != FileType::UNKNOWN) {
        return type;
    }

    return detectByContent(filename);
}

FileType FileTypeDetector::detectByExtension(const std::string& filename) {
    if (endsWith(filename, ".csv") || endsWith(filename, ".txt")) {
        return FileType::CSV;
    }
    if (endsWith(filename, ".xlsx") || endsWith(filename, ".xlsm")) {
        return FileType::XLSX;
    }
    return FileType::UNKNOWN;
}

// Upload temp files often have no extension. A ZIP container is taken as
// a workbook, printable text as csv, anything else is rejected.
FileType FileTypeDetector::detectByContent(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        return FileType::UNKNOWN;
    }

    char buffer[512] = { 0 };
    file.read(buffer, sizeof(buffer));
    std::streamsize got = file.gcount();
    if (got == 0) {
        return FileType::UNKNOWN;
    }

    // XLSX is a ZIP file with magic bytes: 0x50 0x4B 0x03 0x04 (PK..)
    if (got >= 4 && buffer[0] == 0x50 && buffer[1] == 0x4B &&
        buffer[2] == 0x03 && buffer[3] == 0x04) {
        return FileType::XLSX;
    }

    bool binary = std::any_of(buffer, buffer + got, [](char c) { return c == '\0'; });
    return binary ? FileType::UNKNOWN : FileType::CSV;
}

bool FileTypeDetector::endsWith(const std::string& str, const std::string& suffix) {
    if (str.length() < suffix.length()) {
        return false;
    }

    return std::equal(
        suffix.rbegin(),
        suffix.rend(),
        str.rbegin(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                std::tolower(static_cast<unsigned char>(b));
        }
    );
}

std::string FileTypeDetector::toString(FileType type) {
    switch (type) {
    case FileType::CSV:  return "CSV";
    case FileType::XLSX: return "XLSX";
    default:             return "UNKNOWN";
    }
}
