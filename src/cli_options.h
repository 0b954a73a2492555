#pragma once

#include <ctime>
#include <ostream>
#include <string>
#include <vector>

struct CliOptions {
    enum class Mode {
        Compare,
        ListSheets,
        ListColumns,
        Help
    };

    Mode mode = Mode::Compare;

    std::string file1;
    std::string file2;
    std::string sheet1 = "Sheet1";
    std::string sheet2 = "Sheet1";
    std::vector<std::string> keys;
    std::string output;         // report file; defaultOutputName() when empty
    std::string markDir;        // annotated copies are written here when set
    bool allSheets = false;
    unsigned int threads = 0;   // 0 = hardware concurrency

    // --list-sheets FILE / --list-columns FILE SHEET
    std::string listFile;
    std::string listSheet;

    // args excludes the program name. Throws UsageError.
    static CliOptions parse(const std::vector<std::string>& args);
    static CliOptions parse(int argc, char* argv[]);

    // compare_result_YYYYmmdd_HHMMSS.log
    static std::string defaultOutputName(std::time_t now);

    static void printUsage(std::ostream& out, const std::string& program);
};
