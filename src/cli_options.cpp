#include "cli_options.h"
#include "errors.h"
#include <iomanip>
#include <sstream>

namespace {

bool isOption(const std::string& arg) {
    return arg.size() > 2 && arg.compare(0, 2, "--") == 0;
}

const std::string& requireValue(const std::vector<std::string>& args, size_t& i) {
    const std::string& option = args[i];
    if (i + 1 >= args.size() || isOption(args[i + 1])) {
        throw UsageError("Option " + option + " requires a value");
    }
    return args[++i];
}

} // namespace

CliOptions CliOptions::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

CliOptions CliOptions::parse(const std::vector<std::string>& args) {
    CliOptions options;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.mode = Mode::Help;
            return options;
        }
        else if (arg == "--keys") {
            while (i + 1 < args.size() && !isOption(args[i + 1])) {
                options.keys.push_back(args[++i]);
            }
            if (options.keys.empty()) {
                throw UsageError("Option --keys requires at least one column name");
            }
        }
        else if (arg == "--sheet1") {
            options.sheet1 = requireValue(args, i);
        }
        else if (arg == "--sheet2") {
            options.sheet2 = requireValue(args, i);
        }
        else if (arg == "--output") {
            options.output = requireValue(args, i);
        }
        else if (arg == "--mark-dir") {
            options.markDir = requireValue(args, i);
        }
        else if (arg == "--all-sheets") {
            options.allSheets = true;
        }
        else if (arg == "--threads") {
            const std::string& value = requireValue(args, i);
            try {
                size_t pos = 0;
                long n = std::stol(value, &pos);
                if (pos != value.size() || n < 1) {
                    throw UsageError("Option --threads expects a positive number: " + value);
                }
                options.threads = static_cast<unsigned int>(n);
            }
            catch (const std::logic_error&) {
                throw UsageError("Option --threads expects a positive number: " + value);
            }
        }
        else if (arg == "--list-sheets") {
            options.mode = Mode::ListSheets;
            options.listFile = requireValue(args, i);
        }
        else if (arg == "--list-columns") {
            options.mode = Mode::ListColumns;
            options.listFile = requireValue(args, i);
            options.listSheet = requireValue(args, i);
        }
        else if (isOption(arg)) {
            throw UsageError("Unknown option: " + arg);
        }
        else {
            positional.push_back(arg);
        }
    }

    if (options.mode != Mode::Compare) {
        if (!positional.empty()) {
            throw UsageError("Unexpected argument: " + positional.front());
        }
        return options;
    }

    if (positional.size() != 2) {
        throw UsageError("Expected two input files, got " + std::to_string(positional.size()));
    }
    if (options.keys.empty()) {
        throw UsageError("Missing required option --keys");
    }

    options.file1 = positional[0];
    options.file2 = positional[1];
    return options;
}

std::string CliOptions::defaultOutputName(std::time_t now) {
    std::tm local = *std::localtime(&now);
    std::ostringstream oss;
    oss << "compare_result_" << std::put_time(&local, "%Y%m%d_%H%M%S") << ".log";
    return oss.str();
}

void CliOptions::printUsage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " <file1> <file2> --keys <column> [<column>...] [options]" << std::endl;
    out << "       " << program << " --list-sheets <file>" << std::endl;
    out << "       " << program << " --list-columns <file> <sheet>" << std::endl;
    out << std::endl;
    out << "Sheet Comparator - key-based comparison of two worksheets" << std::endl;
    out << "Matches rows by a composite key and reports added rows and changed cells." << std::endl;
    out << std::endl;
    out << "Options:" << std::endl;
    out << "  --keys <col>...     Key columns, in order (required)" << std::endl;
    out << "  --sheet1 <name>     Sheet of file 1 (default: Sheet1)" << std::endl;
    out << "  --sheet2 <name>     Sheet of file 2 (default: Sheet1)" << std::endl;
    out << "  --output <path>     Report file (default: compare_result_<timestamp>.log)" << std::endl;
    out << "  --mark-dir <dir>    Write annotated copies of both sheets to <dir>" << std::endl;
    out << "  --all-sheets        Compare every sheet present in both files" << std::endl;
    out << "  --threads <n>       Worker threads for --all-sheets" << std::endl;
    out << std::endl;
    out << "Supported formats:" << std::endl;
    out << "  - XLSX (.xlsx, .xlsm)" << std::endl;
    out << "  - CSV  (.csv), read as a single sheet named Sheet1" << std::endl;
    out << std::endl;
    out << "Examples:" << std::endl;
    out << "  " << program << " old.xlsx new.xlsx --keys id" << std::endl;
    out << "  " << program << " a.xlsx b.xlsx --keys region code --sheet1 Q1 --sheet2 Q1 --mark-dir out" << std::endl;
    out << "  " << program << " export.csv backup.xlsx --keys id --output diff.log" << std::endl;
}
