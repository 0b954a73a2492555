#include "annotated_writer.h"
#include "batch_runner.h"
#include "cli_options.h"
#include "comparison_run.h"
#include "errors.h"
#include "scoped_work_dir.h"
#include "workbook_loader.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

namespace {

void writeMarkedCopies(const ComparisonRun& run, const std::string& markDir,
    bool sheetInName, const ScopedWorkDir& workDir) {

    const auto& request = run.request;
    auto out1 = std::filesystem::path(markDir) / AnnotatedWriter::markedFileName(
        request.file1, Side::Left, sheetInName ? request.sheet1 : "");
    auto out2 = std::filesystem::path(markDir) / AnnotatedWriter::markedFileName(
        request.file2, Side::Right, sheetInName ? request.sheet2 : "");

    AnnotatedWriter::write(request.file1, run.left, run.leftAnnotated, out1.string(), workDir);
    AnnotatedWriter::write(request.file2, run.right, run.rightAnnotated, out2.string(), workDir);

    std::cout << "Annotated copies:" << std::endl;
    std::cout << "  " << out1.string() << " (" << run.leftAnnotated.rowMarks.size() << " rows, "
        << run.leftAnnotated.cellMarks.size() << " cells marked)" << std::endl;
    std::cout << "  " << out2.string() << " (" << run.rightAnnotated.rowMarks.size() << " rows, "
        << run.rightAnnotated.cellMarks.size() << " cells marked)" << std::endl;
}

int listSheets(const CliOptions& options) {
    for (const auto& name : WorkbookLoader::sheetNames(options.listFile)) {
        std::cout << name << std::endl;
    }
    return 0;
}

int listColumns(const CliOptions& options) {
    for (const auto& name : WorkbookLoader::columnNames(options.listFile, options.listSheet)) {
        std::cout << name << std::endl;
    }
    return 0;
}

int compareFiles(const CliOptions& options) {
    std::string output = options.output.empty()
        ? CliOptions::defaultOutputName(std::time(nullptr))
        : options.output;

    std::vector<ComparisonRequest> requests;
    if (options.allSheets) {
        requests = BatchRunner::sharedSheetRequests(options.file1, options.file2, options.keys);
        if (requests.empty()) {
            throw LoadError("No sheet name is present in both files");
        }
    }
    else {
        ComparisonRequest request;
        request.file1 = options.file1;
        request.file2 = options.file2;
        request.sheet1 = options.sheet1;
        request.sheet2 = options.sheet2;
        request.keyColumns = options.keys;
        requests.push_back(std::move(request));
    }

    std::vector<BatchRunner::JobOutcome> outcomes;
    if (requests.size() == 1) {
        // A single comparison reports progress and fails the whole command
        BatchRunner::JobOutcome outcome;
        outcome.run = std::make_unique<ComparisonRun>(runComparison(requests.front(), &std::cout));
        outcome.ok = true;
        outcomes.push_back(std::move(outcome));
    }
    else {
        BatchRunner runner(options.threads);
        outcomes = runner.run(requests);
    }

    std::ofstream file(output);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open output file: " + output);
    }

    int exitCode = 0;
    std::unique_ptr<ScopedWorkDir> workDir;
    if (!options.markDir.empty()) {
        workDir = std::make_unique<ScopedWorkDir>();
    }

    for (size_t i = 0; i < outcomes.size(); ++i) {
        const auto& outcome = outcomes[i];
        if (!outcome.ok) {
            std::cerr << "Error comparing sheet " << requests[i].sheet1 << ": " << outcome.error << std::endl;
            file << "Error comparing sheet " << requests[i].sheet1 << ": " << outcome.error << "\n";
            exitCode = 1;
            continue;
        }

        std::cout << std::endl;
        outcome.run->report.render(std::cout);
        outcome.run->report.render(file);

        if (workDir) {
            writeMarkedCopies(*outcome.run, options.markDir, options.allSheets, *workDir);
        }
    }

    file.close();
    if (!file) {
        throw std::runtime_error("Could not write output file: " + output);
    }

    std::cout << std::endl;
    std::cout << "Report saved to: " << output << std::endl;
    return exitCode;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = CliOptions::parse(argc, argv);
    }
    catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << std::endl;
        CliOptions::printUsage(std::cerr, argv[0]);
        return 2;
    }

    try {
        switch (options.mode) {
        case CliOptions::Mode::Help:
            CliOptions::printUsage(std::cout, argv[0]);
            return 0;
        case CliOptions::Mode::ListSheets:
            return listSheets(options);
        case CliOptions::Mode::ListColumns:
            return listColumns(options);
        default:
            return compareFiles(options);
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
