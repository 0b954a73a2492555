#pragma once

#include "annotator.h"
#include "scoped_work_dir.h"
#include "table.h"
#include <string>

// Saves an AnnotatedTable as an .xlsx copy of its source sheet.
class AnnotatedWriter {
public:
    static constexpr const char* AUTHOR = "sheet_comparator";
    static constexpr const char* UNIQUE_ROW_FILL = "FF90EE90";
    static constexpr const char* DIFF_CELL_FILL = "FFFFFF00";
    static constexpr const char* DIFF_CELL_FONT = "FFFF0000";

    // The file is built inside workDir and moved to outputPath once saved.
    static void write(const std::string& sourcePath,
        const Table& table,
        const AnnotatedTable& annotated,
        const std::string& outputPath,
        const ScopedWorkDir& workDir);

    // <stem>[_<sheet>]_file1_marked.xlsx
    static std::string markedFileName(const std::string& sourcePath, Side side,
        const std::string& sheet = "");
};
