#pragma once

#include "annotator.h"
#include "report_builder.h"
#include "sheet_comparator.h"
#include "table.h"
#include <ostream>
#include <string>
#include <vector>

struct ComparisonRequest {
    std::string file1;
    std::string file2;
    std::string sheet1 = "Sheet1";
    std::string sheet2 = "Sheet1";
    std::vector<std::string> keyColumns;
};

// Everything one comparison produced. Owns its tables; the annotations and
// the result refer to rows by position only.
struct ComparisonRun {
    ComparisonRequest request;
    Table left;
    Table right;
    SheetComparator::ComparisonResult result;
    AnnotatedTable leftAnnotated;
    AnnotatedTable rightAnnotated;
    Report report;
};

// LOAD -> INDEX/PARTITION -> DIFF/ANNOTATE/REPORT. Throws LoadError or
// MissingColumn; no partial run is returned. Progress goes to log if set.
ComparisonRun runComparison(const ComparisonRequest& request, std::ostream* log = nullptr);
