#include "comparison_run.h"
#include "workbook_loader.h"

ComparisonRun runComparison(const ComparisonRequest& request, std::ostream* log) {
    ZoneScoped;
    ZoneName("Comparison Run", 14);

    ComparisonRun run;
    run.request = request;

    if (log) {
        *log << "Comparing files:" << std::endl;
        *log << "  File 1: " << request.file1 << " (sheet: " << request.sheet1 << ")" << std::endl;
        *log << "  File 2: " << request.file2 << " (sheet: " << request.sheet2 << ")" << std::endl;
        *log << "  Key columns: " << ReportBuilder::formatList(request.keyColumns) << std::endl;
        *log << std::endl;
        *log << "Reading files..." << std::endl;
    }

    {
        ZoneScoped;
        ZoneName("Read File 1", 11);
        run.left = WorkbookLoader::loadTable(request.file1, request.sheet1);
    }

    {
        ZoneScoped;
        ZoneName("Read File 2", 11);
        run.right = WorkbookLoader::loadTable(request.file2, request.sheet2);
    }

    if (log) {
        *log << "  File 1: " << run.left.rowCount() << " rows, " << run.left.columnCount() << " columns" << std::endl;
        *log << "  File 2: " << run.right.rowCount() << " rows, " << run.right.columnCount() << " columns" << std::endl;
        *log << std::endl;
        *log << "Finding differences..." << std::endl;
    }

    SheetComparator comparator;
    run.result = comparator.compare(run.left, run.right, request.keyColumns);

    run.leftAnnotated = Annotator::annotate(run.left, Side::Left,
        run.result.partition, run.result.leftToRight, request.keyColumns);
    run.rightAnnotated = Annotator::annotate(run.right, Side::Right,
        run.result.partition, run.result.rightToLeft, request.keyColumns);

    run.report = ReportBuilder::build(run.left, run.right, request.keyColumns, run.result);

    return run;
}
