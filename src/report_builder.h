#pragma once

#include "sheet_comparator.h"
#include "table.h"
#include <ostream>
#include <string>
#include <vector>

struct TableSummary {
    std::string sheet;
    size_t rows = 0;
    size_t columns = 0;
    size_t uniqueRows = 0;
    size_t differingCells = 0;
    size_t duplicateKeys = 0;
};

struct Report {
    std::vector<std::string> keyColumns;
    TableSummary left;
    TableSummary right;
    size_t commonRows = 0;
    size_t differingRows = 0;

    std::vector<std::string> onlyLeftLines;
    std::vector<std::string> onlyRightLines;
    std::vector<std::string> diffLines;
    std::vector<std::string> schemaNotes;
    std::vector<std::string> duplicateNotes;

    void render(std::ostream& out) const;
    std::string toString() const;
};

class ReportBuilder {
public:
    static Report build(const Table& left,
        const Table& right,
        const std::vector<std::string>& keyColumns,
        const SheetComparator::ComparisonResult& result);

    static std::string formatList(const std::vector<std::string>& items);
};
