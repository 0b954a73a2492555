#include <gtest/gtest.h>
#include "annotator.h"
#include "sheet_comparator.h"
#include "test_tables.h"

class AnnotatorTest : public ::testing::Test {
protected:
    Table left = makeTable({ "name", "id" }, {
        { txt("Ann"), num(1) },
        { txt("Bob"), num(2) },
    });
    Table right = makeTable({ "id", "name" }, {
        { num(3), txt("Cid") },
        { num(1), txt("Anne") },
    });

    SheetComparator::ComparisonResult result;

    void SetUp() override {
        SheetComparator comparator;
        result = comparator.compare(left, right, { "id" });
    }
};

TEST_F(AnnotatorTest, MarksUniqueRowsOfItsOwnSide) {
    auto annotated = Annotator::annotate(left, Side::Left,
        result.partition, result.leftToRight, { "id" });

    ASSERT_EQ(annotated.rowMarks.size(), 1);
    const auto& mark = annotated.rowMarks[0];
    EXPECT_EQ(mark.row, 1);
    EXPECT_EQ(mark.sheetRow, 3);
    EXPECT_EQ(mark.noteColumn, 1) << "note goes on the first key column";
    EXPECT_EQ(mark.note, Annotator::UNIQUE_ROW_NOTE);

    auto rightAnnotated = Annotator::annotate(right, Side::Right,
        result.partition, result.rightToLeft, { "id" });

    ASSERT_EQ(rightAnnotated.rowMarks.size(), 1);
    EXPECT_EQ(rightAnnotated.rowMarks[0].row, 0);
    EXPECT_EQ(rightAnnotated.rowMarks[0].noteColumn, 0);
}

TEST_F(AnnotatorTest, MarksChangedCellsWithCounterpartValue) {
    auto annotated = Annotator::annotate(left, Side::Left,
        result.partition, result.leftToRight, { "id" });

    ASSERT_EQ(annotated.cellMarks.size(), 1);
    const auto& mark = annotated.cellMarks[0];
    EXPECT_EQ(mark.row, 0);
    EXPECT_EQ(mark.column, 0);
    EXPECT_EQ(mark.sheetRow, 2);
    EXPECT_EQ(mark.sheetColumn, 1);
    EXPECT_EQ(mark.note, "Differs from file 2 row 3 [name]\nfile 2 value: Anne");

    auto rightAnnotated = Annotator::annotate(right, Side::Right,
        result.partition, result.rightToLeft, { "id" });

    ASSERT_EQ(rightAnnotated.cellMarks.size(), 1);
    EXPECT_EQ(rightAnnotated.cellMarks[0].sheetRow, 3);
    EXPECT_EQ(rightAnnotated.cellMarks[0].sheetColumn, 2);
    EXPECT_EQ(rightAnnotated.cellMarks[0].note, "Differs from file 1 row 2 [name]\nfile 1 value: Ann");
}

TEST_F(AnnotatorTest, LeavesUnchangedCellsUnmarked) {
    auto annotated = Annotator::annotate(left, Side::Left,
        result.partition, result.leftToRight, { "id" });

    EXPECT_EQ(annotated.findRowMark(0), nullptr);
    EXPECT_EQ(annotated.findCellMark(0, 1), nullptr);
    EXPECT_NE(annotated.findCellMark(0, 0), nullptr);
    EXPECT_NE(annotated.findRowMark(1), nullptr);
}

TEST_F(AnnotatorTest, DoesNotTouchValues) {
    auto before = left.rows()[0].cells[0].toString();

    auto annotated = Annotator::annotate(left, Side::Left,
        result.partition, result.leftToRight, { "id" });

    EXPECT_FALSE(annotated.empty());
    EXPECT_EQ(left.rows()[0].cells[0].toString(), before);
    EXPECT_EQ(left.value(1, 0).toString(), "Bob");
}

TEST_F(AnnotatorTest, IdenticalTablesGiveEmptyOverlay) {
    SheetComparator comparator;
    auto same = comparator.compare(left, left, { "id" });

    auto annotated = Annotator::annotate(left, Side::Left, same.partition, same.leftToRight, { "id" });
    EXPECT_TRUE(annotated.empty());
}

TEST_F(AnnotatorTest, RejectsDiffsForAnotherTable) {
    Table small = makeTable({ "id" }, { { num(1) } });
    EXPECT_THROW(Annotator::annotate(small, Side::Left, result.partition, result.leftToRight, { "id" }),
        std::out_of_range);
}
