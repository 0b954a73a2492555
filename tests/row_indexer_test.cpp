#include <gtest/gtest.h>
#include "errors.h"
#include "key.h"
#include "row_indexer.h"
#include "test_tables.h"

TEST(KeyTest, ExtractsKeyColumnsInGivenOrder) {
    Table table = makeTable({ "id", "region", "name" }, {
        { num(7), txt("north"), txt("Ann") },
    });

    KeyExtractor extractor(table, { "region", "id" });
    Key key = extractor.extract(table.rows()[0]);

    ASSERT_EQ(key.parts.size(), 2);
    EXPECT_EQ(key.parts[0], "north");
    EXPECT_EQ(key.parts[1], "7");
    EXPECT_EQ(key.toString(), "north||7");
}

TEST(KeyTest, MissingKeyColumnThrows) {
    Table table = makeTable({ "id" }, { { num(1) } });

    EXPECT_THROW({ KeyExtractor extractor(table, { "code" }); }, MissingColumn);

    try {
        KeyExtractor extractor(table, { "id", "code" }, "file 2");
        FAIL() << "Expected MissingColumn";
    }
    catch (const MissingColumn& e) {
        EXPECT_EQ(e.column(), "code");
        EXPECT_NE(std::string(e.what()).find("file 2"), std::string::npos);
    }
}

TEST(KeyTest, HashSeparatesParts) {
    Key::Hash hasher;
    Key a{ { "ab", "c" } };
    Key b{ { "a", "bc" } };
    Key c{ { "ab", "c" } };

    EXPECT_EQ(hasher(a), hasher(c));
    EXPECT_NE(hasher(a), hasher(b));
    EXPECT_NE(a, b);
}

TEST(KeyTest, NormalizedValuesGiveEqualKeys) {
    Table left = makeTable({ "id" }, { { num(1) } });
    Table right = makeTable({ "id" }, { { txt(" 1 ") } });

    Key k1 = KeyExtractor(left, { "id" }).extract(left.rows()[0]);
    Key k2 = KeyExtractor(right, { "id" }).extract(right.rows()[0]);

    EXPECT_EQ(k1, k2);
    EXPECT_EQ(Key::Hash()(k1), Key::Hash()(k2));
}

TEST(KeyTest, DisplaysCellsAsWritten) {
    Table table = makeTable({ "code", "id" }, {
        { txt("007"), num(1) },
    });

    Key key = KeyExtractor(table, { "code", "id" }).extract(table.rows()[0]);

    EXPECT_EQ(key.parts[0], "7");
    EXPECT_EQ(key.toString(), "007||1");
    EXPECT_EQ(key, (Key{ { "7", "1" } }));
}

TEST(RowIndexTest, KeysInFirstAppearanceOrder) {
    Table table = makeTable({ "id", "v" }, {
        { num(3), txt("c") },
        { num(1), txt("a") },
        { num(2), txt("b") },
    });

    RowIndex index = RowIndex::build(table, { "id" });

    ASSERT_EQ(index.size(), 3);
    EXPECT_EQ(index.keys()[0].toString(), "3");
    EXPECT_EQ(index.keys()[1].toString(), "1");
    EXPECT_EQ(index.keys()[2].toString(), "2");
    EXPECT_EQ(index.find(Key{ { "1" } }), 1);
    EXPECT_EQ(index.find(Key{ { "9" } }), RowIndex::npos);
    EXPECT_TRUE(index.duplicates().empty());
}

TEST(RowIndexTest, DuplicateKeyFirstRowWins) {
    Table table = makeTable({ "id", "v" }, {
        { num(1), txt("x") },
        { num(1), txt("y") },
        { num(2), txt("z") },
        { num(1), txt("w") },
    });

    RowIndex index = RowIndex::build(table, { "id" });

    EXPECT_EQ(index.size(), 2);
    EXPECT_EQ(index.find(Key{ { "1" } }), 0);

    ASSERT_EQ(index.duplicates().size(), 1);
    const auto& dup = index.duplicates()[0];
    EXPECT_EQ(dup.key.toString(), "1");
    EXPECT_EQ(dup.keptRow, 0);
    ASSERT_EQ(dup.ignoredRows.size(), 2);
    EXPECT_EQ(dup.ignoredRows[0], 1);
    EXPECT_EQ(dup.ignoredRows[1], 3);
}

TEST(RowIndexTest, CompositeKeyDistinguishesRows) {
    Table table = makeTable({ "a", "b" }, {
        { txt("x"), num(1) },
        { txt("x"), num(2) },
        { txt("y"), num(1) },
    });

    RowIndex index = RowIndex::build(table, { "a", "b" });

    EXPECT_EQ(index.size(), 3);
    EXPECT_TRUE(index.duplicates().empty());
}

TEST(RowIndexTest, LongDigitIdsStayDistinct) {
    Table table = makeTable({ "id", "v" }, {
        { txt("9007199254740993"), txt("a") },
        { txt("9007199254740992"), txt("b") },
    });

    RowIndex index = RowIndex::build(table, { "id" });

    EXPECT_EQ(index.size(), 2);
    EXPECT_TRUE(index.duplicates().empty());
    EXPECT_EQ(index.keys()[0].toString(), "9007199254740993");
    EXPECT_EQ(index.keys()[1].toString(), "9007199254740992");
}

TEST(RowIndexTest, DuplicateKeyShowsKeptRow) {
    Table table = makeTable({ "id" }, {
        { txt("007") },
        { num(7) },
    });

    RowIndex index = RowIndex::build(table, { "id" });

    ASSERT_EQ(index.duplicates().size(), 1);
    EXPECT_EQ(index.duplicates()[0].key.toString(), "007");
    EXPECT_EQ(index.duplicates()[0].ignoredRows[0], 1);
}

TEST(RowIndexTest, EmptyTable) {
    Table table = makeTable({ "id" }, {});
    RowIndex index = RowIndex::build(table, { "id" });

    EXPECT_EQ(index.size(), 0);
    EXPECT_TRUE(index.keys().empty());
}
