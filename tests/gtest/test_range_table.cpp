// =============================================================================
// Range Table Tests
// =============================================================================

#include <gtest/gtest.h>
#include "cellwidth/error.hpp"
#include "cellwidth/range_table.hpp"
#include <algorithm>
#include <vector>

using namespace cellwidth;

class RangeTableTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    const BuiltinTableStore& store = BuiltinTableStore::instance();
};

TEST_F(RangeTableTest, SingleRange) {
    const CodepointRange one[] = {{10, 20}};
    RangeTable table(one);

    EXPECT_EQ(range_contains(9, table), 0);
    EXPECT_EQ(range_contains(10, table), 1);
    EXPECT_EQ(range_contains(15, table), 1);
    EXPECT_EQ(range_contains(20, table), 1);
    EXPECT_EQ(range_contains(21, table), 0);
}

TEST_F(RangeTableTest, GapsBetweenRanges) {
    const CodepointRange ranges[] = {{1, 2}, {5, 5}, {8, 10}, {100, 200}, {1000, 1000}};
    RangeTable table(ranges);

    std::vector<uint32_t> inside = {1, 2, 5, 8, 9, 10, 100, 150, 200, 1000};
    std::vector<uint32_t> outside = {0, 3, 4, 6, 7, 11, 99, 201, 999, 1001, 0x10FFFF};

    for (uint32_t cp : inside) {
        EXPECT_EQ(range_contains(cp, table), 1) << "expected " << cp << " inside";
    }
    for (uint32_t cp : outside) {
        EXPECT_EQ(range_contains(cp, table), 0) << "expected " << cp << " outside";
    }
}

TEST_F(RangeTableTest, EmptyTableFindsNothing) {
    EXPECT_EQ(range_contains(0, RangeTable{}), 0);
    EXPECT_EQ(range_contains(0x4E00, RangeTable{}), 0);
}

// Binary search only works if every shipped table is sorted and disjoint
TEST_F(RangeTableTest, BuiltinTablesSortedAndDisjoint) {
    for (const auto& version : store.versions()) {
        for (TableName name : {TableName::Wide, TableName::ZeroWidth}) {
            RangeTable table = store.lookup(name, version);
            ASSERT_FALSE(table.empty()) << version;
            for (size_t i = 0; i < table.size(); ++i) {
                EXPECT_LE(table[i].start, table[i].end) << version << " range " << i;
                if (i > 0) {
                    EXPECT_LT(table[i - 1].end, table[i].start) << version << " range " << i;
                }
            }
        }
    }
}

TEST_F(RangeTableTest, BuiltinVersionList) {
    const auto& versions = store.versions();
    ASSERT_EQ(versions.size(), 21u);
    EXPECT_EQ(versions.front(), "4.1.0");
    EXPECT_EQ(versions.back(), "17.0.0");
    EXPECT_NE(std::find(versions.begin(), versions.end(), "9.0.0"), versions.end());
}

TEST_F(RangeTableTest, BuiltinLookupOfUnknownVersionThrows) {
    EXPECT_THROW(store.lookup(TableName::Wide, "latest"), TableLookupError);
    EXPECT_THROW(store.lookup(TableName::ZeroWidth, "9.0"), TableLookupError);

    try {
        store.lookup(TableName::Wide, "1.2.3");
        FAIL() << "lookup should have thrown";
    } catch (const CellwidthException& e) {
        EXPECT_EQ(e.code(), ErrorCode::UNKNOWN_VERSION);
    }
}

TEST_F(RangeTableTest, WideTableContainsCjk) {
    RangeTable wide = store.lookup(TableName::Wide, "17.0.0");
    EXPECT_EQ(range_contains(0x6C38, wide), 1);  // 永
    EXPECT_EQ(range_contains(0x4F60, wide), 1);  // 你
    EXPECT_EQ(range_contains(0xAC00, wide), 1);  // 가
    EXPECT_EQ(range_contains('A', wide), 0);
}

// Emoji became wide in Unicode 9
TEST_F(RangeTableTest, WideTableChangesAcrossVersions) {
    EXPECT_EQ(range_contains(0x1F600, store.lookup(TableName::Wide, "8.0.0")), 0);
    EXPECT_EQ(range_contains(0x1F600, store.lookup(TableName::Wide, "9.0.0")), 1);
}

TEST_F(RangeTableTest, AlwaysZeroWidthSet) {
    std::vector<uint32_t> members = {0x0000, 0x034F, 0x200B, 0x200C, 0x200D, 0x200E, 0x200F,
                                     0x2028, 0x2029, 0x202A, 0x202E, 0x2060, 0x2063};
    for (uint32_t cp : members) {
        EXPECT_TRUE(store.is_always_zero_width(cp)) << std::hex << cp;
    }
    EXPECT_FALSE(store.is_always_zero_width('A'));
    EXPECT_FALSE(store.is_always_zero_width(0x2064));
    EXPECT_FALSE(store.is_always_zero_width(0x0301));
}
