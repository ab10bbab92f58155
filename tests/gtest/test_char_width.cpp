// =============================================================================
// Codepoint Width Classification Tests
// =============================================================================

#include <gtest/gtest.h>
#include "cellwidth/cellwidth.hpp"
#include "synthetic_store.hpp"
#include <vector>

using namespace cellwidth;

class CharWidthTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    const BuiltinTableStore& store = BuiltinTableStore::instance();
    CharWidthClassifier classifier{store};
};

TEST_F(CharWidthTest, ConcreteCases) {
    EXPECT_EQ(width_of_char(U'A'), 1);
    EXPECT_EQ(width_of_char(U'永'), 2);
    EXPECT_EQ(width_of_char(0x200B), 0);   // zero width space
    EXPECT_EQ(width_of_char(U'…'), 2);
    EXPECT_EQ(width_of_char(U'é'), 1);
    EXPECT_EQ(width_of_char(0x0301), 0);   // combining acute
    EXPECT_EQ(width_of_char(0xFF21), 2);   // fullwidth A
    EXPECT_EQ(width_of_char(0x3042), 2);   // hiragana a
}

TEST_F(CharWidthTest, AlwaysZeroWidthUnderEveryVersion) {
    std::vector<char32_t> members = {0x0000, 0x034F, 0x200B, 0x200D, 0x200F,
                                     0x2028, 0x2029, 0x202C, 0x2060, 0x2063};
    for (const auto& version : store.versions()) {
        for (char32_t cp : members) {
            EXPECT_EQ(classifier.wcwidth(cp, version), 0) << version << " " << std::hex << static_cast<uint32_t>(cp);
            EXPECT_EQ(classifier.char_width(cp, version), 0) << version << " " << std::hex << static_cast<uint32_t>(cp);
        }
    }
}

TEST_F(CharWidthTest, ControlCharactersAreNonPrinting) {
    for (char32_t cp = 1; cp < 32; ++cp) {
        EXPECT_EQ(classifier.wcwidth(cp, "17.0.0"), -1) << static_cast<uint32_t>(cp);
        EXPECT_EQ(width_of_char(cp), 0) << static_cast<uint32_t>(cp);
    }
    for (char32_t cp = 0x7F; cp < 0xA0; ++cp) {
        EXPECT_EQ(classifier.wcwidth(cp, "17.0.0"), -1) << static_cast<uint32_t>(cp);
        EXPECT_EQ(width_of_char(cp), 0) << static_cast<uint32_t>(cp);
    }
    // The boundaries themselves print
    EXPECT_EQ(width_of_char(0x20), 1);
    EXPECT_EQ(width_of_char(0x7E), 1);
    EXPECT_EQ(width_of_char(0xA0), 1);
}

TEST_F(CharWidthTest, OverrideSetIsWideUnderEveryVersion) {
    auto overrides = CharWidthClassifier::override_wide_set();
    ASSERT_EQ(overrides.size(), 13u);
    for (const auto& version : store.versions()) {
        for (char32_t cp : overrides) {
            EXPECT_EQ(classifier.char_width(cp, version), 2) << version << " " << std::hex << static_cast<uint32_t>(cp);
            EXPECT_EQ(width_of_char(cp, version), 2);
        }
    }

    EXPECT_TRUE(CharWidthClassifier::is_override_wide(U'“'));
    EXPECT_TRUE(CharWidthClassifier::is_override_wide(U'”'));
    EXPECT_TRUE(CharWidthClassifier::is_override_wide(U'·'));
    EXPECT_TRUE(CharWidthClassifier::is_override_wide(U'—'));
    EXPECT_TRUE(CharWidthClassifier::is_override_wide(U'《'));
    EXPECT_TRUE(CharWidthClassifier::is_override_wide(U'→'));
    EXPECT_FALSE(CharWidthClassifier::is_override_wide(U'-'));
    EXPECT_FALSE(CharWidthClassifier::is_override_wide(U'"'));
}

// The override only applies to the layout width, not the raw table width
TEST_F(CharWidthTest, OverrideDoesNotChangeTableWidth) {
    EXPECT_EQ(classifier.wcwidth(U'…', "17.0.0"), 1);
    EXPECT_EQ(classifier.wcwidth(U'←', "17.0.0"), 1);
    EXPECT_EQ(classifier.char_width(U'…', "17.0.0"), 2);
}

TEST_F(CharWidthTest, EmojiWidthDependsOnVersion) {
    EXPECT_EQ(width_of_char(0x1F600, "8.0.0"), 1);
    EXPECT_EQ(width_of_char(0x1F600, "9.0.0"), 2);
    EXPECT_EQ(width_of_char(0x1F600, "latest"), 2);
    EXPECT_EQ(width_of_char(0x1F600, "8"), 1);
}

// Every codepoint in one tabulated range classifies the same way
TEST_F(CharWidthTest, RangeUniformClassification) {
    for (const std::string version : {"4.1.0", "9.0.0", "17.0.0"}) {
        for (TableName name : {TableName::Wide, TableName::ZeroWidth}) {
            for (const auto& range : store.lookup(name, version)) {
                int first = classifier.char_width(range.start, version);
                int last = classifier.char_width(range.end, version);
                int mid = classifier.char_width(range.start + (range.end - range.start) / 2, version);
                // Members of the fixed sets may sit inside a tabulated range
                if (store.is_always_zero_width(range.start) ||
                    store.is_always_zero_width(range.end) ||
                    CharWidthClassifier::is_override_wide(range.start) ||
                    CharWidthClassifier::is_override_wide(range.end)) {
                    continue;
                }
                EXPECT_EQ(first, last) << version << " " << std::hex << range.start;
                EXPECT_EQ(first, mid) << version << " " << std::hex << range.start;
            }
        }
    }
}

TEST_F(CharWidthTest, SyntheticTables) {
    test_support::SyntheticStore synthetic;
    CharWidthClassifier c(synthetic);

    EXPECT_EQ(c.char_width('A', "1.0"), 1);
    EXPECT_EQ(c.char_width('W', "1.0"), 1);
    EXPECT_EQ(c.char_width('W', "2.0"), 2);
    EXPECT_EQ(c.char_width(0x1008, "1.0"), 2);
    EXPECT_EQ(c.char_width(0x1080, "1.0"), 1);
    EXPECT_EQ(c.char_width(0x1080, "2.0"), 2);
    EXPECT_EQ(c.char_width(0x0305, "1.0"), 0);
    EXPECT_EQ(c.char_width(0x2000, "2.0"), 1);
    EXPECT_EQ(c.char_width(0x2000, "3.0"), 0);

    // Store-supplied always-zero set
    EXPECT_EQ(c.char_width('Z', "1.0"), 0);
    // Override still wins over the store
    EXPECT_EQ(c.char_width(0x2026, "1.0"), 2);
    // Controls
    EXPECT_EQ(c.wcwidth('\n', "1.0"), -1);
    EXPECT_EQ(c.char_width('\n', "1.0"), 0);
}

TEST_F(CharWidthTest, UnresolvedVersionThrowsAtClassifier) {
    EXPECT_THROW(classifier.char_width('A', "latest"), TableLookupError);
}
