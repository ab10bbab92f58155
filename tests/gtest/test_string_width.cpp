// =============================================================================
// String Width Tests
// =============================================================================

#include <gtest/gtest.h>
#include "cellwidth/cellwidth.hpp"
#include "synthetic_store.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace cellwidth;

class StringWidthTest : public ::testing::Test {
protected:
    void SetUp() override {
        capture_ = std::make_unique<ScopedWarningHandler>(
            [this](WarningKind kind, const std::string& message) {
                warnings.push_back(kind);
                messages.push_back(message);
            });
    }
    void TearDown() override { capture_.reset(); }

    StringWidth width{BuiltinTableStore::instance()};
    std::vector<WarningKind> warnings;
    std::vector<std::string> messages;

private:
    std::unique_ptr<ScopedWarningHandler> capture_;
};

TEST_F(StringWidthTest, MixedWidths) {
    EXPECT_EQ(width.of(U"永A"), 3u);
    EXPECT_EQ(width_of_string(U"永A"), 3u);
    EXPECT_EQ(width_of_string("\xE6\xB0\xB8" "A"), 3u);
    EXPECT_EQ(width_of_string(U"hello"), 5u);
    EXPECT_EQ(width_of_string(U"é"), 1u);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(StringWidthTest, EmptyIsZero) {
    EXPECT_EQ(width.of(std::u32string_view()), 0u);
    EXPECT_EQ(width.of(std::string_view(), TextEncoding::Utf8Bytes), 0u);
    EXPECT_EQ(width_of_string(U""), 0u);
    // Offsets are not checked against an empty buffer
    EXPECT_EQ(width.of(std::u32string_view(), 3, 5), 0u);
}

TEST_F(StringWidthTest, Slices) {
    std::u32string text = U"ab\u6C38cd";
    EXPECT_EQ(width.of(text, 0, 2), 2u);
    EXPECT_EQ(width.of(text, 2, 3), 2u);
    EXPECT_EQ(width.of(text, 2), 4u);
    EXPECT_EQ(width.of(text, 3, 3), 0u);
    EXPECT_EQ(width.of(text, 5, 5), 0u);
    EXPECT_EQ(width_of_string(text, 1, 4), 4u);
}

TEST_F(StringWidthTest, InvalidSlicesThrow) {
    std::u32string text = U"abc";
    EXPECT_THROW(width.of(text, 2, 1), InvalidRangeError);
    EXPECT_THROW(width.of(text, 0, 4), InvalidRangeError);
    EXPECT_THROW(width.of(text, 4), InvalidRangeError);
    EXPECT_THROW(width.of("abc", TextEncoding::Utf8Bytes, 3, 2), InvalidRangeError);

    try {
        width.of(text, 2, 1);
        FAIL() << "expected InvalidRangeError";
    } catch (const InvalidRangeError& e) {
        EXPECT_EQ(e.start(), 2u);
        EXPECT_EQ(e.end(), 1u);
        EXPECT_EQ(e.code(), ErrorCode::INVALID_RANGE);
    }
}

// Sum over a string equals the sum over its characters
TEST_F(StringWidthTest, AdditiveOverCharacters) {
    std::vector<std::u32string> samples = {
        U"plain ascii", U"日本語テキスト", U"“quoted” … —", U"a\u200Bb\u200Dc",
        U"\U0001F600\U0001F680 ok", U"tab\there", U"한국어 text"};
    for (const auto& version : {std::string("8.0.0"), std::string("latest")}) {
        for (const auto& s : samples) {
            size_t sum = 0;
            for (char32_t cp : s) {
                sum += static_cast<size_t>(width_of_char(cp, version));
            }
            EXPECT_EQ(width_of_string(s, 0, StringWidth::npos, version), sum);
        }
    }
}

TEST_F(StringWidthTest, FixedWidthBytesCountBytes) {
    EXPECT_EQ(width.of("abcdef", TextEncoding::FixedWidthBytes), 6u);
    EXPECT_EQ(width.of("abcdef", TextEncoding::FixedWidthBytes, 1, 4), 3u);
    EXPECT_EQ(width.of("\xE6\xB0\xB8", TextEncoding::FixedWidthBytes), 3u);
}

// Byte buffers read as native text are Latin-1
TEST_F(StringWidthTest, NativeTextBytes) {
    EXPECT_EQ(width.of("abc", TextEncoding::NativeText), 3u);
    EXPECT_EQ(width.of("\xE9t\xE9", TextEncoding::NativeText), 3u);
    EXPECT_EQ(width.of("a\x01" "b", TextEncoding::NativeText), 2u);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(StringWidthTest, ValidUtf8HasNoWarning) {
    EXPECT_EQ(width.of("\xE6\x97\xA5\xE6\x9C\xAC", TextEncoding::Utf8Bytes), 4u);
    EXPECT_EQ(width.of("a\xE6\x97\xA5" "b", TextEncoding::Utf8Bytes, 1, 4), 2u);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(StringWidthTest, MalformedUtf8WarnsAndStillMeasures) {
    // Overlong NUL: two placeholder columns
    EXPECT_EQ(width.of("a\xC0\x80" "b", TextEncoding::Utf8Bytes), 4u);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], WarningKind::DecodeError);
    EXPECT_NE(messages[0].find("byte 1"), std::string::npos);
}

TEST_F(StringWidthTest, SliceInsideCharacterWarns) {
    std::string text = "\xE6\xB0\xB8";
    EXPECT_EQ(width.of(text, TextEncoding::Utf8Bytes, 1, 3), 2u);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], WarningKind::DecodeError);
}

TEST_F(StringWidthTest, VersionChangesWidth) {
    std::u32string text = U"\U0001F600";
    EXPECT_EQ(width_of_string(text, 0, StringWidth::npos, "8.0.0"), 1u);
    EXPECT_EQ(width_of_string(text, 0, StringWidth::npos, "9.0.0"), 2u);
}

TEST_F(StringWidthTest, AutoVersionFromOptions) {
    WidthOptions options;
    options.unicode_version = constants::AUTO_VERSION;
    options.auto_version = "8.0";

    WidthCalculator calc(options);
    EXPECT_EQ(calc.resolved_version(), "8.0.0");
    EXPECT_EQ(calc.string_width(U"\U0001F600"), 1u);
    EXPECT_EQ(calc.char_width(0x1F600), 1);

    WidthCalculator latest;
    EXPECT_EQ(latest.resolved_version(), "17.0.0");
    EXPECT_EQ(latest.string_width(U"\U0001F600"), 2u);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(StringWidthTest, SyntheticStore) {
    test_support::SyntheticStore store;
    WidthOptions options;
    options.unicode_version = "1.0";
    StringWidth narrow(store, options);
    options.unicode_version = "2.0";
    StringWidth wide(store, options);

    EXPECT_EQ(narrow.of(U"WWW"), 3u);
    EXPECT_EQ(wide.of(U"WWW"), 6u);
    EXPECT_EQ(wide.of(U"aZb"), 2u);
}

TEST_F(StringWidthTest, SupportedVersions) {
    const auto& versions = supported_versions();
    ASSERT_FALSE(versions.empty());
    EXPECT_EQ(versions.front(), "4.1.0");
    EXPECT_EQ(versions.back(), "17.0.0");
}
