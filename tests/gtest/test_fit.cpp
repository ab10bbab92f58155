// =============================================================================
// Fit (Cut / Pad) Tests
// =============================================================================

#include <gtest/gtest.h>
#include "cellwidth/cellwidth.hpp"
#include "cellwidth/util/utf8.hpp"
#include <string>
#include <vector>

using namespace cellwidth;

class FitTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    // Helper: width of a fit result under the latest tables
    static size_t cells(std::u32string_view text) {
        return width_of_string(text);
    }

    StringWidth width{BuiltinTableStore::instance()};
};

TEST_F(FitTest, PadsShortText) {
    EXPECT_EQ(fit(U"AB", 5, Side::Left, Side::Right, U' '), U"AB   ");
    EXPECT_EQ(fit(U"AB", 5, Side::Left, Side::Left, U' '), U"   AB");
    EXPECT_EQ(fit(U"AB", 4, Side::Left, Side::Right, U'.'), U"AB..");
    EXPECT_EQ(fit(U"", 3), U"   ");
}

TEST_F(FitTest, ExactWidthUnchanged) {
    EXPECT_EQ(fit(U"hello", 5), U"hello");
    EXPECT_EQ(fit(U"永永", 4), U"永永");
    EXPECT_EQ(fit(U"", 0), U"");
}

TEST_F(FitTest, CutsFromChosenSide) {
    EXPECT_EQ(fit(U"abcdef", 3, Side::Left), U"def");
    EXPECT_EQ(fit(U"abcdef", 3, Side::Right), U"abc");
    EXPECT_EQ(fit(U"abcdef", 0, Side::Right), U"");
}

// Cutting half of a wide character leaves one column to pad
TEST_F(FitTest, CutThroughWideCharacterIsPadded) {
    EXPECT_EQ(fit(U"永永永", 5, Side::Left, Side::Right), U"永永 ");
    EXPECT_EQ(fit(U"永永永", 5, Side::Right, Side::Left), U" 永永");
    EXPECT_EQ(fit(U"a永", 2, Side::Right, Side::Right), U"a ");
    EXPECT_EQ(fit(U"永", 1), U" ");
}

TEST_F(FitTest, ZeroWidthCharactersTravelWithTheCut) {
    // Combining acute after 'e' is worth nothing on its own
    std::u32string text = U"ae\u0301b";
    EXPECT_EQ(fit(text, 3), text);
    EXPECT_EQ(fit(text, 2, Side::Left), U"e\u0301b");
}

// Result is exactly n columns for every n with a one-column pad
TEST_F(FitTest, ResultHasExactWidth) {
    std::vector<std::u32string> samples = {
        U"", U"A", U"plain", U"永A永B", U"日本語のテキスト", U"“quote” … — →",
        U"\U0001F600 smile \U0001F680", U"ae\u0301\u200Bz"};
    for (const auto& s : samples) {
        for (int n = 0; n <= 24; ++n) {
            for (Side cut : {Side::Left, Side::Right}) {
                for (Side pad : {Side::Left, Side::Right}) {
                    std::u32string out = fit(s, n, cut, pad, U' ');
                    EXPECT_EQ(cells(out), static_cast<size_t>(n))
                        << "n=" << n << " len=" << s.size();
                }
            }
        }
    }
}

TEST_F(FitTest, WidePadCharacterMayOvershootByOne) {
    std::u32string out = fit(U"A", 4, Side::Left, Side::Right, U'永');
    EXPECT_EQ(out, U"A永永");
    EXPECT_EQ(cells(out), 5u);

    out = fit(U"A", 5, Side::Left, Side::Left, U'永');
    EXPECT_EQ(out, U"永永A");
    EXPECT_EQ(cells(out), 5u);
}

TEST_F(FitTest, NegativeTargetThrows) {
    EXPECT_THROW(fit(U"abc", -1), InvalidArgumentError);
    try {
        fit(width, U"abc", -5);
        FAIL() << "expected InvalidArgumentError";
    } catch (const CellwidthException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
    }
}

// Callers can catch the argument error by its own type
TEST_F(FitTest, ArgumentErrorsAreInvalidArgumentError) {
    try {
        fit(width, U"abc", -1);
        FAIL() << "expected InvalidArgumentError";
    } catch (const InvalidArgumentError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
        EXPECT_EQ(e.context(), "fit");
        EXPECT_NE(std::string(e.what()).find("got -1"), std::string::npos);
    }

    try {
        fit(width, U"ab", 5, Side::Left, Side::Right, static_cast<char32_t>(0x200B));
        FAIL() << "expected InvalidArgumentError";
    } catch (const InvalidArgumentError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
        EXPECT_NE(std::string(e.what()).find("zero display width"), std::string::npos);
    }

    EXPECT_THROW(fit(std::string_view("abc"), -3), InvalidArgumentError);
}

TEST_F(FitTest, ZeroWidthPadThrowsOnlyWhenPaddingIsNeeded) {
    EXPECT_THROW(fit(U"ab", 5, Side::Left, Side::Right, static_cast<char32_t>(0x200B)),
                 InvalidArgumentError);
    EXPECT_THROW(fit(U"ab", 5, Side::Left, Side::Right, U'\n'), InvalidArgumentError);
    // No padding needed, so the pad character is never measured
    EXPECT_EQ(fit(U"abcdef", 3, Side::Right, Side::Right, static_cast<char32_t>(0x200B)), U"abc");
}

TEST_F(FitTest, DefaultLengthIsThirty) {
    EXPECT_EQ(DEFAULT_FIT_LENGTH, 30);
    std::u32string out = fit(U"title");
    EXPECT_EQ(out.size(), 30u);
    EXPECT_EQ(out.substr(0, 5), U"title");
}

TEST_F(FitTest, VersionAffectsCut) {
    // An emoji is one column before Unicode 9 and two after
    EXPECT_EQ(fit(U"\U0001F600ab", 3, Side::Right, Side::Right, U' ', "8.0.0"), U"\U0001F600ab");
    EXPECT_EQ(fit(U"\U0001F600ab", 3, Side::Right, Side::Right, U' ', "9.0.0"), U"\U0001F600a");
}

TEST_F(FitTest, Utf8InAndOut) {
    EXPECT_EQ(fit(std::string_view("AB"), 5), "AB   ");
    EXPECT_EQ(fit(std::string_view("\xE6\xB0\xB8\xE6\xB0\xB8\xE6\xB0\xB8"), 5),
              "\xE6\xB0\xB8\xE6\xB0\xB8 ");
    EXPECT_EQ(fit_utf8(width, "abcdef", 2, Side::Right), "ab");

    // Malformed input decodes with U+FFFD, which is one column wide
    EXPECT_EQ(fit_utf8(width, "a\xFF", 3), "a\xEF\xBF\xBD ");
}

TEST_F(FitTest, CalculatorMatchesFreeFunction) {
    WidthCalculator calc;
    EXPECT_EQ(calc.fit(U"永永永", 5), fit(U"永永永", 5));
    EXPECT_EQ(calc.fit_utf8("abc", 5, Side::Left, Side::Left), "  abc");
}
