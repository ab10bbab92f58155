// =============================================================================
// UTF-8 Decoder Tests
// =============================================================================

#include <gtest/gtest.h>
#include "cellwidth/util/utf8.hpp"
#include <random>
#include <string>
#include <vector>

using namespace cellwidth;
using namespace cellwidth::util;

class Utf8Test : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    // Walk the whole buffer with decode_one, collecting codepoints
    static std::u32string walk(std::string_view bytes, size_t* steps = nullptr) {
        std::u32string out;
        size_t pos = 0;
        size_t n = 0;
        while (pos < bytes.size()) {
            DecodedCodepoint d = decode_one(bytes, pos);
            EXPECT_GT(d.next, pos);
            out.push_back(d.value);
            pos = d.next;
            ++n;
        }
        if (steps) *steps = n;
        return out;
    }
};

TEST_F(Utf8Test, Ascii) {
    DecodedCodepoint d = decode_one("A", 0);
    EXPECT_EQ(d.value, U'A');
    EXPECT_EQ(d.next, 1u);
}

TEST_F(Utf8Test, MultiByteSequences) {
    std::string two = "\xC3\xA9";              // é
    std::string three = "\xE6\xB0\xB8";        // 永
    std::string four = "\xF0\x9F\x98\x80";     // U+1F600

    DecodedCodepoint d = decode_one(two, 0);
    EXPECT_EQ(d.value, U'é');
    EXPECT_EQ(d.next, 2u);

    d = decode_one(three, 0);
    EXPECT_EQ(d.value, U'永');
    EXPECT_EQ(d.next, 3u);

    d = decode_one(four, 0);
    EXPECT_EQ(d.value, U'\U0001F600');
    EXPECT_EQ(d.next, 4u);
}

TEST_F(Utf8Test, DecodesAtOffset) {
    std::string text = "a\xE6\xB0\xB8" "b";
    DecodedCodepoint d = decode_one(text, 1);
    EXPECT_EQ(d.value, U'永');
    EXPECT_EQ(d.next, 4u);
    d = decode_one(text, 4);
    EXPECT_EQ(d.value, U'b');
    EXPECT_EQ(d.next, 5u);
}

// Overlong NUL: one placeholder, one byte
TEST_F(Utf8Test, OverlongAdvancesOneByte) {
    std::string overlong = "\xC0\x80";
    DecodedCodepoint d = decode_one(overlong, 0);
    EXPECT_EQ(d.value, U'?');
    EXPECT_EQ(d.next, 1u);

    EXPECT_EQ(decode_one("\xE0\x80\xAF", 0).next, 1u);
    EXPECT_EQ(decode_one("\xF0\x80\x80\xAF", 0).value, U'?');
}

TEST_F(Utf8Test, MalformedInputsYieldPlaceholder) {
    // Truncated
    EXPECT_EQ(decode_one("\xE6\xB0", 0).value, U'?');
    EXPECT_EQ(decode_one("\xE6\xB0", 0).next, 1u);
    EXPECT_EQ(decode_one("\xC3", 0).next, 1u);
    // Bad continuation
    EXPECT_EQ(decode_one("\xC3" "A", 0).value, U'?');
    EXPECT_EQ(decode_one("\xE6" "AB", 0).next, 1u);
    // Stray continuation and invalid lead bytes
    EXPECT_EQ(decode_one("\x80", 0).value, U'?');
    EXPECT_EQ(decode_one("\xFF\x80\x80\x80", 0).next, 1u);
}

TEST_F(Utf8Test, WalkSubstitutesAndResyncs) {
    std::u32string out = walk("ab\xC0\x80" "c");
    EXPECT_EQ(out, U"ab??c");

    out = walk("\xE6\xB0\xB8\xE6\xB0");
    EXPECT_EQ(out, U"永??");
}

// Random garbage always finishes in at most one step per byte
TEST_F(Utf8Test, AlwaysMakesProgress) {
    std::mt19937 rng(12345);
    std::uniform_int_distribution<int> byte(0, 255);
    std::uniform_int_distribution<int> len(0, 64);

    for (int round = 0; round < 500; ++round) {
        std::string buf(static_cast<size_t>(len(rng)), '\0');
        for (char& c : buf) {
            c = static_cast<char>(byte(rng));
        }
        size_t steps = 0;
        walk(buf, &steps);
        EXPECT_LE(steps, buf.size());
    }
}

TEST_F(Utf8Test, StrictDecodeValid) {
    Utf8DecodeResult r = decode_utf8_strict("A\xC3\xA9\xE6\xB0\xB8\xF0\x9F\x98\x80");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.codepoints, U"Aé永\U0001F600");

    r = decode_utf8_strict("");
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(r.codepoints.empty());
}

TEST_F(Utf8Test, StrictDecodeReportsOffset) {
    Utf8DecodeResult r = decode_utf8_strict("abc\xFF" "def");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error_offset, 3u);
    EXPECT_EQ(r.codepoints, U"abc");

    // Overlong, surrogate and out of range are all rejected
    EXPECT_FALSE(decode_utf8_strict("\xC0\x80").ok);
    EXPECT_FALSE(decode_utf8_strict("\xED\xA0\x80").ok);
    EXPECT_FALSE(decode_utf8_strict("\xF4\x90\x80\x80").ok);
    // Truncated at the end
    r = decode_utf8_strict("x\xE6\xB0");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error_offset, 1u);
}

// The byte-wise decoder is lenient about surrogates where the strict one is not
TEST_F(Utf8Test, DecodeOneAcceptsSurrogates) {
    DecodedCodepoint d = decode_one("\xED\xA0\x80", 0);
    EXPECT_EQ(d.value, static_cast<char32_t>(0xD800));
    EXPECT_EQ(d.next, 3u);
}

TEST_F(Utf8Test, LossyDecode) {
    EXPECT_EQ(decode_utf8_lossy("Hello\x80World"), U"Hello�World");
    EXPECT_EQ(decode_utf8_lossy("\xC0\x80"), U"��");
    EXPECT_EQ(decode_utf8_lossy(""), U"");
}

TEST_F(Utf8Test, Encode) {
    EXPECT_EQ(encode_utf8(U'A'), "A");
    EXPECT_EQ(encode_utf8(U'é'), "\xC3\xA9");
    EXPECT_EQ(encode_utf8(U'永'), "\xE6\xB0\xB8");
    EXPECT_EQ(encode_utf8(U'\U0001F600'), "\xF0\x9F\x98\x80");
    EXPECT_EQ(encode_utf8(static_cast<char32_t>(0x110000)), "\xEF\xBF\xBD");
    EXPECT_EQ(encode_utf8(std::u32string_view(U"a永")), "a\xE6\xB0\xB8");
}
