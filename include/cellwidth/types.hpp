#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace cellwidth {

// =============================================================================
// Core Types
// =============================================================================

/**
 * Inclusive range of codepoints sharing one width classification.
 */
struct CodepointRange {
    uint32_t start;
    uint32_t end;
};

// Non-owning view onto a sorted, non-overlapping run of ranges
using RangeTable = std::span<const CodepointRange>;

enum class TableName {
    Wide,       // East-Asian wide and fullwidth, two columns
    ZeroWidth   // Combining and non-spacing marks
};

/**
 * How a buffer passed to the width aggregator is interpreted.
 *
 * NativeText      - already codepoints (char32_t), or one codepoint per byte
 * Utf8Bytes       - UTF-8 encoded bytes, decoded before classification
 * FixedWidthBytes - legacy narrow/wide byte encodings, one column per byte
 */
enum class TextEncoding {
    NativeText,
    Utf8Bytes,
    FixedWidthBytes
};

// Which end of a string is trimmed or padded
enum class Side {
    Left,
    Right
};

// One decoder step: the codepoint and the position just past it
struct DecodedCodepoint {
    char32_t value;
    size_t next;
};

namespace constants {
    constexpr char32_t MAX_CODEPOINT = 0x10FFFF;
    constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;
    constexpr char32_t DECODE_PLACEHOLDER = U'?';
    constexpr const char* LATEST_VERSION = "latest";
    constexpr const char* AUTO_VERSION = "auto";
}

/**
 * Per-call configuration threaded through the public API.
 *
 * unicode_version may be "latest", "auto", or a dotted version. "auto" is
 * replaced by auto_version when set (Config::width_options() fills it from
 * UNICODE_VERSION), and by "latest" otherwise.
 */
struct WidthOptions {
    std::string unicode_version = constants::LATEST_VERSION;
    std::optional<std::string> auto_version;
};

} // namespace cellwidth
