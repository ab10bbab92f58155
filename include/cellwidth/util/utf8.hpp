#pragma once

#include "cellwidth/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cellwidth::util {

// Decode the codepoint starting at pos. Malformed, truncated or overlong
// sequences yield '?' and advance exactly one byte, so a loop over
// decode_one always terminates.
DecodedCodepoint decode_one(std::string_view bytes, size_t pos) noexcept;

struct Utf8DecodeResult {
    std::u32string codepoints;
    bool ok = true;
    size_t error_offset = 0;   // offset of the first bad byte when !ok
};

// Strict decode: stops at the first invalid sequence (including surrogates
// and values above U+10FFFF). Codepoints decoded before the error are kept.
Utf8DecodeResult decode_utf8_strict(std::string_view bytes);

// Decode UTF-8 bytes to Unicode codepoints, invalid sequences become U+FFFD
std::u32string decode_utf8_lossy(std::string_view bytes);

// Encode codepoint to UTF-8 bytes
std::string encode_utf8(char32_t codepoint);

std::string encode_utf8(std::u32string_view codepoints);

} // namespace cellwidth::util
