#include "cellwidth/util/utf8.hpp"

namespace cellwidth::util {

namespace {

inline bool is_continuation(uint8_t b) {
    return (b & 0xC0) == 0x80;
}

// Strict check of one sequence at pos. On success stores the codepoint and
// the sequence length and returns true.
bool decode_strict_at(const uint8_t* p, size_t remaining, char32_t& cp, size_t& len) {
    uint8_t b1 = p[0];
    if (b1 < 0x80) {
        cp = b1;
        len = 1;
        return true;
    }

    char32_t min_value;
    if ((b1 & 0xE0) == 0xC0) {
        len = 2;
        cp = b1 & 0x1F;
        min_value = 0x80;
    } else if ((b1 & 0xF0) == 0xE0) {
        len = 3;
        cp = b1 & 0x0F;
        min_value = 0x800;
    } else if ((b1 & 0xF8) == 0xF0) {
        len = 4;
        cp = b1 & 0x07;
        min_value = 0x10000;
    } else {
        return false;
    }

    if (remaining < len) return false;
    for (size_t i = 1; i < len; ++i) {
        if (!is_continuation(p[i])) return false;
        cp = (cp << 6) | (p[i] & 0x3F);
    }

    if (cp < min_value) return false;                 // Overlong
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;   // Surrogate
    if (cp > constants::MAX_CODEPOINT) return false;
    return true;
}

} // namespace

DecodedCodepoint decode_one(std::string_view bytes, size_t pos) noexcept {
    if (pos >= bytes.size()) {
        return {constants::DECODE_PLACEHOLDER, pos + 1};
    }

    const uint8_t* p = reinterpret_cast<const uint8_t*>(bytes.data()) + pos;
    size_t lt = bytes.size() - pos;
    const DecodedCodepoint error{constants::DECODE_PLACEHOLDER, pos + 1};

    uint8_t b1 = p[0];
    if (!(b1 & 0x80)) {
        // ASCII fast path
        return {b1, pos + 1};
    }
    if (lt < 2) {
        return error;
    }

    if ((b1 & 0xE0) == 0xC0) {
        // 2-byte sequence
        if (!is_continuation(p[1])) return error;
        char32_t o = ((b1 & 0x1F) << 6) | (p[1] & 0x3F);
        if (o < 0x80) return error;  // Overlong
        return {o, pos + 2};
    }
    if (lt < 3) {
        return error;
    }

    if ((b1 & 0xF0) == 0xE0) {
        // 3-byte sequence
        if (!is_continuation(p[1]) || !is_continuation(p[2])) return error;
        char32_t o = ((b1 & 0x0F) << 12) | ((p[1] & 0x3F) << 6) | (p[2] & 0x3F);
        if (o < 0x800) return error;
        return {o, pos + 3};
    }
    if (lt < 4) {
        return error;
    }

    if ((b1 & 0xF8) == 0xF0) {
        // 4-byte sequence
        if (!is_continuation(p[1]) || !is_continuation(p[2]) || !is_continuation(p[3])) {
            return error;
        }
        char32_t o = ((b1 & 0x07) << 18) | ((p[1] & 0x3F) << 12) |
                     ((p[2] & 0x3F) << 6) | (p[3] & 0x3F);
        if (o < 0x10000) return error;
        return {o, pos + 4};
    }

    // Stray continuation byte or 0xF8..0xFF
    return error;
}

Utf8DecodeResult decode_utf8_strict(std::string_view bytes) {
    Utf8DecodeResult result;
    result.codepoints.reserve(bytes.size());

    const uint8_t* base = reinterpret_cast<const uint8_t*>(bytes.data());
    size_t pos = 0;
    while (pos < bytes.size()) {
        char32_t cp;
        size_t len;
        if (!decode_strict_at(base + pos, bytes.size() - pos, cp, len)) {
            result.ok = false;
            result.error_offset = pos;
            return result;
        }
        result.codepoints.push_back(cp);
        pos += len;
    }
    return result;
}

// No logging in here: this runs once per string on the fit path
std::u32string decode_utf8_lossy(std::string_view bytes) {
    std::u32string codepoints;
    codepoints.reserve(bytes.size());

    const uint8_t* base = reinterpret_cast<const uint8_t*>(bytes.data());
    size_t pos = 0;
    while (pos < bytes.size()) {
        char32_t cp;
        size_t len;
        if (decode_strict_at(base + pos, bytes.size() - pos, cp, len)) {
            codepoints.push_back(cp);
            pos += len;
        } else {
            codepoints.push_back(constants::REPLACEMENT_CHAR);
            ++pos;
        }
    }
    return codepoints;
}

std::string encode_utf8(char32_t cp) {
    if (cp > constants::MAX_CODEPOINT || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = constants::REPLACEMENT_CHAR;
    }

    std::string result;
    if (cp < 0x80) {
        result.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return result;
}

std::string encode_utf8(std::u32string_view codepoints) {
    std::string result;
    result.reserve(codepoints.size());
    for (char32_t cp : codepoints) {
        result += encode_utf8(cp);
    }
    return result;
}

} // namespace cellwidth::util
