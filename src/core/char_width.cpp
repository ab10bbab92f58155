#include "cellwidth/char_width.hpp"
#include "cellwidth/range_table.hpp"
#include "cellwidth/types.hpp"

#include <algorithm>
#include <iterator>

namespace cellwidth {

namespace {

// Local display policy for CJK-oriented terminals. Several of these are
// narrow or ambiguous in the Unicode tables; they are drawn two columns here
// regardless of version. Kept sorted for binary search.
constexpr char32_t kOverrideWide[] = {
    0x00B7,  // · middle dot
    0x2014,  // — em dash
    0x2018,  // ‘
    0x2019,  // ’
    0x201C,  // “
    0x201D,  // ”
    0x2026,  // … horizontal ellipsis
    0x2190,  // ←
    0x2191,  // ↑
    0x2192,  // →
    0x2193,  // ↓
    0x300A,  // 《
    0x300B,  // 》
};

} // namespace

bool CharWidthClassifier::is_override_wide(char32_t codepoint) noexcept {
    return std::binary_search(std::begin(kOverrideWide), std::end(kOverrideWide), codepoint);
}

std::span<const char32_t> CharWidthClassifier::override_wide_set() noexcept {
    return kOverrideWide;
}

CharWidthClassifier::TableSet CharWidthClassifier::tables(const std::string& version) const {
    return {store_.lookup(TableName::ZeroWidth, version), store_.lookup(TableName::Wide, version)};
}

int CharWidthClassifier::wcwidth(char32_t codepoint, const std::string& version) const {
    return wcwidth(codepoint, tables(version));
}

int CharWidthClassifier::wcwidth(char32_t codepoint, const TableSet& tables) const {
    uint32_t ucs = static_cast<uint32_t>(codepoint);

    if (store_.is_always_zero_width(ucs)) {
        return 0;
    }

    // C0 and C1 controls
    if (ucs < 32 || (ucs >= 0x7F && ucs < 0xA0)) {
        return -1;
    }

    if (range_contains(ucs, tables.zero_width)) {
        return 0;
    }

    return 1 + range_contains(ucs, tables.wide);
}

int CharWidthClassifier::char_width(char32_t codepoint, const std::string& version) const {
    return char_width(codepoint, tables(version));
}

int CharWidthClassifier::char_width(char32_t codepoint, const TableSet& tables) const {
    if (is_override_wide(codepoint)) {
        return 2;
    }
    int width = wcwidth(codepoint, tables);
    return width < 0 ? 0 : width;
}

} // namespace cellwidth
