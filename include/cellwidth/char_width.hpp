#pragma once

#include "cellwidth/types.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace cellwidth {

class RangeTableStore;

/**
 * Per-codepoint display width against a resolved Unicode version.
 *
 * The version passed to these methods must already be a member of the
 * store's version list; string-level callers resolve once per call.
 */
class CharWidthClassifier {
public:
    // Both tables of one version, fetched once per string
    struct TableSet {
        RangeTable zero_width;
        RangeTable wide;
    };

    explicit CharWidthClassifier(const RangeTableStore& store) : store_(store) {}

    TableSet tables(const std::string& version) const;

    /**
     * Width from the Unicode tables alone.
     * @return -1 for C0/C1 controls, 0 for zero-width, 1 or 2 otherwise
     */
    int wcwidth(char32_t codepoint, const std::string& version) const;
    int wcwidth(char32_t codepoint, const TableSet& tables) const;

    /**
     * Display width used for layout: the override set first, then wcwidth
     * with non-printing characters counted as 0.
     * @return 0, 1 or 2
     */
    int char_width(char32_t codepoint, const std::string& version) const;
    int char_width(char32_t codepoint, const TableSet& tables) const;

    // Punctuation and arrows always drawn two columns wide
    static bool is_override_wide(char32_t codepoint) noexcept;
    static std::span<const char32_t> override_wide_set() noexcept;

private:
    const RangeTableStore& store_;
};

} // namespace cellwidth
