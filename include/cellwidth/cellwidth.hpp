/**
 * cellwidth - terminal column width of Unicode text
 * ================================================
 *
 * Entry points:
 *   width_of_char(cp)            0, 1 or 2 columns
 *   width_of_string(text)        sum over a string or a slice of it
 *   fit(text, n, cut, pad, ch)   cut or pad to exactly n columns
 *
 * Every call takes the Unicode version explicitly ("latest" by default).
 * For UNICODE_VERSION support, build a WidthCalculator from
 * Config::getInstance().width_options().
 */

#pragma once

#include "cellwidth/char_width.hpp"
#include "cellwidth/error.hpp"
#include "cellwidth/fit.hpp"
#include "cellwidth/range_table.hpp"
#include "cellwidth/string_width.hpp"
#include "cellwidth/types.hpp"
#include "cellwidth/version.hpp"
#include "cellwidth/warning.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cellwidth {

/**
 * A table store plus options, bundled for repeated use.
 * The store must outlive the calculator.
 */
class WidthCalculator {
public:
    explicit WidthCalculator(WidthOptions options = {},
                             const RangeTableStore& store = BuiltinTableStore::instance())
        : width_(store, std::move(options)) {}

    int char_width(char32_t codepoint) const { return width_.char_width(codepoint); }

    size_t string_width(std::u32string_view text,
                        size_t start = 0, size_t end = StringWidth::npos) const {
        return width_.of(text, start, end);
    }

    size_t string_width(std::string_view bytes, TextEncoding encoding,
                        size_t start = 0, size_t end = StringWidth::npos) const {
        return width_.of(bytes, encoding, start, end);
    }

    std::u32string fit(std::u32string_view text, int length,
                       Side cut_align = Side::Left, Side pad_align = Side::Right,
                       char32_t pad_char = U' ') const {
        return cellwidth::fit(width_, text, length, cut_align, pad_align, pad_char);
    }

    std::string fit_utf8(std::string_view text, int length,
                         Side cut_align = Side::Left, Side pad_align = Side::Right,
                         char32_t pad_char = U' ') const {
        return cellwidth::fit_utf8(width_, text, length, cut_align, pad_align, pad_char);
    }

    std::string resolved_version() const { return width_.resolved_version(); }

private:
    StringWidth width_;
};

// Default target width used by fit() when none is given
constexpr int DEFAULT_FIT_LENGTH = 30;

int width_of_char(char32_t codepoint, const std::string& version = constants::LATEST_VERSION);

size_t width_of_string(std::u32string_view text, size_t start = 0,
                       size_t end = StringWidth::npos,
                       const std::string& version = constants::LATEST_VERSION);

// UTF-8 encoded text
size_t width_of_string(std::string_view text, size_t start = 0,
                       size_t end = StringWidth::npos,
                       const std::string& version = constants::LATEST_VERSION);

std::u32string fit(std::u32string_view text, int length = DEFAULT_FIT_LENGTH,
                   Side cut_align = Side::Left, Side pad_align = Side::Right,
                   char32_t pad_char = U' ',
                   const std::string& version = constants::LATEST_VERSION);

std::string fit(std::string_view text, int length = DEFAULT_FIT_LENGTH,
                Side cut_align = Side::Left, Side pad_align = Side::Right,
                char32_t pad_char = U' ',
                const std::string& version = constants::LATEST_VERSION);

// Tabulated Unicode versions, ascending
const std::vector<std::string>& supported_versions();

} // namespace cellwidth
