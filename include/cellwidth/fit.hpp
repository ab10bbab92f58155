#pragma once

#include "cellwidth/types.hpp"

#include <string>
#include <string_view>

namespace cellwidth {

class StringWidth;

/**
 * Cut or pad text to a display width.
 *
 * Text wider than target_width loses characters from cut_side until it fits.
 * Narrower text (including text left short by a cut through a wide
 * character) gets pad_char repeated at pad_side until it is at least
 * target_width wide. The result is exactly target_width columns when
 * pad_char is one column wide.
 *
 * Widths are computed once per call; the cut point and pad count come out
 * of a single pass over the text.
 *
 * @throws InvalidArgumentError if target_width < 0, or if padding is needed
 *         and pad_char is zero width
 */
std::u32string fit(const StringWidth& width, std::u32string_view text, int target_width,
                   Side cut_side = Side::Left, Side pad_side = Side::Right,
                   char32_t pad_char = U' ');

// UTF-8 in, UTF-8 out. Malformed input is decoded with U+FFFD substitution.
std::string fit_utf8(const StringWidth& width, std::string_view text, int target_width,
                     Side cut_side = Side::Left, Side pad_side = Side::Right,
                     char32_t pad_char = U' ');

} // namespace cellwidth
