#pragma once

#include "cellwidth/char_width.hpp"
#include "cellwidth/types.hpp"
#include "cellwidth/version.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace cellwidth {

class RangeTableStore;

/**
 * Sums per-codepoint widths over a slice of a buffer.
 *
 * start/end are code unit offsets (char32_t for native text, bytes for byte
 * buffers). end defaults to the buffer length.
 *
 * @throws InvalidRangeError if start > end or end > length
 */
class StringWidth {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    explicit StringWidth(const RangeTableStore& store, WidthOptions options = {});

    size_t of(std::u32string_view text, size_t start = 0, size_t end = npos) const;

    /**
     * Width of a byte buffer.
     *
     * Utf8Bytes: decoded strictly first. If that fails, a DecodeError warning
     * is reported and the slice is re-scanned one sequence (or one bad byte)
     * at a time; the result may then be off by the malformed bytes.
     * FixedWidthBytes: end - start, nothing is decoded.
     * NativeText: each byte is taken as one codepoint.
     */
    size_t of(std::string_view bytes, TextEncoding encoding,
              size_t start = 0, size_t end = npos) const;

    // Width of one codepoint under this object's configured version
    int char_width(char32_t codepoint) const;

    // The configured version, resolved (warnings are reported each call)
    std::string resolved_version() const;

    const WidthOptions& options() const noexcept { return options_; }
    const CharWidthClassifier& classifier() const noexcept { return classifier_; }

private:
    size_t sum_widths(std::u32string_view codepoints,
                      const CharWidthClassifier::TableSet& tables) const;
    size_t utf8_width(std::string_view slice) const;

    CharWidthClassifier classifier_;
    VersionResolver resolver_;
    WidthOptions options_;
};

} // namespace cellwidth
