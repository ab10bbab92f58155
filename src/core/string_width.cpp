#include "cellwidth/string_width.hpp"
#include "cellwidth/error.hpp"
#include "cellwidth/range_table.hpp"
#include "cellwidth/util/utf8.hpp"
#include "cellwidth/warning.hpp"

#include <utility>

namespace cellwidth {

StringWidth::StringWidth(const RangeTableStore& store, WidthOptions options)
    : classifier_(store)
    , resolver_(store)
    , options_(std::move(options)) {}

std::string StringWidth::resolved_version() const {
    return resolver_.resolve(options_.unicode_version, options_.auto_version);
}

int StringWidth::char_width(char32_t codepoint) const {
    return classifier_.char_width(codepoint, resolved_version());
}

size_t StringWidth::sum_widths(std::u32string_view codepoints,
                               const CharWidthClassifier::TableSet& tables) const {
    size_t total = 0;
    for (char32_t cp : codepoints) {
        total += static_cast<size_t>(classifier_.char_width(cp, tables));
    }
    return total;
}

size_t StringWidth::of(std::u32string_view text, size_t start, size_t end) const {
    if (text.empty()) {
        return 0;
    }
    if (end == npos) {
        end = text.size();
    }
    CELLWIDTH_CHECK_RANGE(start, end, text.size());
    if (start == end) {
        return 0;
    }

    auto tables = classifier_.tables(resolved_version());
    return sum_widths(text.substr(start, end - start), tables);
}

size_t StringWidth::of(std::string_view bytes, TextEncoding encoding,
                       size_t start, size_t end) const {
    if (bytes.empty()) {
        return 0;
    }
    if (end == npos) {
        end = bytes.size();
    }
    CELLWIDTH_CHECK_RANGE(start, end, bytes.size());
    if (start == end) {
        return 0;
    }

    std::string_view slice = bytes.substr(start, end - start);
    switch (encoding) {
        case TextEncoding::Utf8Bytes:
            return utf8_width(slice);

        case TextEncoding::FixedWidthBytes:
            return end - start;

        case TextEncoding::NativeText: {
            auto tables = classifier_.tables(resolved_version());
            size_t total = 0;
            for (char c : slice) {
                total += static_cast<size_t>(
                    classifier_.char_width(static_cast<unsigned char>(c), tables));
            }
            return total;
        }
    }
    CELLWIDTH_THROW(ErrorCode::INTERNAL_ERROR, "unhandled text encoding");
}

size_t StringWidth::utf8_width(std::string_view slice) const {
    auto tables = classifier_.tables(resolved_version());

    util::Utf8DecodeResult decoded = util::decode_utf8_strict(slice);
    if (decoded.ok) {
        return sum_widths(decoded.codepoints, tables);
    }

    report_warning(WarningKind::DecodeError,
                   "width of UTF-8 bytes can be incorrect due to a possible offset in the middle "
                   "of a character: invalid sequence at byte " +
                       std::to_string(decoded.error_offset) + " of " + std::to_string(slice.size()));

    size_t total = 0;
    size_t pos = 0;
    while (pos < slice.size()) {
        DecodedCodepoint d = util::decode_one(slice, pos);
        total += static_cast<size_t>(classifier_.char_width(d.value, tables));
        pos = d.next;
    }
    return total;
}

} // namespace cellwidth
