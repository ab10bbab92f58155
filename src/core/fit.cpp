#include "cellwidth/fit.hpp"
#include "cellwidth/error.hpp"
#include "cellwidth/string_width.hpp"
#include "cellwidth/util/utf8.hpp"

#include <vector>

namespace cellwidth {

std::u32string fit(const StringWidth& width, std::u32string_view text, int target_width,
                   Side cut_side, Side pad_side, char32_t pad_char) {
    CELLWIDTH_CHECK_ARGUMENT(target_width >= 0,
                             "target width must be non-negative, got " + std::to_string(target_width));
    const size_t target = static_cast<size_t>(target_width);

    const CharWidthClassifier& classifier = width.classifier();
    auto tables = classifier.tables(width.resolved_version());

    std::vector<int> widths;
    widths.reserve(text.size());
    size_t total = 0;
    for (char32_t cp : text) {
        int w = classifier.char_width(cp, tables);
        widths.push_back(w);
        total += static_cast<size_t>(w);
    }

    // Cut: walk in from the cut side until the remainder fits
    size_t begin = 0;
    size_t end = text.size();
    if (total > target) {
        if (cut_side == Side::Left) {
            while (total > target) {
                total -= static_cast<size_t>(widths[begin++]);
            }
        } else {
            while (total > target) {
                total -= static_cast<size_t>(widths[--end]);
            }
        }
    }
    std::u32string_view kept = text.substr(begin, end - begin);

    if (total >= target) {
        return std::u32string(kept);
    }

    // Pad: one allocation for the whole deficit
    int pad_width = classifier.char_width(pad_char, tables);
    CELLWIDTH_CHECK_ARGUMENT(pad_width > 0, "pad character has zero display width");
    size_t deficit = target - total;
    size_t count = (deficit + static_cast<size_t>(pad_width) - 1) / static_cast<size_t>(pad_width);

    std::u32string result;
    result.reserve(kept.size() + count);
    if (pad_side == Side::Left) {
        result.append(count, pad_char);
        result.append(kept);
    } else {
        result.append(kept);
        result.append(count, pad_char);
    }
    return result;
}

std::string fit_utf8(const StringWidth& width, std::string_view text, int target_width,
                     Side cut_side, Side pad_side, char32_t pad_char) {
    std::u32string decoded = util::decode_utf8_lossy(text);
    return util::encode_utf8(fit(width, decoded, target_width, cut_side, pad_side, pad_char));
}

} // namespace cellwidth
