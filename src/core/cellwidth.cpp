#include "cellwidth/cellwidth.hpp"

namespace cellwidth {

namespace {

WidthCalculator calculator_for(const std::string& version) {
    WidthOptions options;
    options.unicode_version = version;
    return WidthCalculator(std::move(options));
}

} // namespace

int width_of_char(char32_t codepoint, const std::string& version) {
    return calculator_for(version).char_width(codepoint);
}

size_t width_of_string(std::u32string_view text, size_t start, size_t end,
                       const std::string& version) {
    return calculator_for(version).string_width(text, start, end);
}

size_t width_of_string(std::string_view text, size_t start, size_t end,
                       const std::string& version) {
    return calculator_for(version).string_width(text, TextEncoding::Utf8Bytes, start, end);
}

std::u32string fit(std::u32string_view text, int length, Side cut_align, Side pad_align,
                   char32_t pad_char, const std::string& version) {
    return calculator_for(version).fit(text, length, cut_align, pad_align, pad_char);
}

std::string fit(std::string_view text, int length, Side cut_align, Side pad_align,
                char32_t pad_char, const std::string& version) {
    return calculator_for(version).fit_utf8(text, length, cut_align, pad_align, pad_char);
}

const std::vector<std::string>& supported_versions() {
    return BuiltinTableStore::instance().versions();
}

} // namespace cellwidth
