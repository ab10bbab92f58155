#include "cellwidth/range_table.hpp"
#include "cellwidth/error.hpp"
#include "cellwidth/logging.hpp"
#include "../data/unicode_tables.hpp"

#include <algorithm>

namespace cellwidth {

int range_contains(uint32_t codepoint, RangeTable table) noexcept
{
    if (table.empty()) {
        return 0;
    }

    if (codepoint < table.front().start || codepoint > table.back().end) {
        return 0;
    }

    size_t lo = 0, hi = table.size();
    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        if (codepoint > table[mid].end) {
            lo = mid + 1;
        } else if (codepoint < table[mid].start) {
            hi = mid;
        } else {
            return 1;
        }
    }
    return 0;
}

// =============================================================================
// BuiltinTableStore
// =============================================================================

const BuiltinTableStore& BuiltinTableStore::instance() {
    static const BuiltinTableStore store;
    return store;
}

BuiltinTableStore::BuiltinTableStore() {
    auto tables = data::version_tables();
    versions_.reserve(tables.size());
    for (const auto& entry : tables) {
        versions_.emplace_back(entry.version);
    }
    LOG_DEBUG("Loaded width tables for ", versions_.size(), " Unicode versions, latest ",
              versions_.back());
}

RangeTable BuiltinTableStore::lookup(TableName name, const std::string& version) const {
    for (const auto& entry : data::version_tables()) {
        if (version == entry.version) {
            switch (name) {
                case TableName::Wide:      return entry.wide;
                case TableName::ZeroWidth: return entry.zero_width;
            }
        }
    }
    throw TableLookupError("no width table for Unicode version '" + version + "'",
                           __func__, "resolve the version with VersionResolver first");
}

bool BuiltinTableStore::is_always_zero_width(uint32_t codepoint) const {
    auto set = data::always_zero_width();
    return std::binary_search(set.begin(), set.end(), static_cast<char32_t>(codepoint));
}

} // namespace cellwidth
