#pragma once

#include "cellwidth/types.hpp"

#include <span>

namespace cellwidth::data {

struct VersionTables {
    const char* version;
    RangeTable wide;
    RangeTable zero_width;
};

// Ascending by version
std::span<const VersionTables> version_tables() noexcept;

// Sorted ascending
std::span<const char32_t> always_zero_width() noexcept;

} // namespace cellwidth::data
