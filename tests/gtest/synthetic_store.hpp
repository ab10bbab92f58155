// =============================================================================
// Small hand-written table store for tests that should not depend on the
// full Unicode data
// =============================================================================

#pragma once

#include "cellwidth/error.hpp"
#include "cellwidth/range_table.hpp"

#include <string>
#include <vector>

namespace cellwidth::test_support {

// Three versions. "2.0" widens 'W' and the 0x1000 block; "3.0" also makes
// 0x2000 zero-width.
class SyntheticStore : public RangeTableStore {
public:
    RangeTable lookup(TableName name, const std::string& version) const override {
        if (version == "1.0") {
            return name == TableName::Wide ? RangeTable(kWide1) : RangeTable(kZero1);
        }
        if (version == "2.0") {
            return name == TableName::Wide ? RangeTable(kWide2) : RangeTable(kZero1);
        }
        if (version == "3.0") {
            return name == TableName::Wide ? RangeTable(kWide2) : RangeTable(kZero3);
        }
        throw TableLookupError("unknown synthetic version " + version);
    }

    const std::vector<std::string>& versions() const override { return versions_; }

    bool is_always_zero_width(uint32_t codepoint) const override {
        return codepoint == 0 || codepoint == 'Z';
    }

private:
    static constexpr CodepointRange kWide1[] = {{0x1000, 0x100F}};
    static constexpr CodepointRange kWide2[] = {{'W', 'W'}, {0x1000, 0x10FF}};
    static constexpr CodepointRange kZero1[] = {{0x0300, 0x030F}};
    static constexpr CodepointRange kZero3[] = {{0x0300, 0x030F}, {0x2000, 0x2000}};

    std::vector<std::string> versions_{"1.0", "2.0", "3.0"};
};

} // namespace cellwidth::test_support
