#pragma once

#include "cellwidth/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cellwidth {

/**
 * Binary search for a codepoint in a sorted, non-overlapping range table.
 * @param codepoint Unicode codepoint to look up
 * @param table Ranges ascending by start
 * @return 1 if some range contains the codepoint, else 0
 */
int range_contains(uint32_t codepoint, RangeTable table) noexcept;

/**
 * Source of the width tables.
 *
 * The classifier only talks to this interface, so tests can substitute
 * small synthetic tables for the full Unicode data.
 */
class RangeTableStore {
public:
    virtual ~RangeTableStore() = default;

    /**
     * Table for one tabulated version.
     * @throws TableLookupError if the version is not in versions()
     */
    virtual RangeTable lookup(TableName name, const std::string& version) const = 0;

    // Ascending; the last entry is "latest". Never empty.
    virtual const std::vector<std::string>& versions() const = 0;

    // Zero width regardless of version
    virtual bool is_always_zero_width(uint32_t codepoint) const = 0;
};

/**
 * The tables compiled into the library (Unicode 4.1.0 .. 17.0.0).
 */
class BuiltinTableStore : public RangeTableStore {
public:
    static const BuiltinTableStore& instance();

    RangeTable lookup(TableName name, const std::string& version) const override;
    const std::vector<std::string>& versions() const override { return versions_; }
    bool is_always_zero_width(uint32_t codepoint) const override;

private:
    BuiltinTableStore();
    BuiltinTableStore(const BuiltinTableStore&) = delete;
    BuiltinTableStore& operator=(const BuiltinTableStore&) = delete;

    std::vector<std::string> versions_;
};

} // namespace cellwidth
