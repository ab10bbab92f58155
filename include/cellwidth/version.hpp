#pragma once

#include <optional>
#include <string>
#include <vector>

namespace cellwidth {

class RangeTableStore;

/**
 * Parse "major[.minor[.patch...]]" into its integer components.
 * Returns nullopt for empty strings, empty components, or anything that is
 * not a plain run of decimal digits.
 */
std::optional<std::vector<int>> parse_version(const std::string& version);

/**
 * Maps a requested Unicode version onto one the table store actually has.
 *
 * Resolution never fails. Requests that cannot be honoured exactly fall back
 * to the nearest tabulated version, with a warning where the fallback is
 * not obvious (unparsable, or older than every table).
 */
class VersionResolver {
public:
    explicit VersionResolver(const RangeTableStore& store) : store_(store) {}

    /**
     * @param requested "auto", "latest", or a dotted version string
     * @param auto_override value used in place of "auto" (normally the
     *        UNICODE_VERSION setting); "latest" when absent
     * @return a member of store.versions()
     */
    std::string resolve(const std::string& requested,
                        const std::optional<std::string>& auto_override = std::nullopt) const;

    const std::string& latest() const;
    const std::string& earliest() const;

private:
    const RangeTableStore& store_;
};

} // namespace cellwidth
