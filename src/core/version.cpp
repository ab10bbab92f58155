#include "cellwidth/version.hpp"
#include "cellwidth/range_table.hpp"
#include "cellwidth/types.hpp"
#include "cellwidth/warning.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace cellwidth {

std::optional<std::vector<int>> parse_version(const std::string& version) {
    std::vector<int> parts;
    size_t pos = 0;
    while (true) {
        size_t dot = version.find('.', pos);
        size_t stop = (dot == std::string::npos) ? version.size() : dot;
        if (stop == pos) {
            return std::nullopt;
        }

        long value = 0;
        for (size_t i = pos; i < stop; ++i) {
            unsigned char c = static_cast<unsigned char>(version[i]);
            if (!std::isdigit(c)) {
                return std::nullopt;
            }
            value = value * 10 + (c - '0');
            if (value > std::numeric_limits<int>::max()) {
                return std::nullopt;
            }
        }
        parts.push_back(static_cast<int>(value));

        if (dot == std::string::npos) {
            break;
        }
        pos = dot + 1;
    }
    return parts;
}

const std::string& VersionResolver::latest() const {
    return store_.versions().back();
}

const std::string& VersionResolver::earliest() const {
    return store_.versions().front();
}

std::string VersionResolver::resolve(const std::string& requested,
                                     const std::optional<std::string>& auto_override) const {
    std::string given = requested;
    if (given == constants::AUTO_VERSION) {
        given = auto_override.value_or(constants::LATEST_VERSION);
        // "auto" inside "auto" has nowhere left to look
        if (given == constants::AUTO_VERSION) {
            given = constants::LATEST_VERSION;
        }
    }

    if (given == constants::LATEST_VERSION) {
        return latest();
    }

    const auto& versions = store_.versions();
    if (std::find(versions.begin(), versions.end(), given) != versions.end()) {
        return given;
    }

    auto cmp_given = parse_version(given);
    if (!cmp_given) {
        report_warning(WarningKind::InvalidVersion,
                       "UNICODE_VERSION value, '" + given + "', is invalid. Value should be in form "
                       "of 'integer[.]+', the latest supported unicode version '" + latest() +
                       "' has been inferred.");
        return latest();
    }

    // Tabulated versions always parse; a store that says otherwise is treated
    // as having no lower bound to compare against.
    auto cmp_earliest = parse_version(earliest());
    if (cmp_earliest && *cmp_given <= *cmp_earliest) {
        report_warning(WarningKind::VersionTooLow,
                       "UNICODE_VERSION value, '" + given + "', is lower than any available "
                       "unicode version. Returning lowest version level, '" + earliest() + "'");
        return earliest();
    }

    for (size_t idx = 0; idx + 1 < versions.size(); ++idx) {
        auto cmp_next = parse_version(versions[idx + 1]);
        if (!cmp_next) {
            continue;
        }
        // "9" or "9.0" names the 9.0.0 table
        if (cmp_given->size() <= cmp_next->size() &&
            std::equal(cmp_given->begin(), cmp_given->end(), cmp_next->begin())) {
            return versions[idx + 1];
        }
        if (*cmp_next > *cmp_given) {
            return versions[idx];
        }
    }
    return latest();
}

} // namespace cellwidth
