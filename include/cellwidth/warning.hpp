#pragma once

#include <functional>
#include <string>
#include <utility>

namespace cellwidth {

/**
 * Recoverable conditions. None of these stop a computation; the caller still
 * gets a width (or a resolved version) back.
 */
enum class WarningKind {
    DecodeError,     // malformed UTF-8, width computed byte-wise
    InvalidVersion,  // unparsable version string, latest used
    VersionTooLow    // below every tabulated version, earliest used
};

const char* to_string(WarningKind kind) noexcept;

using WarningHandler = std::function<void(WarningKind, const std::string&)>;

// Install a handler that sees every warning after it is logged.
// Returns the previously installed handler (empty if none).
WarningHandler set_warning_handler(WarningHandler handler);

// Log at WARN and forward to the installed handler
void report_warning(WarningKind kind, const std::string& message);

// RAII handler installation, restores the previous handler on scope exit
class ScopedWarningHandler {
public:
    explicit ScopedWarningHandler(WarningHandler handler)
        : previous_(set_warning_handler(std::move(handler))) {}
    ~ScopedWarningHandler() { set_warning_handler(std::move(previous_)); }

    ScopedWarningHandler(const ScopedWarningHandler&) = delete;
    ScopedWarningHandler& operator=(const ScopedWarningHandler&) = delete;

private:
    WarningHandler previous_;
};

} // namespace cellwidth
