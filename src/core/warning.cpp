#include "cellwidth/warning.hpp"
#include "cellwidth/logging.hpp"

#include <mutex>

namespace cellwidth {

namespace {

std::mutex& handler_mutex() {
    static std::mutex mutex;
    return mutex;
}

WarningHandler& installed_handler() {
    static WarningHandler handler;
    return handler;
}

} // namespace

const char* to_string(WarningKind kind) noexcept {
    switch (kind) {
        case WarningKind::DecodeError:    return "decode-error";
        case WarningKind::InvalidVersion: return "invalid-version";
        case WarningKind::VersionTooLow:  return "version-too-low";
    }
    return "unknown";
}

WarningHandler set_warning_handler(WarningHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex());
    WarningHandler previous = std::move(installed_handler());
    installed_handler() = std::move(handler);
    return previous;
}

void report_warning(WarningKind kind, const std::string& message) {
    LOG_WARN("[", to_string(kind), "] ", message);

    // Copy out so the handler runs without the lock held
    WarningHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex());
        handler = installed_handler();
    }
    if (handler) {
        handler(kind, message);
    }
}

} // namespace cellwidth
