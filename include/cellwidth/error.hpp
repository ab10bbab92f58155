#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cellwidth {

/**
 * Error reporting for the width engine
 * Contract violations throw; malformed input and unknown versions are
 * recoverable and go through the warning channel instead (see warning.hpp).
 */

enum class ErrorCode {
    // General errors
    INVALID_ARGUMENT = 1,
    INVALID_RANGE = 2,

    // Table store errors
    UNKNOWN_VERSION = 100,

    // Internal errors
    INTERNAL_ERROR = 500
};

class CellwidthException : public std::runtime_error {
public:
    explicit CellwidthException(ErrorCode code, const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "cellwidth error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
class InvalidArgumentError : public CellwidthException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : CellwidthException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// start > end, or a bound past the end of the buffer
class InvalidRangeError : public CellwidthException {
public:
    InvalidRangeError(size_t start, size_t end, size_t length,
                      const std::string& context = "")
        : CellwidthException(ErrorCode::INVALID_RANGE,
                             "invalid range (" + std::to_string(start) + ", " + std::to_string(end) +
                                 ") for length " + std::to_string(length),
                             context,
                             "start must not exceed end, and end must not exceed the length")
        , start_(start)
        , end_(end) {}

    size_t start() const noexcept { return start_; }
    size_t end() const noexcept { return end_; }

private:
    size_t start_;
    size_t end_;
};

class TableLookupError : public CellwidthException {
public:
    explicit TableLookupError(const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : CellwidthException(ErrorCode::UNKNOWN_VERSION, message, context, suggestion) {}
};

// Error handling utilities
class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }

    static void check_range(size_t start, size_t end, size_t length,
                            const std::string& context = "") {
        if (start > end || end > length) {
            throw InvalidRangeError(start, end, length, context);
        }
    }
};

// Macros for common error checking
#define CELLWIDTH_CHECK_ARGUMENT(condition, message) \
    cellwidth::ErrorHandler::check_argument(condition, message, __func__)

#define CELLWIDTH_CHECK_RANGE(start, end, length) \
    cellwidth::ErrorHandler::check_range(start, end, length, __func__)

#define CELLWIDTH_THROW(code, message) \
    throw cellwidth::CellwidthException(code, message, __func__)

} // namespace cellwidth
