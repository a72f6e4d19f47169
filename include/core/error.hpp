#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace ormcost {

/**
 * @brief Error categories for the engine
 */
enum class ErrorCategory {
    NONE,
    INSTRUMENTATION_FAILURE,
    CONFIGURATION_ERROR,
    SCOPE_VIOLATION,
    INTERNAL_ERROR
};

inline constexpr const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                    return "none";
        case ErrorCategory::INSTRUMENTATION_FAILURE: return "instrumentation_failure";
        case ErrorCategory::CONFIGURATION_ERROR:     return "configuration_error";
        case ErrorCategory::SCOPE_VIOLATION:         return "scope_violation";
        case ErrorCategory::INTERNAL_ERROR:          return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Fatal setup error: the engine cannot run with the given hooks/config.
 *
 * The only error the engine ever throws to its host, and only from
 * construction.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace ormcost
