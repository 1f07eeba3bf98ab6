#pragma once

#include <optional>
#include <string>

namespace codeauditor {

/**
 * @brief Error categories surfaced at the service boundary
 *
 * Compile failures and timeouts are NOT errors: they are verdicts and
 * travel as data inside an AuditRecord.
 */
enum class ErrorCategory {
    NONE,
    INVALID_INPUT,
    NOT_FOUND,
    INFRASTRUCTURE_ERROR,
    STORAGE_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                 return "NONE";
        case ErrorCategory::INVALID_INPUT:        return "INVALID_INPUT";
        case ErrorCategory::NOT_FOUND:            return "NOT_FOUND";
        case ErrorCategory::INFRASTRUCTURE_ERROR: return "INFRASTRUCTURE_ERROR";
        case ErrorCategory::STORAGE_ERROR:        return "STORAGE_ERROR";
        case ErrorCategory::INTERNAL_ERROR:       return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
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

} // namespace codeauditor
