#pragma once

#include <string>
#include <string_view>
#include <optional>

namespace querydesk {

/**
 * @brief Error categories reported by the client core
 */
enum class ErrorCategory {
    NONE,
    PARSE_ERROR,        // malformed descriptor
    VALIDATION_ERROR,   // bad connection fields, bad edit input, bad config
    NOT_FOUND,          // unknown connection name, missing database file
    UNAVAILABLE,        // no usable connection could be established
    CANCELED,           // caller requested cancellation
    TIMEOUT,            // statement or metadata call exceeded its deadline
    STATEMENT_ERROR,    // database rejected a statement
    INTERNAL_ERROR
};

[[nodiscard]] inline std::string_view error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:             return "none";
        case ErrorCategory::PARSE_ERROR:      return "parse_error";
        case ErrorCategory::VALIDATION_ERROR: return "validation_error";
        case ErrorCategory::NOT_FOUND:        return "not_found";
        case ErrorCategory::UNAVAILABLE:      return "unavailable";
        case ErrorCategory::CANCELED:         return "canceled";
        case ErrorCategory::TIMEOUT:          return "timeout";
        case ErrorCategory::STATEMENT_ERROR:  return "statement_error";
        case ErrorCategory::INTERNAL_ERROR:   return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Result type for operations that can fail
 *
 * The optional context carries the statement text for statement-level
 * failures (STATEMENT_ERROR, CANCELED, TIMEOUT raised by the engine).
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

    static Result error(ErrorCategory category, std::string message,
                        std::string context = {}) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        r.context_ = std::move(context);
        return r;
    }

    /// Re-wrap the failure of a Result with a different value type
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message(), other.context());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }
    const std::string& context() const { return context_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
    std::string context_;
};

} // namespace querydesk
