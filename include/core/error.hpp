#pragma once

#include <optional>
#include <string>
#include <utility>

namespace shapesql {

/**
 * @brief Error categories for shape conversion and its tooling
 */
enum class ErrorCategory {
    NONE,
    NOT_A_STRUCT,
    MULTIPLE_PRIMARY_KEYS,
    UNSUPPORTED_TYPE,
    MISSING_TYPE_INFO,
    INVALID_SHAPE_DOCUMENT,
    INCOMPATIBLE_CHANGE,
    NO_CHANGES,
    IO_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::NOT_A_STRUCT: return "NOT_A_STRUCT";
        case ErrorCategory::MULTIPLE_PRIMARY_KEYS: return "MULTIPLE_PRIMARY_KEYS";
        case ErrorCategory::UNSUPPORTED_TYPE: return "UNSUPPORTED_TYPE";
        case ErrorCategory::MISSING_TYPE_INFO: return "MISSING_TYPE_INFO";
        case ErrorCategory::INVALID_SHAPE_DOCUMENT: return "INVALID_SHAPE_DOCUMENT";
        case ErrorCategory::INCOMPATIBLE_CHANGE: return "INCOMPATIBLE_CHANGE";
        case ErrorCategory::NO_CHANGES: return "NO_CHANGES";
        case ErrorCategory::IO_ERROR: return "IO_ERROR";
        default: return "UNKNOWN";
    }
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

    // Re-tag an error from a Result of a different value type
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
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

} // namespace shapesql
