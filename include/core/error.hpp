#pragma once

#include <optional>
#include <string>
#include <utility>

namespace sqlgate {

/**
 * @brief Error kinds surfaced at the operation boundary
 *
 * Every kind terminates a single request, never the process.
 */
enum class ErrorKind {
    NONE,
    CONFIGURATION_ERROR,    // No usable database path resolved
    NOT_FOUND,              // Table absent from catalog, or database file missing
    VALIDATION_ERROR,       // Bad identifier, disallowed query shape, denylisted keyword
    BOUNDS_ERROR,           // limit/offset outside the accepted range
    ENGINE_ERROR            // SQLite reported a failure on an accepted query
};

inline constexpr const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                return "none";
        case ErrorKind::CONFIGURATION_ERROR: return "configuration_error";
        case ErrorKind::NOT_FOUND:           return "not_found";
        case ErrorKind::VALIDATION_ERROR:    return "validation_error";
        case ErrorKind::BOUNDS_ERROR:        return "bounds_error";
        case ErrorKind::ENGINE_ERROR:        return "engine_error";
    }
    return "none";
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

    static Result error(ErrorKind kind, std::string message) {
        Result r;
        r.success_ = false;
        r.error_kind_ = kind;
        r.error_message_ = std::move(message);
        return r;
    }

    /**
     * @brief Re-wrap another result's error under this value type
     */
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_kind(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorKind error_kind() const { return error_kind_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorKind error_kind_ = ErrorKind::NONE;
    std::string error_message_;
};

} // namespace sqlgate
