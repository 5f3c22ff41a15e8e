#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pgtenant {

/**
 * @brief Error codes surfaced by the tenancy layer
 */
enum class ErrorCode {
    NONE,
    INVALID_SCHEMA_NAME,
    CONTEXT_VIOLATION,
    SCHEMA_ALREADY_EXISTS,
    SCHEMA_DOES_NOT_EXIST,
    MIGRATION_FAILURE,
    INTEGRITY_VIOLATION,
    NOT_FOUND,
    TENANT_NOT_SAVED,
    DATABASE_ERROR,
    CONNECTION_ERROR,
    CONFIG_ERROR
};

[[nodiscard]] constexpr std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                  return "none";
        case ErrorCode::INVALID_SCHEMA_NAME:   return "invalid_schema_name";
        case ErrorCode::CONTEXT_VIOLATION:     return "context_violation";
        case ErrorCode::SCHEMA_ALREADY_EXISTS: return "schema_already_exists";
        case ErrorCode::SCHEMA_DOES_NOT_EXIST: return "schema_does_not_exist";
        case ErrorCode::MIGRATION_FAILURE:     return "migration_failure";
        case ErrorCode::INTEGRITY_VIOLATION:   return "integrity_violation";
        case ErrorCode::NOT_FOUND:             return "not_found";
        case ErrorCode::TENANT_NOT_SAVED:      return "tenant_not_saved";
        case ErrorCode::DATABASE_ERROR:        return "database_error";
        case ErrorCode::CONNECTION_ERROR:      return "connection_error";
        case ErrorCode::CONFIG_ERROR:          return "config_error";
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

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /**
     * @brief Carry the error of another result across a type boundary
     */
    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_code(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_code(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

using Status = Result<void>;

} // namespace pgtenant
