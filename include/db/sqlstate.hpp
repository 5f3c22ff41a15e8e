#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/idb_connection.hpp"
#include <format>
#include <string_view>

namespace pgtenant::sqlstate {

inline constexpr std::string_view kUniqueViolation     = "23505";
inline constexpr std::string_view kForeignKeyViolation = "23503";
inline constexpr std::string_view kDuplicateSchema     = "42P06";
inline constexpr std::string_view kInvalidSchemaName   = "3F000";

/**
 * @brief Map a PostgreSQL SQLSTATE to the tenancy error taxonomy
 */
[[nodiscard]] constexpr ErrorCode to_error_code(std::string_view state) {
    if (state == kUniqueViolation || state == kForeignKeyViolation) {
        return ErrorCode::INTEGRITY_VIOLATION;
    }
    if (state == kDuplicateSchema) return ErrorCode::SCHEMA_ALREADY_EXISTS;
    if (state == kInvalidSchemaName) return ErrorCode::SCHEMA_DOES_NOT_EXIST;
    // Class 08: connection exception
    if (state.size() == 5 && state.starts_with("08")) return ErrorCode::CONNECTION_ERROR;
    return ErrorCode::DATABASE_ERROR;
}

/**
 * @brief Build an error Result from a failed statement
 * @param what Short description of the statement, prefixed to the server message
 */
template<typename T = void>
[[nodiscard]] Result<T> failure(const DbResultSet& rs, std::string_view what) {
    return Result<T>::error(to_error_code(rs.sqlstate),
        std::format("{}: {}", what, utils::trim(rs.error_message)));
}

} // namespace pgtenant::sqlstate
