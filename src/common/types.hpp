#pragma once

/**
 * @file types.hpp
 * @brief Common type definitions for Prism
 */

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace prism {

// ─────────────────────────────────────────────────────────────────────────────
// Data Types
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief SQL data types understood by the iterators
 */
enum class TypeId : uint8_t {
    INVALID = 0,
    BOOLEAN,
    TINYINT,    // 1 byte
    SMALLINT,   // 2 bytes
    INTEGER,    // 4 bytes
    BIGINT,     // 8 bytes
    FLOAT,      // 4 bytes
    DOUBLE,     // 8 bytes
    VARCHAR,    // Variable-length string
};

/**
 * @brief Get the size in bytes for a fixed-size type
 * @return Size in bytes, or 0 for variable-length types
 */
constexpr size_t type_size(TypeId type) noexcept {
    switch (type) {
        case TypeId::BOOLEAN:   return 1;
        case TypeId::TINYINT:   return 1;
        case TypeId::SMALLINT:  return 2;
        case TypeId::INTEGER:   return 4;
        case TypeId::BIGINT:    return 8;
        case TypeId::FLOAT:     return 4;
        case TypeId::DOUBLE:    return 8;
        case TypeId::VARCHAR:   return 0;  // Variable length
        default:                return 0;
    }
}

/**
 * @brief Check if a type is variable-length
 */
constexpr bool is_variable_length(TypeId type) noexcept {
    return type == TypeId::VARCHAR;
}

/**
 * @brief SQL spelling of a type, used in log and error messages
 */
constexpr std::string_view type_name(TypeId type) noexcept {
    switch (type) {
        case TypeId::BOOLEAN:   return "BOOLEAN";
        case TypeId::TINYINT:   return "TINYINT";
        case TypeId::SMALLINT:  return "SMALLINT";
        case TypeId::INTEGER:   return "INTEGER";
        case TypeId::BIGINT:    return "BIGINT";
        case TypeId::FLOAT:     return "FLOAT";
        case TypeId::DOUBLE:    return "DOUBLE";
        case TypeId::VARCHAR:   return "VARCHAR";
        default:                return "INVALID";
    }
}

}  // namespace prism
