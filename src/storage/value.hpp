#pragma once

/**
 * @file value.hpp
 * @brief Column values and in-memory rows
 */

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "common/types.hpp"

namespace prism {

/**
 * @brief Represents a value that can be stored in a tuple column
 */
class TupleValue {
public:
    using ValueType = std::variant<
        std::monostate,  // NULL
        bool,
        int8_t,          // TINYINT
        int16_t,         // SMALLINT
        int32_t,         // INTEGER
        int64_t,         // BIGINT
        float,           // FLOAT
        double,          // DOUBLE
        std::string      // VARCHAR
    >;

    /// Construct a NULL value
    TupleValue() : value_(std::monostate{}) {}

    /// Construct from various types
    explicit TupleValue(bool v) : value_(v) {}
    explicit TupleValue(int8_t v) : value_(v) {}
    explicit TupleValue(int16_t v) : value_(v) {}
    explicit TupleValue(int32_t v) : value_(v) {}
    explicit TupleValue(int64_t v) : value_(v) {}
    explicit TupleValue(float v) : value_(v) {}
    explicit TupleValue(double v) : value_(v) {}
    explicit TupleValue(std::string v) : value_(std::move(v)) {}
    explicit TupleValue(const char* v) : value_(std::string(v)) {}

    /// Check if the value is NULL
    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::monostate>(value_);
    }

    /// Type checking methods
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(value_); }
    [[nodiscard]] bool is_tinyint() const noexcept { return std::holds_alternative<int8_t>(value_); }
    [[nodiscard]] bool is_smallint() const noexcept { return std::holds_alternative<int16_t>(value_); }
    [[nodiscard]] bool is_integer() const noexcept { return std::holds_alternative<int32_t>(value_); }
    [[nodiscard]] bool is_bigint() const noexcept { return std::holds_alternative<int64_t>(value_); }
    [[nodiscard]] bool is_float() const noexcept { return std::holds_alternative<float>(value_); }
    [[nodiscard]] bool is_double() const noexcept { return std::holds_alternative<double>(value_); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(value_); }

    /// Value retrieval methods
    [[nodiscard]] bool as_bool() const { return std::get<bool>(value_); }
    [[nodiscard]] int8_t as_tinyint() const { return std::get<int8_t>(value_); }
    [[nodiscard]] int16_t as_smallint() const { return std::get<int16_t>(value_); }
    [[nodiscard]] int32_t as_integer() const { return std::get<int32_t>(value_); }
    [[nodiscard]] int64_t as_bigint() const { return std::get<int64_t>(value_); }
    [[nodiscard]] float as_float() const { return std::get<float>(value_); }
    [[nodiscard]] double as_double() const { return std::get<double>(value_); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(value_); }

    /// Get the underlying variant
    [[nodiscard]] const ValueType& value() const noexcept { return value_; }

    /// Create null value
    static TupleValue null() { return TupleValue(); }

    /// Check whether a non-NULL value can be stored in a column of `type`
    [[nodiscard]] bool matches_type(TypeId type) const noexcept;

    /// Display form; NULL prints as "NULL"
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Append the DISTINCT key encoding of this value to `out`
     *
     * Encoding: one type tag character, the byte length of the text form,
     * ':', the text form, then the field separator. The text form is
     * locale-independent and round-trips (shortest representation for
     * floating point), so two values encode identically iff they are equal,
     * with two exceptions for floating point: every NaN encodes as the same
     * key, and 0.0 and -0.0 encode differently although they compare equal.
     */
    void append_key(std::string* out) const;

    /// Compare values
    bool operator==(const TupleValue& other) const { return value_ == other.value_; }
    bool operator!=(const TupleValue& other) const { return value_ != other.value_; }

private:
    ValueType value_;
};

/// One row of values, in column order
using Row = std::vector<TupleValue>;

}  // namespace prism
