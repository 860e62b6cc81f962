/**
 * @file value.cpp
 * @brief TupleValue formatting and key encoding
 */

#include "storage/value.hpp"

#include <fmt/format.h>

#include <cmath>
#include <iterator>
#include <type_traits>

#include "common/config.hpp"

namespace prism {

namespace {

template <typename T>
std::string format_floating(T v) {
    if (std::isnan(v)) {
        return "nan";
    }
    // {} is the shortest representation that parses back to the same value
    return fmt::format("{}", v);
}

std::string text_form(const TupleValue::ValueType& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "NULL";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int8_t>) {
                return fmt::format("{}", static_cast<int>(v));
            } else if constexpr (std::is_floating_point_v<T>) {
                return format_floating(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

char type_tag(const TupleValue::ValueType& value) {
    // Indexed by variant alternative
    static constexpr char kTags[] = {'N', 'b', 't', 'h', 'i', 'l', 'f', 'd', 's'};
    static_assert(sizeof(kTags) == std::variant_size_v<TupleValue::ValueType>);
    return kTags[value.index()];
}

}  // namespace

bool TupleValue::matches_type(TypeId type) const noexcept {
    switch (type) {
        case TypeId::BOOLEAN:  return is_bool();
        case TypeId::TINYINT:  return is_tinyint();
        case TypeId::SMALLINT: return is_smallint();
        case TypeId::INTEGER:  return is_integer();
        case TypeId::BIGINT:   return is_bigint();
        case TypeId::FLOAT:    return is_float();
        case TypeId::DOUBLE:   return is_double();
        case TypeId::VARCHAR:  return is_string();
        default:               return false;
    }
}

std::string TupleValue::to_string() const {
    return text_form(value_);
}

void TupleValue::append_key(std::string* out) const {
    out->push_back(type_tag(value_));
    if (!is_null()) {
        const std::string text = text_form(value_);
        fmt::format_to(std::back_inserter(*out), "{}:", text.size());
        out->append(text);
    }
    out->push_back(config::kDistinctKeySeparator);
}

}  // namespace prism
