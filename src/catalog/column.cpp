/**
 * @file column.cpp
 * @brief Column implementation
 */

#include "catalog/column.hpp"

namespace prism {

Column::Column(std::string name, TypeId type, size_t length)
    : Column(std::string(), std::move(name), type, length) {}

Column::Column(std::string table, std::string name, TypeId type, size_t length)
    : table_(std::move(table)), name_(std::move(name)), type_(type), length_(length) {
    // For fixed-size types, set length from type
    if (length_ == 0 && !is_variable_length(type)) {
        length_ = type_size(type);
    }
}

std::string Column::qualified_name() const {
    if (table_.empty()) {
        return name_;
    }
    return table_ + "." + name_;
}

}  // namespace prism
