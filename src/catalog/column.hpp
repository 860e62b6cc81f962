#pragma once

/**
 * @file column.hpp
 * @brief Column metadata
 */

#include <string>

#include "common/types.hpp"

namespace prism {

/**
 * @brief Column definition in a relation schema
 *
 * A column knows the table it was declared in so that projections over
 * joined or nested relations can resolve qualified names.
 */
class Column {
public:
    Column(std::string name, TypeId type, size_t length = 0);
    Column(std::string table, std::string name, TypeId type, size_t length = 0);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& table() const noexcept { return table_; }
    [[nodiscard]] TypeId type() const noexcept { return type_; }
    [[nodiscard]] size_t length() const noexcept { return length_; }
    [[nodiscard]] bool is_nullable() const noexcept { return nullable_; }
    [[nodiscard]] bool is_primary_key() const noexcept { return primary_key_; }

    /// "table.name", or just "name" when the column has no table
    [[nodiscard]] std::string qualified_name() const;

    void set_table(std::string table) { table_ = std::move(table); }
    void set_nullable(bool nullable) noexcept { nullable_ = nullable; }

    /// A primary key column is implicitly NOT NULL
    void set_primary_key(bool primary_key) noexcept {
        primary_key_ = primary_key;
        if (primary_key) {
            nullable_ = false;
        }
    }

private:
    std::string table_;
    std::string name_;
    TypeId type_;
    size_t length_;
    bool nullable_ = true;
    bool primary_key_ = false;
};

}  // namespace prism
