#pragma once

/**
 * @file schema.hpp
 * @brief Relation schema definition
 */

#include <string>
#include <string_view>
#include <vector>

#include "catalog/column.hpp"
#include "prism/status.hpp"

namespace prism {

/**
 * @brief Relation schema - the ordered columns of a table or iterator
 */
class Schema {
public:
    Schema() = default;
    explicit Schema(std::vector<Column> columns);

    [[nodiscard]] const std::vector<Column>& columns() const noexcept {
        return columns_;
    }

    [[nodiscard]] size_t column_count() const noexcept {
        return columns_.size();
    }

    [[nodiscard]] const Column& column(size_t idx) const {
        return columns_.at(idx);
    }

    /**
     * @brief Resolve a plain ("age") or qualified ("users.age") column name
     * @param name Column reference
     * @param[out] idx Index of the matching column
     * @return Status::NotFound if nothing matches, Status::InvalidArgument if
     *         a plain name matches columns of more than one table
     */
    [[nodiscard]] Status find_column(std::string_view name, size_t* idx) const;

private:
    std::vector<Column> columns_;
};

}  // namespace prism
