/**
 * @file schema.cpp
 * @brief Schema implementation
 */

#include "catalog/schema.hpp"

namespace prism {

Schema::Schema(std::vector<Column> columns) : columns_(std::move(columns)) {}

Status Schema::find_column(std::string_view name, size_t* idx) const {
    std::string_view table;
    std::string_view column = name;

    const auto dot = name.find('.');
    if (dot != std::string_view::npos) {
        table = name.substr(0, dot);
        column = name.substr(dot + 1);
    }

    bool found = false;
    for (size_t i = 0; i < columns_.size(); ++i) {
        const Column& col = columns_[i];
        if (col.name() != column) {
            continue;
        }
        if (!table.empty() && col.table() != table) {
            continue;
        }
        if (found) {
            return Status::InvalidArgument("Ambiguous column reference: " + std::string(name));
        }
        found = true;
        *idx = i;
    }

    if (!found) {
        return Status::NotFound("Unknown column: " + std::string(name));
    }
    return Status::Ok();
}

}  // namespace prism
