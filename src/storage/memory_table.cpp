/**
 * @file memory_table.cpp
 * @brief MemoryTable implementation
 */

#include "storage/memory_table.hpp"

#include <fmt/format.h>

#include "common/config.hpp"
#include "common/logger.hpp"

namespace prism {

namespace {

std::vector<Column> stamp_table(const std::string &table,
                                std::vector<Column> columns) {
  for (auto &col : columns) {
    if (col.table().empty()) {
      col.set_table(table);
    }
  }
  return columns;
}

} // namespace

MemoryTable::MemoryTable(std::string name, std::vector<Column> columns)
    : name_(std::move(name)),
      schema_(stamp_table(name_, std::move(columns))) {}

Status MemoryTable::insert_row(Row row) {
  if (row.size() != schema_.column_count()) {
    return Status::InvalidArgument(
        fmt::format("Table {} expects {} values, got {}", name_,
                    schema_.column_count(), row.size()));
  }

  for (size_t i = 0; i < row.size(); ++i) {
    const Column &col = schema_.column(i);
    const TupleValue &val = row[i];

    if (val.is_null()) {
      if (!col.is_nullable()) {
        return Status::InvalidArgument(
            fmt::format("NULL value for NOT NULL column {}",
                        col.qualified_name()));
      }
      continue;
    }

    if (!val.matches_type(col.type())) {
      return Status::InvalidArgument(
          fmt::format("Value {} does not match type {} of column {}",
                      val.to_string(), type_name(col.type()),
                      col.qualified_name()));
    }

    if (col.type() == TypeId::VARCHAR) {
      const size_t limit =
          col.length() > 0 ? col.length() : config::kMaxVarcharLength;
      if (val.as_string().size() > limit) {
        return Status::InvalidArgument(
            fmt::format("Value too long for column {} ({} > {})",
                        col.qualified_name(), val.as_string().size(), limit));
      }
    }
  }

  rows_.push_back(std::move(row));
  LOG_TRACE("Inserted row {} into {}", rows_.size() - 1, name_);
  return Status::Ok();
}

} // namespace prism
