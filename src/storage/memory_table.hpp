#pragma once

/**
 * @file memory_table.hpp
 * @brief Row-store table held entirely in memory
 *
 * Rows are kept in insertion order and never move once inserted, so a
 * scan sees them in the order they were added.
 */

#include <string>
#include <vector>

#include "catalog/schema.hpp"
#include "prism/status.hpp"
#include "storage/value.hpp"

namespace prism {

/**
 * @brief In-memory table - the base relation that scans iterate over
 */
class MemoryTable {
public:
  /**
   * @brief Construct an empty table
   * @param name Table name; stamped onto every column without a table
   * @param columns Column definitions in storage order
   */
  MemoryTable(std::string name, std::vector<Column> columns);

  /**
   * @brief Append a row
   * @param row Values in column order
   * @return Status::InvalidArgument if the arity, a value type, or a
   *         NOT NULL constraint does not match the schema
   */
  [[nodiscard]] Status insert_row(Row row);

  [[nodiscard]] const std::string &name() const noexcept { return name_; }
  [[nodiscard]] const Schema &schema() const noexcept { return schema_; }
  [[nodiscard]] size_t row_count() const noexcept { return rows_.size(); }

  /// Row at position `idx`; throws std::out_of_range
  [[nodiscard]] const Row &row(size_t idx) const { return rows_.at(idx); }

private:
  std::string name_;
  Schema schema_;
  std::vector<Row> rows_;
};

} // namespace prism
