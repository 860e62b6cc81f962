#pragma once

/**
 * @file table_scan_iterator.hpp
 * @brief Table scan iterator - walks every row of a MemoryTable
 */

#include <memory>
#include <optional>

#include "execution/relation_iterator.hpp"
#include "storage/memory_table.hpp"

namespace prism {

/**
 * @brief Sequential scan over a MemoryTable
 *
 * Rows are read in place; column_value() returns the value from the row
 * the cursor is on, so views over this iterator follow every advance.
 */
class TableScanIterator : public RelationIterator {
public:
  /**
   * @brief Construct a scan
   * @param table Table to scan; shared so the table outlives the scan
   * @throws std::invalid_argument if table is null
   */
  explicit TableScanIterator(std::shared_ptr<const MemoryTable> table);

  [[nodiscard]] Status advance(bool *has_tuple) override;
  [[nodiscard]] Status close() override;

  [[nodiscard]] size_t column_count() const override {
    return schema_.column_count();
  }
  [[nodiscard]] const Column &column(size_t idx) const override;
  [[nodiscard]] TupleValue column_value(size_t idx) const override;
  [[nodiscard]] size_t tuple_count() const override { return num_tuples_; }
  [[nodiscard]] bool is_positioned() const override {
    return current_.has_value();
  }

private:
  std::shared_ptr<const MemoryTable> table_;
  Schema schema_;
  size_t next_row_ = 0;
  std::optional<size_t> current_;
  size_t num_tuples_ = 0;
  bool closed_ = false;
};

} // namespace prism
