#pragma once

/**
 * @file column_view.hpp
 * @brief Live view of one column of a relation iterator
 */

#include <cstddef>

#include "catalog/column.hpp"
#include "storage/value.hpp"

namespace prism {

class RelationIterator;

/**
 * @brief One projected column
 *
 * Holds the column's descriptor plus the iterator that produces it and
 * the column's index there. value() reads the source's current tuple on
 * every call; nothing is cached, so a view always reflects the source's
 * cursor. The source must outlive the view.
 */
class ColumnView {
public:
  /**
   * @throws std::invalid_argument if source is null
   * @throws std::out_of_range if index is not a column of source
   */
  ColumnView(const RelationIterator *source, size_t index);

  [[nodiscard]] const Column &column() const noexcept { return column_; }
  [[nodiscard]] const RelationIterator *source() const noexcept {
    return source_;
  }
  [[nodiscard]] size_t index() const noexcept { return index_; }

  /// Current value in the source's tuple
  [[nodiscard]] TupleValue value() const;

private:
  const RelationIterator *source_;
  size_t index_;
  Column column_;
};

} // namespace prism
