/**
 * @file relation_iterator.cpp
 * @brief Shared RelationIterator helpers
 */

#include "execution/relation_iterator.hpp"

#include <vector>

namespace prism {

Schema RelationIterator::schema() const {
  std::vector<Column> columns;
  columns.reserve(column_count());
  for (size_t i = 0; i < column_count(); ++i) {
    columns.push_back(column(i));
  }
  return Schema(std::move(columns));
}

} // namespace prism
