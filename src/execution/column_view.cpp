/**
 * @file column_view.cpp
 * @brief ColumnView implementation
 */

#include "execution/column_view.hpp"

#include <stdexcept>

#include "execution/relation_iterator.hpp"

namespace prism {

namespace {

const RelationIterator *require_source(const RelationIterator *source) {
  if (source == nullptr) {
    throw std::invalid_argument("ColumnView requires a source iterator");
  }
  return source;
}

} // namespace

ColumnView::ColumnView(const RelationIterator *source, size_t index)
    : source_(require_source(source)), index_(index),
      column_(source->column(index)) {}

TupleValue ColumnView::value() const { return source_->column_value(index_); }

} // namespace prism
