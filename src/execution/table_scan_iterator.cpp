/**
 * @file table_scan_iterator.cpp
 * @brief Table scan iterator implementation
 */

#include "execution/table_scan_iterator.hpp"

#include <stdexcept>

#include "common/logger.hpp"

namespace prism {

TableScanIterator::TableScanIterator(std::shared_ptr<const MemoryTable> table)
    : table_(std::move(table)) {
  if (!table_) {
    throw std::invalid_argument("TableScanIterator requires a table");
  }
  schema_ = table_->schema();
}

Status TableScanIterator::advance(bool *has_tuple) {
  if (closed_) {
    return Status::InvalidState("advance on closed table scan");
  }

  if (next_row_ >= table_->row_count()) {
    current_.reset();
    *has_tuple = false;
    return Status::Ok();
  }

  current_ = next_row_++;
  num_tuples_++;
  *has_tuple = true;
  return Status::Ok();
}

Status TableScanIterator::close() {
  if (closed_) {
    return Status::InvalidState("table scan already closed");
  }
  LOG_DEBUG("Closing scan of {} after {} tuples", table_->name(), num_tuples_);
  closed_ = true;
  current_.reset();
  table_.reset();
  return Status::Ok();
}

const Column &TableScanIterator::column(size_t idx) const {
  return schema_.column(idx);
}

TupleValue TableScanIterator::column_value(size_t idx) const {
  if (idx >= schema_.column_count()) {
    throw std::out_of_range("Column index out of range");
  }
  if (!current_) {
    throw InvalidStateError("table scan is not positioned on a tuple");
  }
  return table_->row(*current_)[idx];
}

} // namespace prism
