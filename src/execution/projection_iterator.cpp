/**
 * @file projection_iterator.cpp
 * @brief Projection iterator implementation
 */

#include "execution/projection_iterator.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/macros.hpp"

namespace prism {

namespace {

std::unique_ptr<RelationIterator>
require_subrel(std::unique_ptr<RelationIterator> subrel) {
  if (!subrel) {
    throw std::invalid_argument("ProjectionIterator requires a subrelation");
  }
  return subrel;
}

} // namespace

ProjectionIterator::ProjectionIterator(ProjectionList projection,
                                       std::unique_ptr<RelationIterator> subrel)
    : columns_(projection.columns()), subrel_(require_subrel(std::move(subrel))),
      check_distinct_(projection.distinct()),
      visited_(projection.distinct() ? config::kDefaultDistinctReserve : 0) {
  if (columns_.empty()) {
    reject("Projection needs at least one column");
  }
  if (columns_.size() > config::kMaxProjectionColumns) {
    reject("Projection has " + std::to_string(columns_.size()) +
           " columns, limit is " +
           std::to_string(config::kMaxProjectionColumns));
  }
  for (const ColumnView &view : columns_) {
    if (!reads_from_subrel(view)) {
      reject("Projection column '" + view.column().qualified_name() +
             "' is not bound to the subrelation");
    }
  }

  std::vector<std::string> names;
  names.reserve(columns_.size());
  for (const ColumnView &view : columns_) {
    names.push_back(view.column().qualified_name());
  }
  description_ = fmt::format("{}{}", check_distinct_ ? "DISTINCT " : "",
                             fmt::join(names, ", "));
  LOG_DEBUG("Opened projection [{}]", description_);
}

// Views may be bound to the subrelation or to any iterator it reads from
bool ProjectionIterator::reads_from_subrel(const ColumnView &view) const {
  for (const RelationIterator *it = subrel_.get(); it != nullptr;
       it = it->child()) {
    if (view.source() == it) {
      return true;
    }
  }
  return false;
}

void ProjectionIterator::reject(const std::string &reason) {
  Status status = subrel_->close();
  if (!status.ok()) {
    LOG_WARN("Closing subrelation of rejected projection failed: {}",
             status.to_string());
  }
  throw std::invalid_argument(reason);
}

Status ProjectionIterator::advance(bool *has_tuple) {
  *has_tuple = false;

  if (state_ == State::kClosed) {
    return Status::InvalidState("advance on closed projection");
  }
  if (state_ == State::kExhausted) {
    return Status::Ok();
  }

  // Loop rather than recurse: a long run of duplicates must not grow the stack
  while (true) {
    bool sub_has_tuple = false;
    Status status = subrel_->advance(&sub_has_tuple);
    if (!status.ok()) {
      state_ = State::kUnpositioned;
      return status;
    }

    if (!sub_has_tuple) {
      state_ = State::kExhausted;
      LOG_DEBUG("Projection [{}] exhausted after {} tuples ({} duplicates "
                "skipped)",
                description_, num_tuples_, duplicates_skipped_);
      return Status::Ok();
    }

    if (!check_distinct_ || visited_.insert_current(columns_)) {
      break;
    }

    duplicates_skipped_++;
    LOG_TRACE("Projection [{}] skipped duplicate ({} so far)", description_,
              duplicates_skipped_);
  }

  num_tuples_++;
  state_ = State::kPositioned;
  PRISM_ASSERT(!check_distinct_ || visited_.size() == num_tuples_,
               "one DISTINCT key per returned tuple");
  *has_tuple = true;
  return Status::Ok();
}

Status ProjectionIterator::close() {
  if (state_ == State::kClosed) {
    return Status::InvalidState("projection already closed");
  }
  state_ = State::kClosed;

  Status status = subrel_->close();
  if (!status.ok()) {
    LOG_WARN("Closing subrelation of projection [{}] failed: {}", description_,
             status.to_string());
  }
  LOG_DEBUG("Closed projection [{}]: {} tuples returned, {} distinct keys held",
            description_, num_tuples_, visited_.size());
  return status;
}

const Column &ProjectionIterator::column(size_t idx) const {
  return columns_.at(idx).column();
}

TupleValue ProjectionIterator::column_value(size_t idx) const {
  const ColumnView &col = columns_.at(idx);
  if (state_ != State::kPositioned) {
    throw InvalidStateError("projection is not positioned on a tuple");
  }
  return col.value();
}

} // namespace prism
