#pragma once

/**
 * @file projection_iterator.hpp
 * @brief Projection iterator - SELECT [DISTINCT] col, ... over a subrelation
 */

#include <memory>
#include <string>
#include <vector>

#include "execution/distinct_key.hpp"
#include "execution/projection_list.hpp"
#include "execution/relation_iterator.hpp"

namespace prism {

/**
 * @brief Projection iterator
 *
 * Wraps a child iterator (the subrelation) and exposes only the columns
 * of its projection list, in list order. Values are read through the
 * list's column views, so nothing is copied or materialized.
 *
 * With DISTINCT, tuples whose projected values equal those of a tuple
 * already returned are skipped inside advance(). The key of every
 * returned tuple is kept until the iterator is destroyed: DISTINCT over
 * a large result holds one key per distinct row in memory.
 */
class ProjectionIterator : public RelationIterator {
public:
  /**
   * @brief Construct a projection iterator
   * @param projection Output columns and DISTINCT flag
   * @param subrel Iterator providing tuples; owned by the projection
   * @throws std::invalid_argument if subrel is null, the projection is
   *         empty or wider than config::kMaxProjectionColumns, or a column
   *         view reads from an iterator outside the subrelation's chain.
   *         A rejected subrelation is closed before the throw.
   */
  ProjectionIterator(ProjectionList projection,
                     std::unique_ptr<RelationIterator> subrel);

  /**
   * @brief Advance to the next tuple that is not a duplicate
   *
   * Once the subrelation is exhausted every later call reports false
   * without touching it again. Errors from the subrelation are returned
   * as-is and leave the iterator unpositioned.
   */
  [[nodiscard]] Status advance(bool *has_tuple) override;

  /**
   * @brief Close the subrelation and return its status unchanged
   *
   * The iterator is closed afterwards even if the subrelation failed.
   */
  [[nodiscard]] Status close() override;

  [[nodiscard]] size_t column_count() const override {
    return columns_.size();
  }
  [[nodiscard]] const Column &column(size_t idx) const override;
  [[nodiscard]] TupleValue column_value(size_t idx) const override;
  [[nodiscard]] size_t tuple_count() const override { return num_tuples_; }
  [[nodiscard]] bool is_positioned() const override {
    return state_ == State::kPositioned;
  }
  [[nodiscard]] const RelationIterator *child() const override {
    return subrel_.get();
  }

  [[nodiscard]] bool is_distinct() const noexcept { return check_distinct_; }

  /// Select list as written, e.g. "DISTINCT t.name, t.id"; used in log lines
  [[nodiscard]] const std::string &description() const noexcept {
    return description_;
  }

  /// Subrelation tuples dropped as duplicates so far
  [[nodiscard]] size_t duplicates_skipped() const noexcept {
    return duplicates_skipped_;
  }

  /// Keys held by the DISTINCT set (0 without DISTINCT)
  [[nodiscard]] size_t distinct_key_count() const noexcept {
    return visited_.size();
  }

private:
  enum class State { kUnpositioned, kPositioned, kExhausted, kClosed };

  [[nodiscard]] bool reads_from_subrel(const ColumnView &view) const;
  [[noreturn]] void reject(const std::string &reason);

  std::vector<ColumnView> columns_;
  std::unique_ptr<RelationIterator> subrel_;
  bool check_distinct_;
  size_t num_tuples_ = 0;
  size_t duplicates_skipped_ = 0;
  DistinctKeySet visited_;
  State state_ = State::kUnpositioned;
  std::string description_;
};

} // namespace prism
