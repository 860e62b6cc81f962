#pragma once

/**
 * @file projection_list.hpp
 * @brief Column list of a SELECT, bound to the iterator it reads from
 */

#include <string>
#include <vector>

#include "execution/column_view.hpp"
#include "prism/status.hpp"

namespace prism {

class RelationIterator;

/**
 * @brief Ordered output columns plus the DISTINCT flag
 *
 * Columns may appear in any order, any subset, and more than once.
 * Statements other than SELECT build their list with distinct = false.
 */
class ProjectionList {
public:
  ProjectionList() = default;
  ProjectionList(std::vector<ColumnView> columns, bool distinct)
      : columns_(std::move(columns)), distinct_(distinct) {}

  /**
   * @brief Resolve column names against an iterator's columns
   * @param source Iterator the projection will read from
   * @param names Plain ("name") or qualified ("users.name") references
   * @param distinct Whether DISTINCT was specified
   * @param[out] out The bound list
   * @return Status::NotFound for an unknown name, Status::InvalidArgument
   *         for an ambiguous one or an empty list
   */
  [[nodiscard]] static Status bind(const RelationIterator &source,
                                   const std::vector<std::string> &names,
                                   bool distinct, ProjectionList *out);

  /// Every column of `source`, in order (SELECT DISTINCT *)
  [[nodiscard]] static ProjectionList all_of(const RelationIterator &source,
                                             bool distinct);

  [[nodiscard]] const std::vector<ColumnView> &columns() const noexcept {
    return columns_;
  }
  [[nodiscard]] size_t size() const noexcept { return columns_.size(); }
  [[nodiscard]] bool distinct() const noexcept { return distinct_; }

private:
  std::vector<ColumnView> columns_;
  bool distinct_ = false;
};

} // namespace prism
