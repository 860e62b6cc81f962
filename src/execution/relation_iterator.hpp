#pragma once

/**
 * @file relation_iterator.hpp
 * @brief Relation iterator interface
 *
 * A relation iterator is a pull-based cursor over the tuples of a
 * relation. Iterators nest: an operator iterator owns the iterator it
 * reads from and drives it through the same interface, so a plan tree
 * is a chain of RelationIterators rooted at a table scan.
 */

#include <cstddef>

#include "catalog/schema.hpp"
#include "common/macros.hpp"
#include "common/status.hpp"
#include "storage/value.hpp"

namespace prism {

/**
 * @brief Base class for all relation iterators
 *
 * Fallible cursor operations return Status; errors from a child are
 * handed back unchanged. Accessor misuse throws: std::out_of_range for a
 * bad column index and InvalidStateError when the iterator is not
 * positioned on a tuple. Not thread-safe.
 */
class RelationIterator {
public:
  RelationIterator() = default;
  virtual ~RelationIterator() = default;

  PRISM_DISALLOW_COPY_AND_MOVE(RelationIterator);

  /**
   * @brief Move to the next tuple
   * @param[out] has_tuple true if positioned on a new tuple, false once
   *             the relation is exhausted
   * @return Status::IOError on storage failure, Status::Aborted or
   *         Status::Busy on lock conflicts, Status::InvalidState after close
   */
  [[nodiscard]] virtual Status advance(bool *has_tuple) = 0;

  /**
   * @brief Release underlying resources. Call at most once.
   */
  [[nodiscard]] virtual Status close() = 0;

  [[nodiscard]] virtual size_t column_count() const = 0;

  /// Column descriptor; throws std::out_of_range on a bad index
  [[nodiscard]] virtual const Column &column(size_t idx) const = 0;

  /**
   * @brief Value of a column in the current tuple
   * @throws std::out_of_range if idx is invalid
   * @throws InvalidStateError if not positioned on a tuple
   */
  [[nodiscard]] virtual TupleValue column_value(size_t idx) const = 0;

  /// Number of tuples returned so far
  [[nodiscard]] virtual size_t tuple_count() const = 0;

  [[nodiscard]] virtual bool is_positioned() const = 0;

  /// Iterator this one reads from, or nullptr for a leaf such as a scan
  [[nodiscard]] virtual const RelationIterator *child() const {
    return nullptr;
  }

  /// Snapshot of the column descriptors, in order
  [[nodiscard]] Schema schema() const;
};

} // namespace prism
