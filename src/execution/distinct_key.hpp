#pragma once

/**
 * @file distinct_key.hpp
 * @brief Keys and key sets for duplicate elimination
 *
 * A DISTINCT key is the concatenation of the key encodings of a tuple's
 * projected values (see TupleValue::append_key). Every field is
 * type-tagged, length-prefixed and followed by a separator, so values
 * that themselves contain the separator cannot shift a field boundary:
 * two tuples share a key iff their values are pairwise equal.
 */

#include <string>
#include <unordered_set>
#include <vector>

#include "execution/column_view.hpp"

namespace prism {

/**
 * @brief Encode the current values of `columns` as one key
 * @param columns Projected columns, in output order
 * @param[out] key Overwritten with the encoding
 */
void encode_distinct_key(const std::vector<ColumnView> &columns,
                         std::string *key);

/// Convenience overload returning the key
[[nodiscard]] std::string encode_distinct_key(const Row &values);

/**
 * @brief Set of keys already emitted
 *
 * Grows by one key per distinct tuple and never shrinks: memory use is
 * proportional to the number of distinct tuples seen.
 */
class DistinctKeySet {
public:
  explicit DistinctKeySet(size_t reserve = 0);

  /**
   * @brief Record the current tuple of `columns`
   * @return true if the tuple had not been seen before
   */
  bool insert_current(const std::vector<ColumnView> &columns);

  [[nodiscard]] bool contains(const std::string &key) const {
    return keys_.count(key) != 0;
  }
  [[nodiscard]] size_t size() const noexcept { return keys_.size(); }

private:
  std::unordered_set<std::string> keys_;
  std::string scratch_;
};

} // namespace prism
