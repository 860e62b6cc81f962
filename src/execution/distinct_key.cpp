/**
 * @file distinct_key.cpp
 * @brief DISTINCT key encoding
 */

#include "execution/distinct_key.hpp"

namespace prism {

void encode_distinct_key(const std::vector<ColumnView> &columns,
                         std::string *key) {
  key->clear();
  for (const auto &col : columns) {
    col.value().append_key(key);
  }
}

std::string encode_distinct_key(const Row &values) {
  std::string key;
  for (const auto &val : values) {
    val.append_key(&key);
  }
  return key;
}

DistinctKeySet::DistinctKeySet(size_t reserve) {
  if (reserve > 0) {
    keys_.reserve(reserve);
  }
}

bool DistinctKeySet::insert_current(const std::vector<ColumnView> &columns) {
  // Encode into a reused buffer; only keys that are kept get copied
  encode_distinct_key(columns, &scratch_);
  if (keys_.count(scratch_) != 0) {
    return false;
  }
  keys_.insert(scratch_);
  return true;
}

} // namespace prism
