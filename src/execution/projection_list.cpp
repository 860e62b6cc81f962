/**
 * @file projection_list.cpp
 * @brief ProjectionList binding
 */

#include "execution/projection_list.hpp"

#include "common/logger.hpp"
#include "common/status.hpp"
#include "execution/relation_iterator.hpp"

namespace prism {

Status ProjectionList::bind(const RelationIterator &source,
                            const std::vector<std::string> &names,
                            bool distinct, ProjectionList *out) {
  if (names.empty()) {
    return Status::InvalidArgument("Projection needs at least one column");
  }

  const Schema schema = source.schema();
  std::vector<ColumnView> columns;
  columns.reserve(names.size());

  for (const auto &name : names) {
    size_t idx = 0;
    PRISM_RETURN_IF_ERROR(schema.find_column(name, &idx));
    columns.emplace_back(&source, idx);
  }

  LOG_DEBUG("Bound {} projected columns (distinct={})", columns.size(),
            distinct);
  *out = ProjectionList(std::move(columns), distinct);
  return Status::Ok();
}

ProjectionList ProjectionList::all_of(const RelationIterator &source,
                                      bool distinct) {
  std::vector<ColumnView> columns;
  columns.reserve(source.column_count());
  for (size_t i = 0; i < source.column_count(); ++i) {
    columns.emplace_back(&source, i);
  }
  return ProjectionList(std::move(columns), distinct);
}

} // namespace prism
