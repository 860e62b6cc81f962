/**
 * @file projection_iterator_test.cpp
 * @brief Tests for ProjectionIterator
 */

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "execution/distinct_key.hpp"
#include "execution/projection_iterator.hpp"
#include "execution/table_scan_iterator.hpp"
#include "test_utils.hpp"

namespace prism {
namespace {

class ProjectionIteratorTest : public ::testing::Test {
protected:
  // Scripted subrelation over (id, name) rows; keeps a raw pointer for
  // inspecting call counts after ownership moves to the projection
  std::unique_ptr<test::ScriptedIterator>
  make_subrel(const std::vector<std::pair<int32_t, const char *>> &rows) {
    auto subrel = std::make_unique<test::ScriptedIterator>(
        test::id_name_columns(), test::id_name_rows(rows));
    subrel_ = subrel.get();
    return subrel;
  }

  std::unique_ptr<ProjectionIterator>
  make_projection(std::unique_ptr<test::ScriptedIterator> subrel,
                  const std::vector<size_t> &indices, bool distinct) {
    std::vector<ColumnView> columns;
    for (size_t idx : indices) {
      columns.emplace_back(subrel.get(), idx);
    }
    return std::make_unique<ProjectionIterator>(
        ProjectionList(std::move(columns), distinct), std::move(subrel));
  }

  // Drain the iterator, collecting the projected rows
  std::vector<Row> drain(ProjectionIterator &projection) {
    std::vector<Row> rows;
    bool has_tuple = false;
    while (true) {
      Status status = projection.advance(&has_tuple);
      EXPECT_TRUE(status.ok()) << status.to_string();
      if (!status.ok() || !has_tuple) {
        break;
      }
      Row row;
      for (size_t i = 0; i < projection.column_count(); ++i) {
        row.push_back(projection.column_value(i));
      }
      rows.push_back(std::move(row));
    }
    return rows;
  }

  test::ScriptedIterator *subrel_ = nullptr;
};

// ─────────────────────────────────────────────────────────────────────────────
// Basic Projection
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(ProjectionIteratorTest, KeepsDuplicatesWithoutDistinct) {
  auto projection =
      make_projection(make_subrel({{1, "a"}, {2, "b"}, {1, "a"}}), {0, 1}, false);

  bool has_tuple = false;
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(projection->advance(&has_tuple).ok());
    EXPECT_TRUE(has_tuple);
  }
  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  EXPECT_FALSE(has_tuple);

  EXPECT_EQ(projection->tuple_count(), 3u);
  EXPECT_EQ(projection->distinct_key_count(), 0u);
  EXPECT_FALSE(projection->is_distinct());
}

TEST_F(ProjectionIteratorTest, DistinctSkipsRepeatedRow) {
  auto projection =
      make_projection(make_subrel({{1, "a"}, {2, "b"}, {1, "a"}}), {0, 1}, true);

  bool has_tuple = false;
  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  ASSERT_TRUE(has_tuple);
  EXPECT_EQ(projection->column_value(0).as_integer(), 1);
  EXPECT_EQ(projection->column_value(1).as_string(), "a");

  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  ASSERT_TRUE(has_tuple);
  EXPECT_EQ(projection->column_value(0).as_integer(), 2);
  EXPECT_EQ(projection->column_value(1).as_string(), "b");

  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  EXPECT_FALSE(has_tuple);

  EXPECT_EQ(projection->tuple_count(), 2u);
  EXPECT_EQ(projection->duplicates_skipped(), 1u);
  EXPECT_EQ(projection->distinct_key_count(), 2u);
  EXPECT_EQ(projection->description(), "DISTINCT t.id, t.name");
}

TEST_F(ProjectionIteratorTest, DistinctAppliesAfterProjection) {
  auto projection =
      make_projection(make_subrel({{1, "x"}, {2, "x"}}), {1}, true);

  bool has_tuple = false;
  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  ASSERT_TRUE(has_tuple);
  EXPECT_EQ(projection->column_value(0).as_string(), "x");

  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  EXPECT_FALSE(has_tuple);
  EXPECT_EQ(projection->tuple_count(), 1u);
  EXPECT_EQ(subrel_->advance_calls(), 3u);
}

TEST_F(ProjectionIteratorTest, EmptySubrelation) {
  auto projection = make_projection(make_subrel({}), {0, 1}, true);

  bool has_tuple = true;
  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  EXPECT_FALSE(has_tuple);
  EXPECT_EQ(projection->tuple_count(), 0u);
}

TEST_F(ProjectionIteratorTest, NullSubrelationThrows) {
  EXPECT_THROW(
      { ProjectionIterator projection(ProjectionList({}, true), nullptr); },
      std::invalid_argument);
}

TEST_F(ProjectionIteratorTest, EmptyColumnListThrows) {
  EXPECT_THROW(
      {
        ProjectionIterator projection(ProjectionList({}, false),
                                      make_subrel({}));
      },
      std::invalid_argument);
}

TEST_F(ProjectionIteratorTest, RejectedConstructionClosesSubrelation) {
  size_t closes = 0;
  auto subrel = make_subrel({{1, "a"}});
  subrel->record_closes_in(&closes);

  EXPECT_THROW(
      {
        ProjectionIterator projection(ProjectionList({}, true),
                                      std::move(subrel));
      },
      std::invalid_argument);
  EXPECT_EQ(closes, 1u);
}

TEST_F(ProjectionIteratorTest, TooWideListThrowsEvenIfCloseFails) {
  size_t closes = 0;
  auto subrel = make_subrel({{1, "a"}});
  subrel->record_closes_in(&closes);
  subrel->fail_close_with(Status::IOError("handle close failed"));

  std::vector<ColumnView> columns(config::kMaxProjectionColumns + 1,
                                  ColumnView(subrel.get(), 0));
  EXPECT_THROW(
      {
        ProjectionIterator projection(
            ProjectionList(std::move(columns), false), std::move(subrel));
      },
      std::invalid_argument);
  EXPECT_EQ(closes, 1u);
}

TEST_F(ProjectionIteratorTest, ForeignColumnSourceThrows) {
  size_t closes = 0;
  auto other = std::make_unique<test::ScriptedIterator>(
      test::id_name_columns(), test::id_name_rows({{1, "a"}}));
  auto list = ProjectionList::all_of(*other, true);
  auto subrel = make_subrel({{2, "b"}});
  subrel->record_closes_in(&closes);

  EXPECT_THROW(
      { ProjectionIterator projection(std::move(list), std::move(subrel)); },
      std::invalid_argument);
  EXPECT_EQ(closes, 1u);
  EXPECT_EQ(other->advance_calls(), 0u);
  EXPECT_EQ(other->close_calls(), 0u);
}

TEST_F(ProjectionIteratorTest, ViewsBoundBelowSubrelationAreAccepted) {
  auto base = make_subrel({{1, "a"}, {2, "a"}, {1, "b"}, {1, "a"}});
  test::ScriptedIterator *base_ptr = base.get();
  auto inner = make_projection(std::move(base), {1, 0}, true);
  ASSERT_EQ(inner->child(), base_ptr);

  // Outer reads the id straight from the base scan under the inner projection
  std::vector<ColumnView> columns = {ColumnView(base_ptr, 0)};
  ProjectionIterator outer(ProjectionList(std::move(columns), false),
                           std::move(inner));

  auto rows = drain(outer);
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0][0].as_integer(), 1);
  EXPECT_EQ(rows[1][0].as_integer(), 2);
  EXPECT_EQ(rows[2][0].as_integer(), 1);
}

TEST_F(ProjectionIteratorTest, ReordersAndRepeatsColumns) {
  auto projection =
      make_projection(make_subrel({{7, "seven"}, {8, "eight"}}), {1, 0, 1},
                      false);

  ASSERT_EQ(projection->column_count(), 3u);
  EXPECT_EQ(projection->description(), "t.name, t.id, t.name");
  EXPECT_EQ(projection->column(0).name(), "name");
  EXPECT_EQ(projection->column(1).name(), "id");
  EXPECT_EQ(projection->column(2).name(), "name");

  auto rows = drain(*projection);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0], (Row{TupleValue("seven"), TupleValue(int32_t(7)),
                          TupleValue("seven")}));
  EXPECT_EQ(rows[1], (Row{TupleValue("eight"), TupleValue(int32_t(8)),
                          TupleValue("eight")}));
  EXPECT_EQ(projection->column_count(), 3u);
}

TEST_F(ProjectionIteratorTest, ValuesTrackSubrelationCursor) {
  auto projection =
      make_projection(make_subrel({{1, "a"}, {2, "b"}, {3, "c"}}), {0}, false);

  bool has_tuple = false;
  for (int32_t expected = 1; expected <= 3; ++expected) {
    ASSERT_TRUE(projection->advance(&has_tuple).ok());
    ASSERT_TRUE(has_tuple);
    EXPECT_EQ(projection->column_value(0), subrel_->column_value(0));
    EXPECT_EQ(projection->column_value(0).as_integer(), expected);
  }
}

// ─────────────────────────────────────────────────────────────────────────────
// Exhaustion and State
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(ProjectionIteratorTest, ExhaustionIsSticky) {
  auto projection = make_projection(make_subrel({{1, "a"}}), {0}, false);

  bool has_tuple = false;
  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  ASSERT_TRUE(has_tuple);
  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  ASSERT_FALSE(has_tuple);
  const size_t calls = subrel_->advance_calls();

  for (int i = 0; i < 3; ++i) {
    has_tuple = true;
    ASSERT_TRUE(projection->advance(&has_tuple).ok());
    EXPECT_FALSE(has_tuple);
  }
  EXPECT_EQ(subrel_->advance_calls(), calls);
  EXPECT_EQ(projection->tuple_count(), 1u);
}

TEST_F(ProjectionIteratorTest, ValueBeforeAdvanceThrows) {
  auto projection = make_projection(make_subrel({{1, "a"}}), {0}, false);
  EXPECT_FALSE(projection->is_positioned());
  EXPECT_THROW((void)projection->column_value(0), InvalidStateError);
}

TEST_F(ProjectionIteratorTest, ValueAfterExhaustionThrows) {
  auto projection = make_projection(make_subrel({}), {0}, false);
  bool has_tuple = false;
  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  EXPECT_THROW((void)projection->column_value(0), InvalidStateError);
}

TEST_F(ProjectionIteratorTest, BadIndexThrowsAndKeepsPosition) {
  auto projection =
      make_projection(make_subrel({{1, "a"}, {2, "b"}}), {1}, false);

  EXPECT_THROW((void)projection->column(1), std::out_of_range);

  bool has_tuple = false;
  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  EXPECT_THROW((void)projection->column_value(5), std::out_of_range);

  EXPECT_TRUE(projection->is_positioned());
  EXPECT_EQ(projection->column_value(0).as_string(), "a");
  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  EXPECT_EQ(projection->column_value(0).as_string(), "b");
}

// ─────────────────────────────────────────────────────────────────────────────
// Error Propagation
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(ProjectionIteratorTest, AdvanceErrorPropagatesUnchanged) {
  auto subrel = make_subrel({{1, "a"}, {2, "b"}});
  subrel->fail_advance_at(1, Status::Aborted("Deadlock detected"));
  auto projection = make_projection(std::move(subrel), {0}, false);

  bool has_tuple = false;
  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  ASSERT_TRUE(has_tuple);

  Status status = projection->advance(&has_tuple);
  EXPECT_EQ(status, Status::Aborted("Deadlock detected"));
  EXPECT_FALSE(has_tuple);
  EXPECT_FALSE(projection->is_positioned());
  EXPECT_EQ(projection->tuple_count(), 1u);
}

TEST_F(ProjectionIteratorTest, ErrorWhileSkippingDuplicates) {
  auto subrel = make_subrel({{1, "a"}, {1, "a"}, {1, "a"}});
  subrel->fail_advance_at(2, Status::IOError("read failed"));
  auto projection = make_projection(std::move(subrel), {0, 1}, true);

  bool has_tuple = false;
  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  ASSERT_TRUE(has_tuple);

  Status status = projection->advance(&has_tuple);
  EXPECT_TRUE(status.is_io_error());
  EXPECT_EQ(status.message(), "read failed");
  EXPECT_EQ(projection->duplicates_skipped(), 1u);
}

TEST_F(ProjectionIteratorTest, CloseDelegatesToSubrelation) {
  auto projection = make_projection(make_subrel({{1, "a"}}), {0}, false);
  EXPECT_TRUE(projection->close().ok());
  EXPECT_EQ(subrel_->close_calls(), 1u);
}

TEST_F(ProjectionIteratorTest, CloseErrorPropagatesUnchanged) {
  auto subrel = make_subrel({{1, "a"}});
  subrel->fail_close_with(Status::IOError("handle close failed"));
  auto projection = make_projection(std::move(subrel), {0}, false);

  EXPECT_EQ(projection->close(), Status::IOError("handle close failed"));
  EXPECT_EQ(subrel_->close_calls(), 1u);
}

TEST_F(ProjectionIteratorTest, OperationsAfterCloseAreRejected) {
  auto projection =
      make_projection(make_subrel({{1, "a"}, {2, "b"}}), {0}, false);

  bool has_tuple = false;
  ASSERT_TRUE(projection->advance(&has_tuple).ok());
  ASSERT_TRUE(projection->close().ok());

  EXPECT_TRUE(projection->advance(&has_tuple).is_invalid_state());
  EXPECT_FALSE(has_tuple);
  EXPECT_THROW((void)projection->column_value(0), InvalidStateError);
  EXPECT_TRUE(projection->close().is_invalid_state());
  EXPECT_EQ(subrel_->close_calls(), 1u);
}

// ─────────────────────────────────────────────────────────────────────────────
// Keys and Larger Inputs
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(ProjectionIteratorTest, SeparatorInsideValuesDoesNotCollide) {
  // Naively joined with '|' both rows would read "a|b||"
  std::vector<Column> columns = {Column("l", TypeId::VARCHAR, 8),
                                 Column("r", TypeId::VARCHAR, 8)};
  std::vector<Row> rows = {{TupleValue("a|"), TupleValue("b|")},
                           {TupleValue("a"), TupleValue("|b|")}};
  auto subrel =
      std::make_unique<test::ScriptedIterator>(columns, std::move(rows));
  auto list = ProjectionList::all_of(*subrel, true);
  ProjectionIterator projection(std::move(list), std::move(subrel));

  EXPECT_EQ(drain(projection).size(), 2u);
}

TEST_F(ProjectionIteratorTest, NullsCompareEqualUnderDistinct) {
  std::vector<Row> rows = {{TupleValue(int32_t(1)), TupleValue()},
                           {TupleValue(int32_t(2)), TupleValue()},
                           {TupleValue(int32_t(3)), TupleValue("")}};
  auto subrel = std::make_unique<test::ScriptedIterator>(
      test::id_name_columns(), std::move(rows));
  std::vector<ColumnView> columns = {ColumnView(subrel.get(), 1)};
  ProjectionIterator projection(ProjectionList(std::move(columns), true),
                                std::move(subrel));

  auto out = drain(projection);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_TRUE(out[0][0].is_null());
  EXPECT_EQ(out[1][0].as_string(), "");
}

TEST_F(ProjectionIteratorTest, LongDuplicateRunDoesNotRecurse) {
  constexpr int32_t kRows = 200000;
  auto table = std::make_shared<MemoryTable>(
      "t", std::vector<Column>{Column("k", TypeId::INTEGER)});
  for (int32_t i = 0; i < kRows; ++i) {
    ASSERT_TRUE(table->insert_row({TupleValue(int32_t(i == kRows - 1))}).ok());
  }

  auto scan = std::make_unique<TableScanIterator>(table);
  auto list = ProjectionList::all_of(*scan, true);
  ProjectionIterator projection(std::move(list), std::move(scan));

  auto rows = drain(projection);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0][0].as_integer(), 0);
  EXPECT_EQ(rows[1][0].as_integer(), 1);
  EXPECT_EQ(projection.duplicates_skipped(), static_cast<size_t>(kRows - 2));
}

TEST_F(ProjectionIteratorTest, CountsMatchDistinctCombinations) {
  auto table = std::make_shared<MemoryTable>(
      "t", std::vector<Column>{Column("a", TypeId::INTEGER),
                               Column("b", TypeId::INTEGER),
                               Column("c", TypeId::VARCHAR, 8)});
  std::set<std::pair<int32_t, std::string>> expected;
  for (int32_t i = 0; i < 500; ++i) {
    const int32_t a = i % 7;
    const std::string c = std::to_string(i % 5);
    ASSERT_TRUE(
        table->insert_row({TupleValue(a), TupleValue(i), TupleValue(c)}).ok());
    expected.emplace(a, c);
  }

  for (bool distinct : {false, true}) {
    auto scan = std::make_unique<TableScanIterator>(table);
    ProjectionList list;
    ASSERT_TRUE(ProjectionList::bind(*scan, {"a", "c"}, distinct, &list).ok());
    ProjectionIterator projection(std::move(list), std::move(scan));

    auto rows = drain(projection);
    if (!distinct) {
      EXPECT_EQ(rows.size(), 500u);
      EXPECT_EQ(projection.tuple_count(), 500u);
      continue;
    }

    EXPECT_EQ(rows.size(), expected.size());
    EXPECT_EQ(projection.tuple_count(), expected.size());
    std::set<std::string> keys;
    for (const auto &row : rows) {
      EXPECT_TRUE(keys.insert(encode_distinct_key(row)).second);
    }
  }
}

TEST_F(ProjectionIteratorTest, StacksOverAnotherProjection) {
  auto inner = make_projection(
      make_subrel({{1, "a"}, {2, "a"}, {1, "b"}, {1, "a"}}), {1, 0}, true);
  // Inner yields (a,1) (a,2) (b,1); outer projects the name column
  ProjectionList list;
  ASSERT_TRUE(ProjectionList::bind(*inner, {"t.name"}, true, &list).ok());
  ProjectionIterator outer(std::move(list), std::move(inner));

  auto rows = drain(outer);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0][0].as_string(), "a");
  EXPECT_EQ(rows[1][0].as_string(), "b");

  EXPECT_TRUE(outer.close().ok());
  EXPECT_EQ(subrel_->close_calls(), 1u);
}

} // namespace
} // namespace prism
