/**
 * @file projection_benchmark.cpp
 * @brief Benchmarks for projection with and without DISTINCT
 */

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>

#include <prism/prism.hpp>

#include "bench_utils.hpp"
#include "execution/projection_iterator.hpp"
#include "execution/table_scan_iterator.hpp"
#include "sqlite_utils.hpp"

namespace {

void SkipWithStatus(benchmark::State &state, const prism::Status &status) {
    const std::string message = status.to_string();
    state.SkipWithError(message.c_str());
}

static void RunProjection(benchmark::State &state, bool distinct) {
    const int64_t rows = state.range(0);
    const int64_t groups = state.range(1);

    auto table = prism::bench::make_bench_table(rows, groups);
    if (!table) {
        state.SkipWithError("failed to build bench table");
        return;
    }

    int64_t produced = 0;
    for (auto _ : state) {
        auto scan = std::make_unique<prism::TableScanIterator>(table);
        prism::ProjectionList list;
        auto status = prism::ProjectionList::bind(*scan, {"grp", "label"}, distinct, &list);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }

        prism::ProjectionIterator projection(std::move(list), std::move(scan));
        bool has_tuple = false;
        while ((status = projection.advance(&has_tuple)).ok() && has_tuple) {
            auto value = projection.column_value(0);
            benchmark::DoNotOptimize(value);
        }
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        produced = static_cast<int64_t>(projection.tuple_count());

        status = projection.close();
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
    }

    state.counters["output_rows"] = static_cast<double>(produced);
    state.SetItemsProcessed(state.iterations() * rows);
}

static void BM_Prism_Project(benchmark::State &state) {
    RunProjection(state, false);
}

static void BM_Prism_ProjectDistinct(benchmark::State &state) {
    RunProjection(state, true);
}

BENCHMARK(BM_Prism_Project)->Args({10000, 100})->Args({100000, 100});
BENCHMARK(BM_Prism_ProjectDistinct)
    ->Args({10000, 100})
    ->Args({100000, 100})
    ->Args({100000, 100000});

#ifdef PRISM_BENCH_HAS_SQLITE
static void BM_Sqlite_SelectDistinct(benchmark::State &state) {
    const int64_t rows = state.range(0);
    const int64_t groups = state.range(1);

    prism::bench::SqliteDb db;
    if (!db.ok()) {
        state.SkipWithError("sqlite3_open failed");
        return;
    }

    std::string error;
    if (!db.exec("CREATE TABLE bench (id INTEGER, grp INTEGER, label TEXT);", &error)) {
        state.SkipWithError(error.c_str());
        return;
    }
    if (!db.exec("BEGIN;", &error)) {
        state.SkipWithError(error.c_str());
        return;
    }

    for (int64_t i = 0; i < rows; ++i) {
        const int64_t grp = i % groups;
        const std::string sql = "INSERT INTO bench VALUES (" + std::to_string(i) + ", " +
                                std::to_string(grp) + ", 'group-" + std::to_string(grp) +
                                "');";
        if (!db.exec(sql, &error)) {
            state.SkipWithError(error.c_str());
            return;
        }
    }

    if (!db.exec("COMMIT;", &error)) {
        state.SkipWithError(error.c_str());
        return;
    }

    int64_t produced = 0;
    for (auto _ : state) {
        if (!db.count_rows("SELECT DISTINCT grp, label FROM bench;", &produced, &error)) {
            state.SkipWithError(error.c_str());
            return;
        }
    }

    state.counters["output_rows"] = static_cast<double>(produced);
    state.SetItemsProcessed(state.iterations() * rows);
}

BENCHMARK(BM_Sqlite_SelectDistinct)
    ->Args({10000, 100})
    ->Args({100000, 100})
    ->Args({100000, 100000});
#endif

}  // namespace
