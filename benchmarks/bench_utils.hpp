#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "storage/memory_table.hpp"

namespace prism::bench {

/**
 * @brief Table bench(id INTEGER, grp INTEGER, label VARCHAR)
 *
 * `grp` cycles through `groups` values and `label` is derived from it, so
 * projecting (grp, label) yields exactly `groups` distinct tuples.
 */
inline std::shared_ptr<MemoryTable> make_bench_table(int64_t rows, int64_t groups) {
    auto table = std::make_shared<MemoryTable>(
        "bench", std::vector<Column>{
                     Column("id", TypeId::INTEGER),
                     Column("grp", TypeId::INTEGER),
                     Column("label", TypeId::VARCHAR, 32),
                 });

    for (int64_t i = 0; i < rows; ++i) {
        const auto grp = static_cast<int32_t>(i % groups);
        Status status = table->insert_row({
            TupleValue(static_cast<int32_t>(i)),
            TupleValue(grp),
            TupleValue("group-" + std::to_string(grp)),
        });
        if (!status.ok()) {
            return nullptr;
        }
    }
    return table;
}

}  // namespace prism::bench
