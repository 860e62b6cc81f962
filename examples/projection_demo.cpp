/**
 * @file projection_demo.cpp
 * @brief SELECT DISTINCT city, dept FROM employees, driven by hand
 */

#include <iostream>
#include <memory>

#include <prism/prism.hpp>

#include "common/logger.hpp"
#include "execution/projection_iterator.hpp"
#include "execution/table_scan_iterator.hpp"

namespace {

prism::Status load_employees(prism::MemoryTable* table) {
    struct Employee {
        int32_t id;
        const char* name;
        const char* city;
        const char* dept;
    };
    const Employee employees[] = {
        {1, "Ada", "London", "Engineering"},
        {2, "Grace", "New York", "Engineering"},
        {3, "Edsger", "London", "Engineering"},
        {4, "Barbara", "Boston", "Research"},
        {5, "Ken", "New York", "Engineering"},
        {6, "Frances", "Boston", "Research"},
    };

    for (const auto& e : employees) {
        PRISM_RETURN_IF_ERROR(table->insert_row({
            prism::TupleValue(e.id),
            prism::TupleValue(e.name),
            prism::TupleValue(e.city),
            prism::TupleValue(e.dept),
        }));
    }
    return prism::Status::Ok();
}

}  // namespace

int main() {
    std::cout << "Prism v" << prism::version() << "\n\n";
    prism::Logger::init("prism", spdlog::level::debug);

    try {
        auto table = std::make_shared<prism::MemoryTable>(
            "employees", std::vector<prism::Column>{
                             prism::Column("id", prism::TypeId::INTEGER),
                             prism::Column("name", prism::TypeId::VARCHAR, 64),
                             prism::Column("city", prism::TypeId::VARCHAR, 64),
                             prism::Column("dept", prism::TypeId::VARCHAR, 64),
                         });

        auto status = load_employees(table.get());
        if (!status.ok()) {
            std::cerr << "Load failed: " << status.to_string() << "\n";
            return 1;
        }

        auto scan = std::make_unique<prism::TableScanIterator>(table);
        prism::ProjectionList list;
        status = prism::ProjectionList::bind(*scan, {"city", "employees.dept"},
                                             /*distinct=*/true, &list);
        if (!status.ok()) {
            std::cerr << "Bind failed: " << status.to_string() << "\n";
            return 1;
        }

        prism::ProjectionIterator projection(std::move(list), std::move(scan));

        for (size_t i = 0; i < projection.column_count(); ++i) {
            std::cout << (i == 0 ? "" : " | ") << projection.column(i).name();
        }
        std::cout << "\n";

        bool has_tuple = false;
        while ((status = projection.advance(&has_tuple)).ok() && has_tuple) {
            for (size_t i = 0; i < projection.column_count(); ++i) {
                std::cout << (i == 0 ? "" : " | ")
                          << projection.column_value(i).to_string();
            }
            std::cout << "\n";
        }
        if (!status.ok()) {
            std::cerr << "Query failed: " << status.to_string() << "\n";
            return 1;
        }

        std::cout << "\n" << projection.tuple_count() << " tuple(s), "
                  << projection.duplicates_skipped() << " duplicate(s) skipped\n";

        status = projection.close();
        if (!status.ok()) {
            std::cerr << "Close failed: " << status.to_string() << "\n";
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    prism::Logger::shutdown();
    return 0;
}
