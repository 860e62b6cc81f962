#pragma once

#ifdef PRISM_BENCH_HAS_SQLITE

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace prism::bench {

class SqliteDb {
public:
    explicit SqliteDb(const std::string &path = ":memory:") {
        if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    ~SqliteDb() {
        if (db_ != nullptr) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    SqliteDb(const SqliteDb &) = delete;
    SqliteDb &operator=(const SqliteDb &) = delete;

    bool ok() const noexcept { return db_ != nullptr; }

    bool exec(const std::string &sql, std::string *error) {
        if (db_ == nullptr) {
            if (error != nullptr) {
                *error = "sqlite3_open failed";
            }
            return false;
        }

        char *errmsg = nullptr;
        const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            if (error != nullptr) {
                *error = errmsg != nullptr ? errmsg : "sqlite3_exec failed";
            }
            if (errmsg != nullptr) {
                sqlite3_free(errmsg);
            }
            return false;
        }

        return true;
    }

    /// Run a query to completion, counting the rows it produces
    bool count_rows(const std::string &sql, int64_t *rows, std::string *error) {
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            if (error != nullptr) {
                *error = sqlite3_errmsg(db_);
            }
            return false;
        }

        int64_t count = 0;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            count++;
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            if (error != nullptr) {
                *error = sqlite3_errmsg(db_);
            }
            return false;
        }

        *rows = count;
        return true;
    }

private:
    sqlite3 *db_ = nullptr;
};

}  // namespace prism::bench

#endif
