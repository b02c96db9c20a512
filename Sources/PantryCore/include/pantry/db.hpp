#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace pantry {

/// Path that opens a private in-memory database.
inline constexpr const char* in_memory_path = ":memory:";

class database {
public:
    struct open_options {
        int busy_timeout_ms = 5000;
        std::string journal_mode = "WAL";  ///< Ignored for in-memory databases
    };

    /// Opens (creating if needed) the database at `path` read-write and
    /// enables foreign key enforcement. Throws statement_error on failure.
    explicit database(const std::string& path);
    database(const std::string& path, const open_options& options);
    ~database();

    // Owns the connection; neither copyable nor movable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Execute SQL with optional params. Rows produced by the statement are discarded.
    // If `sql` holds several statements they run in order; params bind to the first.
    void execute(const std::string& sql,
                 const std::vector<value_t>& params = {});

    // Query - returns every row, materialized, in the order SQLite yields them
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<value_t>& params = {});

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // While locked, BEGIN/COMMIT/ROLLBACK/END and SAVEPOINT/RELEASE fail to
    // prepare with SQLITE_AUTH.
    void lock_transaction_control(bool locked);

    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;

    // Runs every statement in `sql`, binding `params` to the first one.
    // Rows are appended to `rows` when it is non-null.
    void run(const std::string& sql, const std::vector<value_t>& params, std::vector<row_t>* rows);
    void bind_value(sqlite3_stmt* stmt, int index, const value_t& value);
    value_t extract_column(sqlite3_stmt* stmt, int index);
    [[noreturn]] void fail(const std::string& what, const std::string& sql, int rc);
};

// RAII transaction guard. Rolls back on destruction unless committed.
// Statements run inside the guard cannot end or nest its transaction.
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace pantry
