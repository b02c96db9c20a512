#include "pantry/db.hpp"
#include "pantry/log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <thread>

namespace pantry {

namespace {

using stmt_ptr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

bool only_whitespace(const char* p) {
    if (!p) return true;
    while (*p) {
        if (!std::isspace(static_cast<unsigned char>(*p))) return false;
        ++p;
    }
    return true;
}

int deny_transaction_control(void*, int action, const char*, const char*, const char*, const char*) {
    return (action == SQLITE_TRANSACTION || action == SQLITE_SAVEPOINT) ? SQLITE_DENY : SQLITE_OK;
}

} // namespace

database::database(const std::string& path) : database(path, open_options{}) {}

database::database(const std::string& path, const open_options& options) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw statement_error("Failed to open database: " + error, rc);
    }

    // Set busy timeout before anything that might contend with another connection.
    sqlite3_busy_timeout(db_, options.busy_timeout_ms);

    try {
        // Enable foreign keys
        execute("PRAGMA foreign_keys = ON");

        if (path != in_memory_path) {
            // journal_mode answers with a row, so it goes through query()
            auto rows = query("PRAGMA journal_mode = " + options.journal_mode);
            if (!rows.empty() && !rows.front().empty()) {
                if (auto* mode = std::get_if<std::string>(&rows.front().front().second)) {
                    LOG_DEBUG("db", "journal_mode=%s for %s", mode->c_str(), path.c_str());
                }
            }
        }
        execute("PRAGMA temp_store = MEMORY");
    } catch (const statement_error&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

database::~database() {
    if (db_) {
        if (path_ != in_memory_path) {
            sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
        }
        sqlite3_close(db_);
    }
}

void database::execute(const std::string& sql, const std::vector<value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless SQL
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : sqlite3_errstr(rc);
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw statement_error(error, rc);
        }
        return;
    }
    run(sql, params, nullptr);
}

std::vector<row_t> database::query(const std::string& sql, const std::vector<value_t>& params) {
    std::vector<row_t> results;
    run(sql, params, &results);
    return results;
}

void database::run(const std::string& sql, const std::vector<value_t>& params, std::vector<row_t>* rows) {
    const char* cursor = sql.c_str();
    bool bound = false;

    while (!only_whitespace(cursor)) {
        sqlite3_stmt* raw = nullptr;
        const char* tail = nullptr;
        int rc = sqlite3_prepare_v2(db_, cursor, -1, &raw, &tail);
        if (rc != SQLITE_OK) {
            fail("Failed to prepare statement", sql, rc);
        }
        cursor = tail;
        if (!raw) continue;  // comment or empty statement
        stmt_ptr stmt(raw, &sqlite3_finalize);

        if (!bound) {
            // Placeholders left without a value stay NULL, extra values fail with SQLITE_RANGE.
            int index = 1;
            for (const auto& param : params) {
                bind_value(raw, index++, param);
            }
            bound = true;
        }

        int col_count = sqlite3_column_count(raw);
        while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
            if (!rows) continue;
            row_t row;
            row.reserve(static_cast<size_t>(col_count));
            for (int i = 0; i < col_count; ++i) {
                const char* name = sqlite3_column_name(raw, i);
                row.emplace_back(name ? name : "", extract_column(raw, i));
            }
            rows->push_back(std::move(row));
        }

        if (rc != SQLITE_DONE) {
            fail("Execution failed", sql, rc);
        }
    }

    if (!bound && !params.empty()) {
        throw statement_error("Bound parameters given for SQL without a statement", SQLITE_RANGE);
    }
}

void database::fail(const std::string& what, const std::string& sql, int rc) {
    std::string error = sqlite3_errmsg(db_);
    LOG_ERROR("db", "%s: %s (SQL: %s)", what.c_str(), error.c_str(), sql.c_str());
    throw statement_error(error, rc);
}

void database::begin_transaction() {
    // IMMEDIATE: acquires the write lock up front, readers still allowed (WAL mode).
    const char* sql = "BEGIN IMMEDIATE";
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);

    // Retry with exponential backoff while another connection holds the write lock.
    int backoff_ms = 1;
    const int max_backoff_ms = 1000;
    const int max_total_wait_ms = 30000;  // 30 seconds total
    int total_waited_ms = 0;

    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && total_waited_ms < max_total_wait_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        total_waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, max_backoff_ms);
        rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Failed to begin transaction: %s", error.c_str());
        throw statement_error("Failed to begin transaction: " + error, rc);
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

void database::lock_transaction_control(bool locked) {
    int rc = sqlite3_set_authorizer(db_, locked ? &deny_transaction_control : nullptr, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Failed to set authorizer: %s", error.c_str());
        throw statement_error("Failed to set authorizer: " + error, rc);
    }
}

void database::bind_value(sqlite3_stmt* stmt, int index, const value_t& value) {
    int rc = std::visit([&](auto&& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else {
            if (v.empty()) {
                return sqlite3_bind_zeroblob(stmt, index, 0);
            }
            return sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
    }, value);

    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Failed to bind parameter %d: %s", index, error.c_str());
        throw statement_error("Failed to bind parameter " + std::to_string(index) + ": " + error, rc);
    }
}

value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return std::string(text ? text : "", text ? static_cast<size_t>(size) : 0);
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return bytes ? blob_t(bytes, bytes + size) : blob_t{};
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

// Transaction RAII guard
transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
    try {
        db_.lock_transaction_control(true);
    } catch (const statement_error&) {
        db_.rollback();
        throw;
    }
}

transaction::~transaction() {
    if (completed_) return;
    try {
        db_.lock_transaction_control(false);
        if (db_.is_in_transaction()) {
            db_.rollback();
        }
    } catch (const statement_error& e) {
        // Destructors must not throw; SQLite reverts the transaction when the handle closes.
        LOG_ERROR("db", "Rollback in transaction guard failed: %s", e.what());
    }
}

void transaction::commit() {
    db_.lock_transaction_control(false);
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    completed_ = true;
    db_.lock_transaction_control(false);
    // Some errors (SQLITE_FULL, SQLITE_NOMEM...) already rolled the transaction back.
    if (db_.is_in_transaction()) {
        db_.rollback();
    }
}

} // namespace pantry
