#include "pantry/executor.hpp"
#include "pantry/log.hpp"

namespace pantry {

void run_batch(database& db, const std::vector<statement>& statements, const trace_fn& trace) {
    // The guard refuses BEGIN/COMMIT/END/ROLLBACK/SAVEPOINT, so every statement
    // stays inside this one transaction.
    transaction tx(db);
    size_t index = 0;
    try {
        for (const auto& stmt : statements) {
            if (trace) trace("Exec stmt: " + stmt.sql);
            db.execute(stmt.sql, stmt.bind);
            ++index;
        }
    } catch (const statement_error& e) {
        LOG_WARN("exec", "Statement %zu of %zu failed, rolling back: %s",
                 index + 1, statements.size(), e.what());
        try {
            tx.rollback();
        } catch (const statement_error& rollback_error) {
            LOG_ERROR("exec", "Rollback failed: %s", rollback_error.what());
        }
        if (e.code() == SQLITE_AUTH) {
            throw statement_error("Transaction control is not allowed inside a batch: " +
                                  statements[index].sql, SQLITE_AUTH);
        }
        throw;
    }
    tx.commit();
    LOG_DEBUG("exec", "Committed batch of %zu statement(s)", statements.size());
}

std::vector<row_t> run_query(database& db, const statement& stmt) {
    return db.query(stmt.sql, stmt.bind);
}

} // namespace pantry
