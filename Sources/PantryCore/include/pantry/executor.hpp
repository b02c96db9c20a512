#pragma once

#include "db.hpp"
#include "types.hpp"
#include <vector>

namespace pantry {

/// Run `statements` in order inside one transaction. The first failing
/// statement rolls the whole batch back and its statement_error is rethrown;
/// on success the transaction is committed. An empty batch commits an empty
/// transaction.
void run_batch(database& db, const std::vector<statement>& statements, const trace_fn& trace = {});

/// Run a single read directly against the handle and materialize every row.
std::vector<row_t> run_query(database& db, const statement& stmt);

} // namespace pantry
