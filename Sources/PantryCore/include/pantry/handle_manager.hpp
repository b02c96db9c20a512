#pragma once

#include "config.hpp"
#include "db.hpp"
#include "types.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace pantry {

enum class handle_state {
    uninitialized,
    ready
};

// ============================================================================
// Handle manager - owns the worker's single database connection
// ============================================================================
//
// The first successful ensure_open() opens the file and caches the handle for
// the lifetime of the manager. Later calls return the cached handle without
// looking at their file name: one logical database per worker. A failed open
// leaves the manager uninitialized so the next request retries.

class handle_manager {
public:
    explicit handle_manager(worker_config config);

    handle_manager(const handle_manager&) = delete;
    handle_manager& operator=(const handle_manager&) = delete;

    /// Returns the open handle, opening `file_name` first if nothing is open yet.
    /// Throws storage_unavailable or statement_error when the open fails.
    database& ensure_open(const std::string& file_name, const trace_fn& trace = {});

    handle_state state() const;

    /// File the cached handle was opened for. Empty while uninitialized.
    std::string open_file() const;

    const worker_config& config() const { return config_; }

private:
    worker_config config_;
    mutable std::mutex mutex_;
    std::unique_ptr<database> db_;
    std::string open_file_;
};

} // namespace pantry
