#pragma once

#include "log.hpp"
#include <string>

namespace pantry {

/// Virtual path prefix under which database files are addressed.
inline constexpr const char* default_virtual_prefix = "/meal-planner-lib/local-db";

/// Database file used when a request omits `database_file`.
inline constexpr const char* default_database_file = "products.sqlite3";

/// IPC channel served by the worker host when none is configured.
inline constexpr const char* default_channel = "pantry";

/// Resolve the local directory backing the virtual storage prefix.
/// Linux: $XDG_DATA_HOME/pantry (fallback: $HOME/.local/share/pantry, then /tmp/pantry-<uid>)
/// macOS: ~/Library/Application Support/Pantry
/// Does not create the directory; availability is checked when the handle is opened.
std::string resolve_default_storage_root();

// ============================================================================
// Worker configuration
// ============================================================================

struct worker_config {
    /// Local directory that database files are created in.
    std::string storage_root = resolve_default_storage_root();

    /// Virtual prefix reported in diagnostics; database files live at
    /// <virtual_prefix>/<file> from the caller's point of view.
    std::string virtual_prefix = default_virtual_prefix;

    /// File name used when a request carries no `database_file`.
    std::string default_database_file = pantry::default_database_file;

    /// Open ":memory:" instead of a file. Nothing is persisted.
    bool in_memory = false;

    /// Emit {"type":"Debug"} trace messages ahead of each reply.
    bool debug_trace = true;

    /// stderr log verbosity, applied by apply_log_level().
    log_level logging = log_level::off;

    /// sqlite3_busy_timeout in milliseconds.
    int busy_timeout_ms = 5000;

    /// PRAGMA journal_mode for the worker's handle ("WAL" or "DELETE").
    std::string journal_mode = "WAL";

    /// IPC channel name, resolved to a socket path by resolve_ipc_socket_path().
    std::string channel = default_channel;

    void apply_log_level() const { set_log_level(logging); }
};

/// Build a configuration from a JSON document. Missing keys keep their
/// defaults and unknown keys are ignored. Throws config_error on bad JSON or
/// a value of the wrong type.
worker_config config_from_json(const std::string& text);

/// Read and parse a JSON configuration file. Throws config_error.
worker_config load_config(const std::string& path);

} // namespace pantry
