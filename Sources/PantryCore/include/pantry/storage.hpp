#pragma once

#include "config.hpp"
#include <string>

namespace pantry {

/// Check that the storage backend can hold database files: `root` must exist
/// (it is created if missing) and be a writable directory.
/// Throws storage_unavailable describing what is missing.
void ensure_storage_available(const std::string& root);

/// Local path for `file_name` under the configured storage root, or
/// ":memory:" when the configuration asks for an in-memory database.
std::string database_path(const worker_config& config, const std::string& file_name);

/// The caller-facing name of `file_name`: <virtual_prefix>/<file_name>.
std::string virtual_path(const worker_config& config, const std::string& file_name);

} // namespace pantry
