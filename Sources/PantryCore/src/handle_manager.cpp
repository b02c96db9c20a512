#include "pantry/handle_manager.hpp"
#include "pantry/log.hpp"
#include "pantry/storage.hpp"

namespace pantry {

handle_manager::handle_manager(worker_config config) : config_(std::move(config)) {}

database& handle_manager::ensure_open(const std::string& file_name, const trace_fn& trace) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        if (file_name != open_file_) {
            LOG_DEBUG("handles", "Request for %s served by already open %s",
                      file_name.c_str(), open_file_.c_str());
        }
        return *db_;
    }

    if (trace) trace("ensure_open: opening DB " + virtual_path(config_, file_name));

    if (!config_.in_memory) {
        try {
            ensure_storage_available(config_.storage_root);
        } catch (const storage_unavailable&) {
            if (trace) trace("ensure_open: storage unavailable");
            throw;
        }
    }

    database::open_options options;
    options.busy_timeout_ms = config_.busy_timeout_ms;
    options.journal_mode = config_.journal_mode;

    auto path = database_path(config_, file_name);
    db_ = std::make_unique<database>(path, options);
    open_file_ = file_name;

    LOG_INFO("handles", "Opened %s", path.c_str());
    if (trace) trace("ensure_open: DB ready");
    return *db_;
}

handle_state handle_manager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ ? handle_state::ready : handle_state::uninitialized;
}

std::string handle_manager::open_file() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_file_;
}

} // namespace pantry
