#include "pantry/storage.hpp"
#include "pantry/db.hpp"
#include "pantry/errors.hpp"
#include "pantry/log.hpp"

#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace pantry {

void ensure_storage_available(const std::string& root) {
    if (root.empty()) {
        throw storage_unavailable("no storage root configured");
    }

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path dir(root);

    if (!fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            LOG_WARN("storage", "Cannot create %s: %s", root.c_str(), ec.message().c_str());
            throw storage_unavailable("cannot create " + root + ": " + ec.message());
        }
    } else if (ec) {
        throw storage_unavailable("cannot inspect " + root + ": " + ec.message());
    }

    if (!fs::is_directory(dir, ec)) {
        throw storage_unavailable(root + " is not a directory");
    }
    if (::access(root.c_str(), R_OK | W_OK | X_OK) != 0) {
        throw storage_unavailable(root + " is not writable");
    }
}

std::string database_path(const worker_config& config, const std::string& file_name) {
    if (config.in_memory) {
        return in_memory_path;
    }
    return (std::filesystem::path(config.storage_root) / file_name).string();
}

std::string virtual_path(const worker_config& config, const std::string& file_name) {
    std::string prefix = config.virtual_prefix;
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    return prefix + "/" + file_name;
}

} // namespace pantry
