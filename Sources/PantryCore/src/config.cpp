#include "pantry/config.hpp"
#include "pantry/errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

#ifdef __APPLE__
#include <pwd.h>
#endif

namespace pantry {

std::string resolve_default_storage_root() {
#ifdef __APPLE__
    const char* home = getenv("HOME");
    if (!home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : "/tmp";
    }
    return std::string(home) + "/Library/Application Support/Pantry";
#else
    const char* data_home = getenv("XDG_DATA_HOME");
    if (data_home && data_home[0] != '\0') {
        return std::string(data_home) + "/pantry";
    }
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share/pantry";
    }
    return "/tmp/pantry-" + std::to_string(getuid());
#endif
}

namespace {

template <typename T>
void read_key(const nlohmann::json& doc, const char* key, T& out) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::type_error& e) {
        throw config_error(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

worker_config config_from_json(const std::string& text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw config_error(std::string("Failed to parse configuration: ") + e.what());
    }
    if (!doc.is_object()) {
        throw config_error("Configuration must be a JSON object");
    }

    worker_config config;
    read_key(doc, "storage_root", config.storage_root);
    read_key(doc, "virtual_prefix", config.virtual_prefix);
    read_key(doc, "default_database_file", config.default_database_file);
    read_key(doc, "in_memory", config.in_memory);
    read_key(doc, "debug_trace", config.debug_trace);
    read_key(doc, "busy_timeout_ms", config.busy_timeout_ms);
    read_key(doc, "journal_mode", config.journal_mode);
    read_key(doc, "channel", config.channel);

    std::string level;
    read_key(doc, "log_level", level);
    if (!level.empty()) {
        config.logging = parse_log_level(level);
    }

    if (config.default_database_file.empty()) {
        throw config_error("'default_database_file' must not be empty");
    }
    if (config.journal_mode != "WAL" && config.journal_mode != "DELETE") {
        throw config_error("Unsupported journal_mode: " + config.journal_mode);
    }
    if (config.busy_timeout_ms < 0) {
        throw config_error("'busy_timeout_ms' must not be negative");
    }
    return config;
}

worker_config load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw config_error("Cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return config_from_json(buffer.str());
}

} // namespace pantry
