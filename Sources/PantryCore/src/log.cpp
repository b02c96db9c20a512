#include "pantry/log.hpp"
#include "pantry/errors.hpp"

namespace pantry {

std::atomic<log_level> g_log_level{log_level::off};

log_level parse_log_level(const std::string& name) {
    if (name == "off") return log_level::off;
    if (name == "error") return log_level::error;
    if (name == "warn") return log_level::warn;
    if (name == "info") return log_level::info;
    if (name == "debug") return log_level::debug;
    throw config_error("Unknown log level: " + name);
}

} // namespace pantry
