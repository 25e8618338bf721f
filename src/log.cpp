// ============================================================================
// log.cpp — implementation for log.hpp
// ============================================================================

#include "linkstation/log.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace linkstation::log {

static bool to_level(const std::string& name, spdlog::level::level_enum& out) {
    if (name == "trace") { out = spdlog::level::trace; return true; }
    if (name == "debug") { out = spdlog::level::debug; return true; }
    if (name == "info")  { out = spdlog::level::info;  return true; }
    if (name == "warn" || name == "warning") { out = spdlog::level::warn; return true; }
    if (name == "error") { out = spdlog::level::err;   return true; }
    if (name == "off")   { out = spdlog::level::off;   return true; }
    return false;
}

bool set_level(const std::string& level, std::string& err) {
    spdlog::level::level_enum lvl;
    if (!to_level(level, lvl)) {
        err = "unknown log level: " + level;
        return false;
    }
    spdlog::set_level(lvl);
    return true;
}

bool init(const std::string& level, std::string& err) {
    spdlog::level::level_enum lvl;
    if (!to_level(level, lvl)) {
        err = "unknown log level: " + level;
        return false;
    }
    auto logger = spdlog::get("linkstation");
    if (!logger) logger = spdlog::stderr_color_mt("linkstation");
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %^%-5l%$ %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(lvl);
    return true;
}

} // namespace linkstation::log
