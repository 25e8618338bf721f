#pragma once
/**
 * @file log.hpp
 * @brief spdlog setup shared by the library and both tools.
 *
 * Components log through the default logger with a "[component]" prefix and
 * key=value fields, e.g. `[transport] status=reconnected device=/dev/ttyUSB2`.
 * Output goes to stderr so stdout stays clean for JSON.
 */

#include <string>

namespace linkstation::log {

/// Install a stderr logger named "linkstation" as the default one.
/// level: trace, debug, info, warn, error, off. false + err on an unknown level.
bool init(const std::string& level, std::string& err);

/// Change the level of the installed logger.
bool set_level(const std::string& level, std::string& err);

} // namespace linkstation::log
