#pragma once
/**
 * @page ls-config Configuration
 * @file config.hpp
 * @brief Runtime configuration: JSON file, then LINKSTATION_* environment, then CLI flags.
 *
 * @details
 * Every key is optional. Defaults match a stock deployment: AT port /dev/ttyUSB2 at
 * 115200 baud, 1 s poll interval, control enabled with dangerous actions off, media
 * service at http://192.168.99.11:8787.
 *
 * FILE LAYOUT
 * -----------
 * @code
 * {
 *   "serial":  { "port": "/dev/ttyUSB2", "baud": 115200, "interface_suffix": ":1.2",
 *                "command_deadline_ms": 1200, "retry_delays_ms": [0, 2000, 5000, 10000] },
 *   "control": { "enabled": true, "allow_dangerous": false },
 *   "poller":  { "interval_ms": 1000, "keep_raw": false, "netdev_root": "/sys/class/net" },
 *   "gateway": { "enabled": true, "base_url": "http://192.168.99.11:8787",
 *                "timeout_ms": 3000, "file_timeout_ms": 30000, "segment_max_age_s": 3600,
 *                "public_host": "192.168.99.11", "public_base_port": 9550, "octet_base": 100 },
 *   "log":     { "level": "info" }
 * }
 * @endcode
 *
 * ENVIRONMENT
 * -----------
 *   LINKSTATION_SERIAL_PORT, LINKSTATION_SERIAL_BAUD, LINKSTATION_CTRL_ENABLE,
 *   LINKSTATION_CTRL_ALLOW_DANGEROUS, LINKSTATION_POLL_INTERVAL_MS,
 *   LINKSTATION_NVR_ENABLED, LINKSTATION_NVR_BASE_URL, LINKSTATION_NVR_TIMEOUT_MS,
 *   LINKSTATION_NVR_PUBLIC_HOST, LINKSTATION_NVR_PUBLIC_BASE_PORT, LINKSTATION_LOG_LEVEL
 *
 * Booleans accept 1/0, true/false, yes/no, on/off.
 */

#include "linkstation/stream/stream_gateway.hpp"

#include "nlohmann/json.hpp"

#include <functional>
#include <string>
#include <vector>

namespace linkstation {

struct SerialConfig {
  std::string port{"/dev/ttyUSB2"};
  int baud{115200};
  std::string interface_suffix{":1.2"};
  int command_deadline_ms{1200};
  std::vector<int> retry_delays_ms{0, 2000, 5000, 10000};
};

struct ControlConfig {
  bool enabled{true};
  bool allow_dangerous{false};
};

struct PollerConfig {
  int interval_ms{1000};
  bool keep_raw{false};
  std::string netdev_root{"/sys/class/net"};
};

struct LogConfig {
  std::string level{"info"};
};

struct Config {
  SerialConfig serial;
  ControlConfig control;
  PollerConfig poller;
  stream::GatewayConfig gateway;
  LogConfig log;
};

/// getenv-shaped lookup; tests pass a map-backed one.
using EnvLookup = std::function<const char*(const char*)>;

/// Merge a parsed JSON document into cfg. false + err on a wrong type or value.
bool apply_config_json(const nlohmann::json& j, Config& cfg, std::string& err);

/// Read and merge a config file. A missing file is an error; an empty path is a no-op.
bool load_config_file(const std::string& path, Config& cfg, std::string& err);

/// Apply LINKSTATION_* overrides. false + err on an unparsable value.
bool apply_env(Config& cfg, std::string& err, const EnvLookup& env = {});

/// Strip trailing '/' and a trailing "/v1" API prefix.
std::string normalize_base_url(std::string url);

/// Parse a boolean the way the environment spells it.
bool parse_bool(const std::string& s, bool& out);

} // namespace linkstation
