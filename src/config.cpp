// ============================================================================
// config.cpp — implementation for config.hpp
// ============================================================================

#include "linkstation/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>

namespace linkstation {

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// scalar parsing
// ---------------------------------------------------------------------------
bool parse_bool(const std::string& s, bool& out) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on")  { out = true;  return true; }
    if (v == "0" || v == "false" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

static bool parse_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

std::string normalize_base_url(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    if (url.size() >= 3 && url.compare(url.size() - 3, 3, "/v1") == 0) url.resize(url.size() - 3);
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------
template <typename T>
static void take(const json& obj, const char* key, T& dst) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) dst = it->template get<T>();
}

bool apply_config_json(const json& j, Config& cfg, std::string& err) {
    if (!j.is_object()) { err = "config root must be an object"; return false; }
    try {
        if (auto s = j.find("serial"); s != j.end()) {
            take(*s, "port", cfg.serial.port);
            take(*s, "baud", cfg.serial.baud);
            take(*s, "interface_suffix", cfg.serial.interface_suffix);
            take(*s, "command_deadline_ms", cfg.serial.command_deadline_ms);
            take(*s, "retry_delays_ms", cfg.serial.retry_delays_ms);
        }
        if (auto c = j.find("control"); c != j.end()) {
            take(*c, "enabled", cfg.control.enabled);
            take(*c, "allow_dangerous", cfg.control.allow_dangerous);
        }
        if (auto p = j.find("poller"); p != j.end()) {
            take(*p, "interval_ms", cfg.poller.interval_ms);
            take(*p, "keep_raw", cfg.poller.keep_raw);
            take(*p, "netdev_root", cfg.poller.netdev_root);
        }
        if (auto g = j.find("gateway"); g != j.end()) {
            int timeout_ms = static_cast<int>(cfg.gateway.timeout.count());
            int file_timeout_ms = static_cast<int>(cfg.gateway.file_timeout.count());
            long long max_body = static_cast<long long>(cfg.gateway.max_body_bytes);
            long long max_file = static_cast<long long>(cfg.gateway.max_file_bytes);
            take(*g, "enabled", cfg.gateway.enabled);
            take(*g, "base_url", cfg.gateway.base_url);
            take(*g, "timeout_ms", timeout_ms);
            take(*g, "file_timeout_ms", file_timeout_ms);
            take(*g, "segment_max_age_s", cfg.gateway.segment_max_age_s);
            take(*g, "public_host", cfg.gateway.public_endpoint.host);
            take(*g, "public_base_port", cfg.gateway.public_endpoint.base_port);
            take(*g, "octet_base", cfg.gateway.public_endpoint.octet_base);
            take(*g, "max_body_bytes", max_body);
            take(*g, "max_file_bytes", max_file);
            if (timeout_ms <= 0 || file_timeout_ms <= 0) {
                err = "config: gateway.timeout_ms and gateway.file_timeout_ms must be positive";
                return false;
            }
            if (max_body <= 0 || max_file <= 0) {
                err = "config: gateway.max_body_bytes and gateway.max_file_bytes must be positive";
                return false;
            }
            if (cfg.gateway.segment_max_age_s < 0) {
                err = "config: gateway.segment_max_age_s must not be negative";
                return false;
            }
            cfg.gateway.max_body_bytes = static_cast<std::size_t>(max_body);
            cfg.gateway.max_file_bytes = static_cast<std::size_t>(max_file);
            cfg.gateway.timeout = std::chrono::milliseconds(timeout_ms);
            cfg.gateway.file_timeout = std::chrono::milliseconds(file_timeout_ms);
            cfg.gateway.base_url = normalize_base_url(cfg.gateway.base_url);
        }
        if (auto l = j.find("log"); l != j.end()) {
            take(*l, "level", cfg.log.level);
        }
    } catch (const json::exception& e) {
        err = std::string("config: ") + e.what();
        return false;
    }

    if (cfg.serial.baud <= 0) { err = "config: serial.baud must be positive"; return false; }
    if (cfg.poller.interval_ms <= 0) { err = "config: poller.interval_ms must be positive"; return false; }
    for (int d : cfg.serial.retry_delays_ms) {
        if (d < 0) { err = "config: serial.retry_delays_ms must not be negative"; return false; }
    }
    return true;
}

bool load_config_file(const std::string& path, Config& cfg, std::string& err) {
    if (path.empty()) return true;
    std::ifstream in(path);
    if (!in) { err = "cannot open config file " + path; return false; }

    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) { err = "config file " + path + " is not valid JSON"; return false; }
    if (!apply_config_json(j, cfg, err)) return false;

    spdlog::debug("[config] loaded file={}", path);
    return true;
}

// ---------------------------------------------------------------------------
// environment
// ---------------------------------------------------------------------------
bool apply_env(Config& cfg, std::string& err, const EnvLookup& env) {
    auto get = [&](const char* name) -> const char* {
        return env ? env(name) : std::getenv(name);
    };
    auto str = [&](const char* name, std::string& dst) {
        if (const char* v = get(name)) dst = v;
    };
    auto boolean = [&](const char* name, bool& dst) {
        const char* v = get(name);
        if (!v) return true;
        if (parse_bool(v, dst)) return true;
        err = std::string(name) + ": not a boolean: " + v;
        return false;
    };
    auto integer = [&](const char* name, int& dst) {
        const char* v = get(name);
        if (!v) return true;
        if (parse_int(v, dst)) return true;
        err = std::string(name) + ": not an integer: " + v;
        return false;
    };

    str("LINKSTATION_SERIAL_PORT", cfg.serial.port);
    if (!integer("LINKSTATION_SERIAL_BAUD", cfg.serial.baud)) return false;
    if (!boolean("LINKSTATION_CTRL_ENABLE", cfg.control.enabled)) return false;
    if (!boolean("LINKSTATION_CTRL_ALLOW_DANGEROUS", cfg.control.allow_dangerous)) return false;
    if (!integer("LINKSTATION_POLL_INTERVAL_MS", cfg.poller.interval_ms)) return false;
    if (!boolean("LINKSTATION_NVR_ENABLED", cfg.gateway.enabled)) return false;

    if (const char* v = get("LINKSTATION_NVR_BASE_URL")) cfg.gateway.base_url = normalize_base_url(v);

    int timeout_ms = static_cast<int>(cfg.gateway.timeout.count());
    if (!integer("LINKSTATION_NVR_TIMEOUT_MS", timeout_ms)) return false;
    if (timeout_ms <= 0) {
        err = "LINKSTATION_NVR_TIMEOUT_MS: must be positive";
        return false;
    }
    cfg.gateway.timeout = std::chrono::milliseconds(timeout_ms);

    str("LINKSTATION_NVR_PUBLIC_HOST", cfg.gateway.public_endpoint.host);
    if (!integer("LINKSTATION_NVR_PUBLIC_BASE_PORT", cfg.gateway.public_endpoint.base_port)) return false;
    str("LINKSTATION_LOG_LEVEL", cfg.log.level);

    if (cfg.serial.baud <= 0 || cfg.poller.interval_ms <= 0) {
        err = "environment: baud and poll interval must be positive";
        return false;
    }
    return true;
}

} // namespace linkstation
