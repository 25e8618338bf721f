// ============================================================================
// device_resolver.cpp — implementation for transport/device_resolver.hpp
// ============================================================================

#include "linkstation/transport/device_resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
namespace linkstation::transport {

static bool ends_with(const std::string& s, const std::string& tail) {
    return s.size() >= tail.size() && s.compare(s.size() - tail.size(), tail.size(), tail) == 0;
}

static bool starts_with(const std::string& s, const std::string& head) {
    return s.rfind(head, 0) == 0;
}

// Sorted list of ttyUSB* names (not paths) inside `dir`. Errors just mean "none".
static std::vector<std::string> list_tty_usb(const fs::path& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(dir, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        auto name = it->path().filename().string();
        if (starts_with(name, "ttyUSB")) names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

DeviceResolver::DeviceResolver(ResolverConfig cfg)
: cfg_(std::move(cfg)), suffix_(cfg_.interface_suffix) {}

std::string DeviceResolver::interface_id_of(const std::string& device) const {
    std::error_code ec;
    // Follow /dev/serial/by-id style symlinks to the real node first.
    fs::path dev = fs::canonical(device, ec);
    if (ec) dev = fs::path(device);

    fs::path real = fs::canonical(fs::path(cfg_.tty_root) / dev.filename(), ec);
    if (ec) return {};
    fs::path iface = real.parent_path().parent_path().parent_path();
    std::string id = iface.filename().string();
    // Interface directories always look like "<bus>-<port>:<config>.<iface>".
    if (id.find(':') == std::string::npos) return {};
    return id;
}

std::optional<std::string> DeviceResolver::by_interface(const std::string& iface) const {
    for (const auto& name : list_tty_usb(fs::path(cfg_.usb_root) / iface)) {
        fs::path dev = fs::path(cfg_.dev_root) / name;
        std::error_code ec;
        if (fs::exists(dev, ec)) return dev.string();
    }
    return std::nullopt;
}

std::optional<std::string> DeviceResolver::by_scan() const {
    for (const auto& name : list_tty_usb(cfg_.dev_root)) {
        std::string dev = (fs::path(cfg_.dev_root) / name).string();
        if (ends_with(interface_id_of(dev), suffix_)) return dev;
    }
    return std::nullopt;
}

std::optional<std::string> DeviceResolver::resolve() const {
    std::error_code ec;
    if (!cfg_.configured_path.empty() && fs::exists(cfg_.configured_path, ec))
        return cfg_.configured_path;

    if (!iface_.empty()) {
        if (auto dev = by_interface(iface_)) {
            spdlog::info("[resolver] status=ok source=interface iface={} dev={}", iface_, *dev);
            return dev;
        }
    }
    if (auto dev = by_scan()) {
        spdlog::info("[resolver] status=ok source=scan suffix={} dev={}", suffix_, *dev);
        return dev;
    }
    spdlog::warn("[resolver] status=error reason=no-device configured={} suffix={}",
                 cfg_.configured_path, suffix_);
    return std::nullopt;
}

void DeviceResolver::remember(const std::string& device) {
    std::string id = interface_id_of(device);
    if (id.empty()) return;
    iface_ = id;
    auto colon = id.rfind(':');
    if (colon != std::string::npos) suffix_ = id.substr(colon);
}

} // namespace linkstation::transport
