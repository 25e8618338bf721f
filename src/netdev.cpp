// ============================================================================
// netdev.cpp — implementation for netdev.hpp
// ============================================================================

#include "linkstation/netdev.hpp"
#include "linkstation/at_tokens.hpp"

#include <arpa/inet.h>     // inet_ntop
#include <ifaddrs.h>       // getifaddrs for the interface address
#include <netinet/in.h>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
namespace linkstation::netdev {

static std::optional<std::uint64_t> read_counter(const fs::path& p) {
    std::ifstream in(p);
    if (!in) return std::nullopt;
    std::string s;
    std::getline(in, s);
    return tokens::parse_u64(s);
}

static std::optional<std::string> read_line(const fs::path& p) {
    std::ifstream in(p);
    if (!in) return std::nullopt;
    std::string s;
    std::getline(in, s);
    return tokens::non_empty(tokens::trim(s));
}

static std::optional<std::string> ipv4_of(const std::string& iface) {
    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) return std::nullopt;
    std::optional<std::string> out;
    for (ifaddrs* a = list; a; a = a->ifa_next) {
        if (!a->ifa_addr || a->ifa_addr->sa_family != AF_INET) continue;
        if (iface != a->ifa_name) continue;
        char buf[INET_ADDRSTRLEN] = {0};
        auto* sin = reinterpret_cast<sockaddr_in*>(a->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) { out = std::string(buf); break; }
    }
    freeifaddrs(list);
    return out;
}

std::optional<NetDevStats> probe_sysfs(const ProbeConfig& cfg) {
    for (const auto& name : cfg.prefer) {
        fs::path dir = fs::path(cfg.sysfs_root) / name;
        std::error_code ec;
        if (!fs::exists(dir, ec)) continue;

        NetDevStats s;
        s.source   = "sysfs";
        s.iface    = name;
        s.state    = read_line(dir / "operstate");
        s.rx_bytes = read_counter(dir / "statistics" / "rx_bytes");
        s.tx_bytes = read_counter(dir / "statistics" / "tx_bytes");
        s.ipv4     = ipv4_of(name);
        return s;
    }
    return std::nullopt;
}

void merge_sysfs(NetDevStats& stats, const ProbeConfig& cfg) {
    if (stats.rx_bytes && stats.tx_bytes) return;
    ProbeConfig narrowed = cfg;
    if (stats.iface) narrowed.prefer.insert(narrowed.prefer.begin(), *stats.iface);
    auto sys = probe_sysfs(narrowed);
    if (!sys) return;
    if (!stats.iface)    stats.iface = sys->iface;
    if (!stats.state)    stats.state = sys->state;
    if (!stats.ipv4)     stats.ipv4 = sys->ipv4;
    stats.rx_bytes = sys->rx_bytes;
    stats.tx_bytes = sys->tx_bytes;
    stats.source = stats.source.empty() ? "sysfs" : stats.source + "+sysfs";
}

void apply_rates(NetDevStats& cur, const NetDevStats& prev, double dt_seconds) {
    if (dt_seconds <= 0.0 || cur.iface != prev.iface) return;
    if (cur.rx_bytes && prev.rx_bytes && *cur.rx_bytes >= *prev.rx_bytes)
        cur.rx_bps = static_cast<double>(*cur.rx_bytes - *prev.rx_bytes) / dt_seconds;
    if (cur.tx_bytes && prev.tx_bytes && *cur.tx_bytes >= *prev.tx_bytes)
        cur.tx_bps = static_cast<double>(*cur.tx_bytes - *prev.tx_bytes) / dt_seconds;
}

} // namespace linkstation::netdev
