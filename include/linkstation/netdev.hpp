#pragma once
/**
 * @file netdev.hpp
 * @brief Host-side view of the modem's network interface.
 *
 * Used when +QNETDEVSTATUS gives no counters: read /sys/class/net/<if>/statistics
 * for the first preferred interface that exists, and its IPv4 address via
 * getifaddrs(3). Rates are derived from two samples.
 */

#include "linkstation/telemetry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace linkstation::netdev {

struct ProbeConfig {
  std::string sysfs_root{"/sys/class/net"};
  std::vector<std::string> prefer{"wwan0", "usb0", "eth1", "eth0"};
};

/// Counters of the first preferred interface present under sysfs_root.
std::optional<NetDevStats> probe_sysfs(const ProbeConfig& cfg);

/// Fill rx/tx counters from sysfs into `stats` when the modem gave none.
void merge_sysfs(NetDevStats& stats, const ProbeConfig& cfg);

/// Bytes-per-second since `prev`; counters that went backwards (reset) give no rate.
void apply_rates(NetDevStats& cur, const NetDevStats& prev, double dt_seconds);

} // namespace linkstation::netdev
