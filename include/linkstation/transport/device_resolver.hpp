#pragma once
/**
 * @page ls-device-resolver Modem device resolution
 * @file device_resolver.hpp
 * @brief Find the modem's AT port among the host's USB serial nodes.
 *
 * @details
 * PURPOSE
 * -------
 * A Quectel modem exposes several ttyUSB nodes (DM, NMEA, AT, modem). Their numbers
 * shift whenever the modem re-enumerates (reboot, usbnet change, brown-out), so a
 * fixed `/dev/ttyUSB2` is only a hint. The stable handle is the USB *interface id*
 * in sysfs, e.g. `2-1:1.2`: bus/port path, configuration 1, interface 2.
 *
 * RESOLUTION ORDER
 * ----------------
 *  1. the configured path, if the node exists;
 *  2. the remembered interface id: `<usb_root>/<iface>/ttyUSB*` mapped to `<dev_root>/ttyUSBn`;
 *  3. scan `<dev_root>/ttyUSB*` (sorted) and take the first node whose interface id
 *     ends with the expected suffix (default `:1.2`).
 *
 * The interface id of a tty is read by resolving `<tty_root>/<name>` and walking up
 * three directories (`.../2-1:1.2/ttyUSB2/tty/ttyUSB2` -> `2-1:1.2`).
 *
 * No libudev: plain filesystem inspection, like the rest of the host tooling. Every
 * root is configurable so tests can point the resolver at a fake tree.
 */

#include <optional>
#include <string>

namespace linkstation::transport {

struct ResolverConfig {
  std::string configured_path{"/dev/ttyUSB2"};
  std::string interface_suffix{":1.2"};
  std::string dev_root{"/dev"};
  std::string tty_root{"/sys/class/tty"};
  std::string usb_root{"/sys/bus/usb/devices"};
};

class DeviceResolver {
public:
  explicit DeviceResolver(ResolverConfig cfg);

  /// Best device path for the AT port, or nullopt when nothing matches.
  std::optional<std::string> resolve() const;

  /// Record the interface id behind `device` after a successful open.
  void remember(const std::string& device);

  /// USB interface id of a tty device path (empty when sysfs has no answer).
  std::string interface_id_of(const std::string& device) const;

  const std::string& remembered_interface() const { return iface_; }
  const ResolverConfig& config() const { return cfg_; }

private:
  std::optional<std::string> by_interface(const std::string& iface) const;
  std::optional<std::string> by_scan() const;

  ResolverConfig cfg_;
  std::string    iface_;
  std::string    suffix_;
};

} // namespace linkstation::transport
