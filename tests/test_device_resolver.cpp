#include <doctest/doctest.h>
#include "linkstation/transport/device_resolver.hpp"

#include "test_util.hpp"

#include <filesystem>

using namespace linkstation::transport;
using testutil::TempDir;
namespace fs = std::filesystem;

// Fake host tree:
//   dev/ttyUSBn                                       device node
//   sys/devices/usb2/2-1/2-1:1.<i>/ttyUSBn/tty/ttyUSBn  sysfs device dir
//   class/tty/ttyUSBn -> the dir above
//   bus/usb/2-1:1.<i> -> sys/devices/usb2/2-1/2-1:1.<i>
struct FakeHost {
    TempDir root;

    ResolverConfig config(const std::string& configured) const {
        ResolverConfig rc;
        rc.configured_path = configured;
        rc.dev_root = (root / "dev").string();
        rc.tty_root = (root / "class/tty").string();
        rc.usb_root = (root / "bus/usb").string();
        return rc;
    }

    std::string dev(int n) const { return (root / ("dev/ttyUSB" + std::to_string(n))).string(); }

    fs::path iface_dir(int iface) const {
        return root / ("sys/devices/usb2/2-1/2-1:1." + std::to_string(iface));
    }

    void add_port(int n, int iface) {
        const std::string name = "ttyUSB" + std::to_string(n);
        testutil::touch(dev(n));
        const fs::path dir = iface_dir(iface) / name / "tty" / name;
        fs::create_directories(dir);
        fs::create_directories(root / "class/tty");
        fs::create_directory_symlink(dir, root / "class/tty" / name);
        fs::create_directories(root / "bus/usb");
        const fs::path link = root / ("bus/usb/2-1:1." + std::to_string(iface));
        if (!fs::exists(fs::symlink_status(link))) fs::create_directory_symlink(iface_dir(iface), link);
    }

    void remove_port(int n, int iface) {
        const std::string name = "ttyUSB" + std::to_string(n);
        fs::remove(dev(n));
        fs::remove(root / "class/tty" / name);
        fs::remove_all(iface_dir(iface) / name);
    }
};

TEST_CASE("Configured path wins when the node exists") {
    FakeHost h;
    h.add_port(0, 0);
    h.add_port(2, 2);
    DeviceResolver r(h.config(h.dev(0)));
    CHECK(r.resolve() == std::optional<std::string>(h.dev(0)));
}

TEST_CASE("Scan finds the AT interface when the configured node is gone") {
    FakeHost h;
    h.add_port(0, 0);
    h.add_port(1, 1);
    h.add_port(3, 2);   // AT interface enumerated as ttyUSB3
    h.add_port(4, 3);

    DeviceResolver r(h.config(h.dev(2)));
    CHECK(r.interface_id_of(h.dev(3)) == "2-1:1.2");
    CHECK(r.resolve() == std::optional<std::string>(h.dev(3)));
}

TEST_CASE("Remembered interface follows the port across re-enumeration") {
    FakeHost h;
    h.add_port(0, 0);
    h.add_port(2, 2);

    DeviceResolver r(h.config(h.dev(2)));
    REQUIRE(r.resolve() == std::optional<std::string>(h.dev(2)));
    r.remember(h.dev(2));
    CHECK(r.remembered_interface() == "2-1:1.2");

    // Modem reboots and the AT interface comes back as ttyUSB5.
    h.remove_port(2, 2);
    h.add_port(5, 2);
    CHECK(r.resolve() == std::optional<std::string>(h.dev(5)));
}

TEST_CASE("Custom suffix selects a different interface") {
    FakeHost h;
    h.add_port(0, 0);
    h.add_port(1, 3);
    auto cfg = h.config(h.dev(9));
    cfg.interface_suffix = ":1.3";
    DeviceResolver r(cfg);
    CHECK(r.resolve() == std::optional<std::string>(h.dev(1)));
}

TEST_CASE("No candidate gives nullopt and remember() ignores unknown devices") {
    FakeHost h;
    h.add_port(0, 0);
    DeviceResolver r(h.config(h.dev(2)));
    CHECK_FALSE(r.resolve().has_value());

    r.remember((h.root / "dev/not-a-tty").string());
    CHECK(r.remembered_interface().empty());
}
