#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "linkstation/api.hpp"
#include "linkstation/config.hpp"
#include "linkstation/context.hpp"
#include "linkstation/log.hpp"

#include <spdlog/spdlog.h>

// linkstation-monitor: run the poller in the foreground and print one compact
// JSON line per published snapshot until SIGINT/SIGTERM.

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop.store(true); }

int main(int argc, char** argv) {
  CLI::App app{"LinkStation telemetry monitor"};

  std::string config_path, port, log_level;
  int interval_ms = 0;
  bool raw = false, health_every_cycle = false;

  app.add_option("--config", config_path, "JSON configuration file");
  app.add_option("--port", port, "AT serial port");
  app.add_option("--interval-ms", interval_ms, "Poll interval in ms")->check(CLI::PositiveNumber);
  app.add_option("--log-level", log_level, "trace|debug|info|warn|error|off")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
  app.add_flag("--raw", raw, "Keep and print raw reply lines");
  app.add_flag("--health", health_every_cycle, "Print the health document after each snapshot");

  CLI11_PARSE(app, argc, argv);

  linkstation::Config cfg;
  std::string err;
  if (!linkstation::load_config_file(config_path, cfg, err) || !linkstation::apply_env(cfg, err)) {
    std::cerr << "status=error reason=config detail=" << err << "\n";
    return 2;
  }
  if (!port.empty()) cfg.serial.port = port;
  if (interval_ms > 0) cfg.poller.interval_ms = interval_ms;
  if (!log_level.empty()) cfg.log.level = log_level;
  if (raw) cfg.poller.keep_raw = true;

  if (!linkstation::log::init(cfg.log.level, err)) {
    std::cerr << "status=error reason=log detail=" << err << "\n";
    return 2;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  linkstation::Context ctx(cfg);
  linkstation::Api api(ctx);
  ctx.start();

  std::uint64_t last_cycle = 0;
  while (!g_stop.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto snap = ctx.cache().current();
    if (!snap || snap->cycle == last_cycle) continue;
    last_cycle = snap->cycle;

    std::cout << api.live(raw).body.dump() << std::endl;
    if (health_every_cycle) std::cout << api.health().body.dump() << std::endl;
  }

  spdlog::info("[monitor] status=stopping last_cycle={}", last_cycle);
  ctx.stop();
  return 0;
}
