#pragma once
/**
 * @page ls-context Context
 * @file context.hpp
 * @brief Owns one of everything: transport, poller, planner, gateway, switches.
 *
 * @details
 * There are no singletons; tools build a Context from a Config and hand references
 * to whatever needs them. The second constructor takes the byte link and the
 * upstream client from the caller so tests can run the whole stack against a
 * simulated modem and a fake media service.
 *
 * Destruction stops the poller before the transport goes away.
 */

#include "linkstation/config.hpp"
#include "linkstation/planner.hpp"
#include "linkstation/telemetry_cache.hpp"
#include "linkstation/stream/curl_upstream.hpp"
#include "linkstation/stream/stream_gateway.hpp"
#include "linkstation/transport/at_transport.hpp"
#include "linkstation/transport/link_base.hpp"

#include <memory>

namespace linkstation {

class Context {
public:
  /// Production wiring: SerialLink on the configured port, libcurl upstream.
  explicit Context(const Config& cfg);

  /// Injected wiring.
  Context(const Config& cfg,
          std::unique_ptr<transport::ILink> link,
          std::unique_ptr<stream::IUpstream> upstream,
          transport::RetryPolicy retry,
          transport::AtTransport::Sleeper sleeper = {});

  ~Context();

  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  /// Start the poller thread.
  void start();
  /// Stop the poller thread; idempotent.
  void stop();

  const Config&           config()    const { return cfg_; }
  ControlSwitches&        switches()        { return switches_; }
  transport::AtTransport& transport()       { return *at_; }
  TelemetryCache&         cache()           { return *cache_; }
  Planner&                planner()         { return *planner_; }
  stream::StreamGateway&  gateway()         { return *gateway_; }

  /// Policy built from serial.retry_delays_ms.
  static transport::RetryPolicy retry_from(const SerialConfig& s);

private:
  void wire(std::unique_ptr<transport::ILink> link, transport::RetryPolicy retry,
            transport::AtTransport::Sleeper sleeper);

  Config cfg_;
  ControlSwitches switches_;
  std::unique_ptr<stream::CurlGlobal> curl_;
  std::unique_ptr<stream::IUpstream> upstream_;
  std::unique_ptr<transport::AtTransport> at_;
  std::unique_ptr<TelemetryCache> cache_;
  std::unique_ptr<Planner> planner_;
  std::unique_ptr<stream::StreamGateway> gateway_;
};

} // namespace linkstation
