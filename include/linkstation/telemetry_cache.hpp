#pragma once
/**
 * @page ls-telemetry-cache Telemetry cache (poller)
 * @file telemetry_cache.hpp
 * @brief Background poll loop that publishes whole telemetry snapshots.
 *
 * @details
 * One worker thread sends the read-only battery every interval, decodes it, and
 * publishes a new immutable snapshot with a single atomic pointer swap. Readers
 * take the pointer and keep it as long as they like; they never see a record
 * assembled from two different cycles and never block the worker.
 *
 * A query that fails is logged and recorded in a small diagnostics ring; the rest
 * of the cycle goes on. A cycle where every query failed publishes nothing, so the
 * previous snapshot stays current until the modem answers again.
 *
 * stop() wakes the worker through the condition variable and joins it; no cycle is
 * started after stop() returns.
 */

#include "linkstation/netdev.hpp"
#include "linkstation/telemetry.hpp"
#include "linkstation/transport/at_transport.hpp"

#include "etl/circular_buffer.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace linkstation {

struct CacheConfig {
  std::chrono::milliseconds interval{1000};
  std::chrono::milliseconds command_deadline{transport::kDefaultDeadline};
  bool keep_raw{false};
  bool netdev_fallback{true};
  netdev::ProbeConfig netdev;
};

struct QueryFailure {
  std::uint64_t cycle{0};
  std::string command;
  std::string reason;
};

struct CacheDiagnostics {
  std::uint64_t cycles_run{0};
  std::uint64_t cycles_published{0};
  std::vector<QueryFailure> recent_failures;   ///< oldest first
};

class TelemetryCache {
public:
  static constexpr std::size_t kFailureRing = 32;

  TelemetryCache(transport::AtTransport& at, CacheConfig cfg);
  ~TelemetryCache();

  TelemetryCache(const TelemetryCache&) = delete;
  TelemetryCache& operator=(const TelemetryCache&) = delete;

  void start();
  void stop();
  bool running() const;

  /// Run one cycle on the calling thread; true when a snapshot was published.
  bool poll_once();

  /// Latest published snapshot, or nullptr before the first successful cycle.
  std::shared_ptr<const TelemetrySnapshot> current() const;

  CacheDiagnostics diagnostics() const;

private:
  void loop();

  transport::AtTransport& at_;
  const CacheConfig cfg_;

  std::shared_ptr<const TelemetrySnapshot> snap_;   // accessed via std::atomic_load/store

  std::mutex cycle_mu_;                              // one cycle at a time
  std::atomic<std::uint64_t> cycle_{0};

  mutable std::mutex diag_mu_;
  etl::circular_buffer<QueryFailure, kFailureRing> failures_;
  std::uint64_t published_{0};

  mutable std::mutex wake_mu_;
  std::condition_variable wake_;
  bool stop_requested_{false};
  std::thread worker_;
};

} // namespace linkstation
