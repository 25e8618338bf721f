// ============================================================================
// telemetry_cache.cpp — implementation for telemetry_cache.hpp
// ============================================================================

#include "linkstation/telemetry_cache.hpp"
#include "linkstation/decoder.hpp"

#include <spdlog/spdlog.h>

namespace linkstation {

TelemetryCache::TelemetryCache(transport::AtTransport& at, CacheConfig cfg)
: at_(at), cfg_(std::move(cfg)) {}

TelemetryCache::~TelemetryCache() { stop(); }

void TelemetryCache::start() {
    std::lock_guard<std::mutex> lk(wake_mu_);
    if (worker_.joinable()) return;
    stop_requested_ = false;
    worker_ = std::thread([this] { loop(); });
    spdlog::info("[poller] start interval_ms={}", cfg_.interval.count());
}

void TelemetryCache::stop() {
    {
        std::lock_guard<std::mutex> lk(wake_mu_);
        if (!worker_.joinable()) return;
        stop_requested_ = true;
    }
    wake_.notify_all();
    worker_.join();
    spdlog::info("[poller] stop");
}

bool TelemetryCache::running() const {
    std::lock_guard<std::mutex> lk(wake_mu_);
    return worker_.joinable() && !stop_requested_;
}

void TelemetryCache::loop() {
    std::unique_lock<std::mutex> lk(wake_mu_);
    while (!stop_requested_) {
        lk.unlock();
        poll_once();
        lk.lock();
        wake_.wait_for(lk, cfg_.interval, [this] { return stop_requested_; });
    }
}

std::shared_ptr<const TelemetrySnapshot> TelemetryCache::current() const {
    return std::atomic_load(&snap_);
}

CacheDiagnostics TelemetryCache::diagnostics() const {
    CacheDiagnostics d;
    d.cycles_run = cycle_.load();
    std::lock_guard<std::mutex> lk(diag_mu_);
    d.cycles_published = published_;
    for (const auto& f : failures_) d.recent_failures.push_back(f);
    return d;
}

// ---------------------------------------------------------------------------
// poll_once()
// -----------
// Send the whole battery, decode, derive netdev rates against the previous
// snapshot, publish. Nothing is published when no query got an answer.
// ---------------------------------------------------------------------------
bool TelemetryCache::poll_once() {
    std::lock_guard<std::mutex> cycle_lk(cycle_mu_);
    const std::uint64_t cycle = ++cycle_;

    auto snap = std::make_shared<TelemetrySnapshot>();
    snap->cycle = cycle;

    decoder::ReplyBatch batch;
    std::size_t answered = 0;
    for (const auto& cmd : decoder::telemetry_battery()) {
        auto ex = at_.send(cmd, cfg_.command_deadline);
        if (cfg_.keep_raw) snap->raw[cmd] = ex.lines;
        if (ex.ok()) {
            batch[cmd] = std::move(ex.lines);
            ++answered;
            continue;
        }
        snap->failed.push_back(cmd);
        spdlog::debug("[poller] cycle={} cmd={} outcome={} reason={}",
                      cycle, cmd, transport::to_string(ex.outcome), ex.error);
        std::lock_guard<std::mutex> lk(diag_mu_);
        failures_.push(QueryFailure{cycle, cmd, transport::to_string(ex.outcome)});
    }

    if (answered == 0) {
        spdlog::warn("[poller] cycle={} status=error reason=no-replies kept_cycle={}",
                     cycle, current() ? current()->cycle : 0);
        return false;
    }

    snap->data = decoder::decode(batch);
    snap->captured_at = std::chrono::system_clock::now();
    snap->captured_mono = std::chrono::steady_clock::now();

    if (cfg_.netdev_fallback) {
        if (!snap->data.netdev) snap->data.netdev = netdev::probe_sysfs(cfg_.netdev);
        else netdev::merge_sysfs(*snap->data.netdev, cfg_.netdev);
    }

    auto prev = current();
    if (prev && prev->data.netdev && snap->data.netdev) {
        const double dt = std::chrono::duration<double>(snap->captured_mono - prev->captured_mono).count();
        netdev::apply_rates(*snap->data.netdev, *prev->data.netdev, dt);
    }

    std::atomic_store(&snap_, std::shared_ptr<const TelemetrySnapshot>(std::move(snap)));
    {
        std::lock_guard<std::mutex> lk(diag_mu_);
        ++published_;
    }
    return true;
}

} // namespace linkstation
