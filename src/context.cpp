// ============================================================================
// context.cpp — implementation for context.hpp
// ============================================================================

#include "linkstation/context.hpp"
#include "linkstation/transport/device_resolver.hpp"
#include "linkstation/transport/serial_link.hpp"

#include <spdlog/spdlog.h>

namespace linkstation {

transport::RetryPolicy Context::retry_from(const SerialConfig& s) {
    transport::RetryPolicy p;
    p.delays.clear();
    for (int ms : s.retry_delays_ms) p.delays.emplace_back(ms);
    p.max_attempts = p.delays.size();
    return p;
}

Context::Context(const Config& cfg)
: cfg_(cfg) {
    curl_ = std::make_unique<stream::CurlGlobal>();
    upstream_ = std::make_unique<stream::CurlUpstream>();
    wire(std::make_unique<transport::SerialLink>(), retry_from(cfg_.serial), {});
}

Context::Context(const Config& cfg,
                 std::unique_ptr<transport::ILink> link,
                 std::unique_ptr<stream::IUpstream> upstream,
                 transport::RetryPolicy retry,
                 transport::AtTransport::Sleeper sleeper)
: cfg_(cfg), upstream_(std::move(upstream)) {
    wire(std::move(link), std::move(retry), std::move(sleeper));
}

void Context::wire(std::unique_ptr<transport::ILink> link, transport::RetryPolicy retry,
                   transport::AtTransport::Sleeper sleeper) {
    switches_.enabled.store(cfg_.control.enabled);
    switches_.allow_dangerous.store(cfg_.control.allow_dangerous);

    transport::ResolverConfig rc;
    rc.configured_path = cfg_.serial.port;
    rc.interface_suffix = cfg_.serial.interface_suffix;

    at_ = std::make_unique<transport::AtTransport>(std::move(link), transport::DeviceResolver(rc),
                                                   cfg_.serial.baud, std::move(retry), std::move(sleeper));

    CacheConfig cc;
    cc.interval = std::chrono::milliseconds(cfg_.poller.interval_ms);
    cc.command_deadline = std::chrono::milliseconds(cfg_.serial.command_deadline_ms);
    cc.keep_raw = cfg_.poller.keep_raw;
    cc.netdev.sysfs_root = cfg_.poller.netdev_root;
    cache_ = std::make_unique<TelemetryCache>(*at_, cc);

    planner_ = std::make_unique<Planner>(*at_, switches_);
    gateway_ = std::make_unique<stream::StreamGateway>(*upstream_, cfg_.gateway);

    spdlog::info("[context] port={} baud={} control={} dangerous={} gateway={} upstream={}",
                 cfg_.serial.port, cfg_.serial.baud, cfg_.control.enabled, cfg_.control.allow_dangerous,
                 cfg_.gateway.enabled, upstream_->name());
}

Context::~Context() { stop(); }

void Context::start() { cache_->start(); }

void Context::stop() {
    if (cache_) cache_->stop();
}

} // namespace linkstation
