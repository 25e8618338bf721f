// ============================================================================
// at_transport.cpp — implementation for transport/at_transport.hpp
// ============================================================================

#include "linkstation/transport/at_transport.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace linkstation::transport {

using steady = std::chrono::steady_clock;
using std::chrono::milliseconds;

const char* to_string(ExchangeOutcome o) {
    switch (o) {
        case ExchangeOutcome::Ok:             return "ok";
        case ExchangeOutcome::ProtocolError:  return "protocol-error";
        case ExchangeOutcome::Timeout:        return "timeout";
        case ExchangeOutcome::IoError:        return "io-error";
        case ExchangeOutcome::DeviceNotFound: return "device-not-found";
    }
    return "unknown";
}

// Modem replies never carry trailing whitespace that matters; callers sometimes
// pass commands with a stray newline.
static std::string rstrip(std::string s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n' || s.back() == ' ' || s.back() == '\t'))
        s.pop_back();
    return s;
}

AtTransport::AtTransport(std::unique_ptr<ILink> link, DeviceResolver resolver, int baud,
                         RetryPolicy policy, Sleeper sleeper)
: link_(std::move(link)), resolver_(std::move(resolver)), policy_(std::move(policy)),
  sleep_(std::move(sleeper)) {
    if (!sleep_) sleep_ = [](milliseconds d) { std::this_thread::sleep_for(d); };
    session_.baud = baud;
    session_.device_path = resolver_.config().configured_path;
}

ChannelSession AtTransport::session() const {
    std::lock_guard<std::mutex> lk(mu_);
    ChannelSession s = session_;
    s.interface_id = resolver_.remembered_interface();
    return s;
}

void AtTransport::reset() {
    std::lock_guard<std::mutex> lk(mu_);
    close_locked("reset");
}

void AtTransport::close_locked(const std::string& reason) {
    if (link_->is_open()) spdlog::info("[transport] close dev={} reason={}", session_.device_path, reason);
    link_->close();
    session_.open = false;
}

// ---------------------------------------------------------------------------
// open_locked()
// -------------
// Resolve, open, remember the interface id. `why` tells the caller whether no
// device existed at all or the node existed but would not open.
// ---------------------------------------------------------------------------
bool AtTransport::open_locked(ExchangeOutcome& why, std::string& err) {
    auto dev = resolver_.resolve();
    if (!dev) {
        why = ExchangeOutcome::DeviceNotFound;
        err = "no modem AT port found";
        session_.last_error = err;
        return false;
    }
    if (!link_->open(*dev, session_.baud, err)) {
        why = ExchangeOutcome::IoError;
        session_.last_error = err;
        return false;
    }
    session_.device_path = *dev;
    session_.open = true;
    resolver_.remember(*dev);
    spdlog::info("[transport] open dev={} baud={} link={}", *dev, session_.baud, link_->name());
    return true;
}

// ---------------------------------------------------------------------------
// exchange_locked()
// -----------------
// One write + read-until-terminal pass. Returns IoFailure only for channel
// errors; Timeout and ProtocolError are results, not failures of the link.
// ---------------------------------------------------------------------------
AtTransport::Step AtTransport::exchange_locked(CommandExchange& ex) {
    ex.lines.clear();
    ex.error.clear();

    if (!link_->discard_input() || !link_->write_all(ex.command + "\r\n")) {
        ex.error = "write failed";
        return Step::IoFailure;
    }

    const auto deadline = steady::now() + ex.deadline;
    std::string buf;
    for (;;) {
        auto now = steady::now();
        if (now >= deadline) break;
        auto remaining = std::chrono::duration_cast<milliseconds>(deadline - now);
        if (remaining.count() == 0) remaining = milliseconds{1};

        ReadResult r = link_->read_some(buf, remaining);
        if (r == ReadResult::Error) {
            ex.error = "read failed";
            return Step::IoFailure;
        }
        if (r == ReadResult::Idle) continue;

        std::string err_line;
        Terminal t = detect_terminal(buf, &err_line);
        if (t == Terminal::Ok) {
            ex.lines = split_lines(buf);
            ex.outcome = ExchangeOutcome::Ok;
            return Step::Done;
        }
        if (t == Terminal::Error) {
            ex.lines = split_lines(buf);
            ex.outcome = ExchangeOutcome::ProtocolError;
            ex.error = err_line;
            return Step::Done;
        }
    }

    ex.lines = split_lines(buf);
    ex.outcome = ExchangeOutcome::Timeout;
    ex.error = buf.empty() ? "no response" : "incomplete response";
    return Step::Done;
}

// Walk the retry schedule; true once a fresh session is open.
bool AtTransport::reconnect_locked() {
    const std::size_t n = policy_.attempts();
    for (std::size_t i = 0; i < n; ++i) {
        const auto delay = policy_.delays[i];
        ++session_.reconnect_attempts;
        spdlog::warn("[transport] reconnect attempt={}/{} delay_ms={}", i + 1, n, delay.count());
        if (delay.count() > 0) sleep_(delay);

        ExchangeOutcome why = ExchangeOutcome::IoError;
        std::string err;
        if (open_locked(why, err)) return true;
        spdlog::warn("[transport] reconnect status=error reason={}", err);
    }
    return false;
}

CommandExchange AtTransport::send(const std::string& command, milliseconds deadline) {
    CommandExchange ex;
    ex.command = rstrip(command);
    ex.deadline = deadline;

    std::lock_guard<std::mutex> lk(mu_);

    if (!session_.open || !link_->is_open()) {
        std::string err;
        ExchangeOutcome why = ExchangeOutcome::IoError;
        if (!open_locked(why, err)) {
            ex.outcome = why;
            ex.error = err;
            spdlog::warn("[transport] status=error cmd={} reason={}", ex.command, err);
            return ex;
        }
    }

    if (exchange_locked(ex) == Step::Done) {
        if (!ex.ok()) spdlog::debug("[transport] cmd={} outcome={} reason={}", ex.command, to_string(ex.outcome), ex.error);
        return ex;
    }

    spdlog::warn("[transport] status=error cmd={} reason={} dev={}", ex.command, ex.error, session_.device_path);
    close_locked(ex.error);
    session_.last_error = ex.error;

    if (!reconnect_locked()) {
        ex.outcome = ExchangeOutcome::IoError;
        ex.error = "reconnect failed: " + session_.last_error;
        close_locked("reconnect exhausted");
        return ex;
    }

    // Replay exactly once on the fresh session.
    if (exchange_locked(ex) == Step::IoFailure) {
        ex.outcome = ExchangeOutcome::IoError;
        session_.last_error = ex.error;
        close_locked("replay failed");
    }
    return ex;
}

} // namespace linkstation::transport
