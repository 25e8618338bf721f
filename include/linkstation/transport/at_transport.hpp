#pragma once
/**
 * @page ls-at-transport AT command transport
 * @file at_transport.hpp
 * @brief Serialized command/response exchanges over the modem's single AT channel.
 *
 * @details
 * PURPOSE
 * -------
 * The modem has exactly one AT port and no notion of request ids: bytes written by
 * two callers at once produce replies nobody can attribute. AtTransport is the one
 * owner of that port. Every exchange (write, wait for terminal marker, reconnect)
 * happens under a single mutex, so the poller and control requests simply queue.
 *
 * EXCHANGE
 * --------
 *  1. open the session if it is closed (resolve device first);
 *  2. discard stale input, write `<cmd>\r\n`;
 *  3. accumulate bytes until the buffer ends in a terminal marker (see at_framing.hpp)
 *     or the deadline expires.
 *
 * OUTCOMES
 * --------
 *  - Ok             terminal `OK`, lines captured;
 *  - ProtocolError  terminal `ERROR` / `+CME ERROR` / `+CMS ERROR`, lines captured;
 *  - Timeout        deadline hit first (no bytes, or no terminal marker); no reconnect;
 *  - IoError        write/read failed and the reconnect sequence did not recover;
 *  - DeviceNotFound no device node could be resolved for a closed session.
 *
 * RECONNECT
 * ---------
 * An I/O failure closes the session and walks the RetryPolicy schedule: wait, resolve,
 * open. The first successful open replays the original command exactly once and its
 * result is returned. If the schedule runs out, or the replay fails with I/O again,
 * the caller gets IoError and the session stays closed for the next caller.
 *
 * EXAMPLE
 * -------
 * @code
 *   AtTransport at(std::make_unique<SerialLink>(), DeviceResolver({}), 115200, RetryPolicy{});
 *   auto ex = at.send("AT+QENG=\"servingcell\"");
 *   if (ex.ok()) for (auto& l : ex.lines) std::cout << l << "\n";
 * @endcode
 */

#include "linkstation/transport/at_framing.hpp"
#include "linkstation/transport/device_resolver.hpp"
#include "linkstation/transport/link_base.hpp"
#include "linkstation/transport/retry_policy.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace linkstation::transport {

constexpr std::chrono::milliseconds kDefaultDeadline{1200};

enum class ExchangeOutcome { Ok, ProtocolError, Timeout, IoError, DeviceNotFound };

const char* to_string(ExchangeOutcome o);

struct CommandExchange {
  std::string command;
  std::chrono::milliseconds deadline{kDefaultDeadline};
  std::vector<std::string> lines;
  ExchangeOutcome outcome{ExchangeOutcome::Timeout};
  std::string error;

  bool ok() const { return outcome == ExchangeOutcome::Ok; }
  /// Timeout, IoError and DeviceNotFound: the channel failed, not the command.
  bool transport_failed() const {
    return outcome != ExchangeOutcome::Ok && outcome != ExchangeOutcome::ProtocolError;
  }
};

struct ChannelSession {
  std::string device_path;
  int baud{115200};
  bool open{false};
  std::string last_error;
  unsigned reconnect_attempts{0};
  std::string interface_id;
};

class AtTransport {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  AtTransport(std::unique_ptr<ILink> link, DeviceResolver resolver, int baud,
              RetryPolicy policy, Sleeper sleeper = {});

  AtTransport(const AtTransport&) = delete;
  AtTransport& operator=(const AtTransport&) = delete;

  /// One complete exchange; blocks other callers until it returns.
  CommandExchange send(const std::string& command,
                       std::chrono::milliseconds deadline = kDefaultDeadline);

  /// Copy of the session state for health reporting.
  ChannelSession session() const;

  /// Close the channel; the next send reopens it.
  void reset();

private:
  enum class Step { Done, IoFailure };

  bool open_locked(ExchangeOutcome& why, std::string& err);
  void close_locked(const std::string& reason);
  Step exchange_locked(CommandExchange& ex);
  bool reconnect_locked();

  mutable std::mutex mu_;
  std::unique_ptr<ILink> link_;
  DeviceResolver resolver_;
  RetryPolicy policy_;
  Sleeper sleep_;
  ChannelSession session_;
};

} // namespace linkstation::transport
