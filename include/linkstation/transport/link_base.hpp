#pragma once
/**
 * @file link_base.hpp
 * @brief Byte-level channel interface underneath the AT transport.
 *
 * A link knows how to open a device node, push bytes and wait a bounded time for
 * bytes to come back. It knows nothing about AT framing, locking or reconnects;
 * those live in AtTransport. Tests substitute a simulated modem here.
 */

#include <chrono>
#include <string>

namespace linkstation::transport {

enum class ReadResult { Data, Idle, Error };

/**
 * @brief Channel trait every link implementation relies on.
 *
 * Contract:
 *  - open(path, baud) acquires the device; false + err on failure.
 *  - discard_input() drops stale bytes still sitting in the receive queue.
 *  - write_all() writes the whole buffer or reports failure.
 *  - read_some() waits at most `wait` for bytes and appends what arrived to `out`.
 *    Idle means nothing arrived in time; Error means the device is gone or broken.
 *  - name() is a short identifier for logs.
 */
class ILink {
public:
  virtual ~ILink() = default;
  virtual bool        open(const std::string& path, int baud, std::string& err) = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual bool        discard_input() = 0;
  virtual bool        write_all(const std::string& data) = 0;
  virtual ReadResult  read_some(std::string& out, std::chrono::milliseconds wait) = 0;
  virtual const char* name() const = 0;
};

} // namespace linkstation::transport
