#pragma once
/**
 * @file upstream.hpp
 * @brief HTTP GET interface toward the media service on the isolated segment.
 *
 * The gateway only ever issues GETs with a handful of forwarded headers, so the
 * interface is a single call. Response header names are lower-cased by the
 * implementation; lookups go through header().
 *
 * BODY HANDLING
 * -------------
 * Without a sink the body is buffered into UpstreamResponse::body, capped at
 * `max_body` bytes (0 = no cap); a longer body fails with TooLarge. With a sink
 * the body is offered to IBodySink once the status and headers are known: if the
 * sink accepts, every chunk goes to it and nothing is buffered; if it declines,
 * the body is buffered as above.
 */

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace linkstation::stream {

enum class UpstreamStatus { Ok, Unreachable, Timeout, TooLarge, Aborted };

const char* to_string(UpstreamStatus s);

/// Receiver for a streamed response body.
class IBodySink {
public:
  virtual ~IBodySink() = default;
  /// Status and lower-cased headers are final. false = buffer the body instead.
  virtual bool begin(long http_status, const std::map<std::string, std::string>& headers) = 0;
  /// false stops the transfer; the response comes back Aborted.
  virtual bool write(const char* data, std::size_t n) = 0;
};

/// Appends into `out` until more than `limit` bytes were offered (0 = unlimited).
class BodyBuffer {
public:
  BodyBuffer(std::string& out, std::size_t limit) : out_(out), limit_(limit) {}
  /// false once the limit is exceeded; the buffer then stops growing.
  bool append(const char* data, std::size_t n);
  bool overflowed() const { return overflowed_; }
private:
  std::string& out_;
  std::size_t limit_;
  bool overflowed_{false};
};

struct UpstreamRequest {
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::chrono::milliseconds timeout{3000};
  std::size_t max_body{0};        // buffered bytes, 0 = no cap
  IBodySink* sink{nullptr};
};

struct UpstreamResponse {
  UpstreamStatus status{UpstreamStatus::Unreachable};
  long http_status{0};                          // valid when status == Ok or streamed
  std::map<std::string, std::string> headers;   // lower-case names
  std::string body;
  std::string error;
  bool streamed{false};                         // body went to the sink

  /// nullptr when absent. `name` is matched case-insensitively.
  const std::string* header(const std::string& name) const;
};

/**
 * @brief Upstream trait the gateway relies on.
 *
 * Contract:
 *  - get() never throws; transport-level failures come back as Unreachable,
 *    Timeout, TooLarge or Aborted with `error` filled in.
 *  - Any HTTP status, including 4xx/5xx, is status Ok with http_status set.
 */
class IUpstream {
public:
  virtual ~IUpstream() = default;
  virtual UpstreamResponse get(const UpstreamRequest& req) = 0;
  virtual const char*      name() const = 0;
};

} // namespace linkstation::stream
