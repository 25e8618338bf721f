#pragma once
/**
 * @page ls-gateway Stream gateway
 * @file stream_gateway.hpp
 * @brief Proxy toward the media service for live HLS, recordings and camera metadata.
 *
 * @details
 * PATH CLASSES
 * ------------
 *   playlist   /live/{id}/{profile}/index.m3u8        no-store headers
 *   segment    /live/{id}/{profile}/{file}            public, max-age=<segment_max_age_s>
 *   recording  /v1/recordings/{id}/files/{date}/{file} Range / If-Range forwarded,
 *                                                      2xx and 4xx mirrored with
 *                                                      Content-Range (206, 416)
 *   metadata   health, cameras, camera stream, live-hls descriptor, recordings,
 *              recording days, recording segments      JSON, stream locations rewritten
 *
 * FAILURES
 * --------
 *   disabled                       -> 503, no upstream call
 *   bad profile / unsafe component -> 400, no upstream call
 *   unreachable / timeout          -> 502 (error kind kept distinct)
 *   upstream non-2xx, bad JSON     -> 502 (recording path: 3xx and 5xx only)
 *   body over the buffer cap       -> 502 upstream-too-large
 *
 * BODIES
 * ------
 * Playlists, segments and metadata are buffered up to max_body_bytes. A recording
 * file is buffered up to max_file_bytes by recording_file(), or relayed chunk by
 * chunk to an IResponseSink by stream_recording_file() with no cap. The gateway
 * never hands out a location on the internal segment (see url_rewrite.hpp).
 */

#include "linkstation/stream/upstream.hpp"
#include "linkstation/stream/url_rewrite.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace linkstation::stream {

struct GatewayConfig {
  bool enabled{true};
  std::string base_url{"http://192.168.99.11:8787"};
  std::chrono::milliseconds timeout{3000};
  std::chrono::milliseconds file_timeout{30000};
  int segment_max_age_s{3600};
  PublicEndpoint public_endpoint{"192.168.99.11", 9550, 100};
  std::size_t max_body_bytes{4u << 20};
  std::size_t max_file_bytes{64u << 20};
};

enum class GatewayError { None, Unreachable, Timeout, Disabled, Validation, UpstreamStatus, TooLarge, Aborted };

const char* to_string(GatewayError e);

/// Request-scoped view of one live stream.
struct StreamDescriptor {
  std::string camera_id;
  std::string profile;         ///< "sub" or "main"
  std::string playlist_path;   ///< /live/{id}/{profile}/index.m3u8
  std::string upstream_base;
};

struct GatewayResponse {
  int status{200};
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  GatewayError error{GatewayError::None};
  std::string detail;
  bool streamed{false};   ///< status, headers and body already went to an IResponseSink

  bool ok() const { return error == GatewayError::None; }
  /// Case-insensitive lookup; nullptr when absent.
  const std::string* header(const std::string& name) const;
};

/// Client side of a relayed recording file.
class IResponseSink {
public:
  virtual ~IResponseSink() = default;
  /// Called once, before the first write. false stops the relay.
  virtual bool begin(int status, const std::vector<std::pair<std::string, std::string>>& headers) = 0;
  virtual bool write(const char* data, std::size_t n) = 0;
};

class StreamGateway {
public:
  StreamGateway(IUpstream& upstream, GatewayConfig cfg);

  void set_enabled(bool on) { enabled_.store(on); }
  bool enabled() const { return enabled_.load(); }
  const GatewayConfig& config() const { return cfg_; }

  /// Validate id/profile and build the descriptor. false + err on bad input.
  bool describe(const std::string& id, const std::string& profile,
                StreamDescriptor& out, std::string& err) const;

  GatewayResponse playlist(const std::string& id, const std::string& profile);
  GatewayResponse segment(const std::string& id, const std::string& profile, const std::string& file);
  GatewayResponse recording_file(const std::string& id, const std::string& date, const std::string& file,
                                 const std::optional<std::string>& range,
                                 const std::optional<std::string>& if_range);
  /**
   * @brief Relay a recording file to `out` without buffering it.
   *
   * Passthrough statuses (2xx, 4xx) go to the sink with their headers and body;
   * the returned response then has `streamed` set and an empty body, with
   * error Timeout / Unreachable / Aborted if the transfer broke off midway.
   * Anything else never reaches the sink and comes back as a normal failure.
   */
  GatewayResponse stream_recording_file(const std::string& id, const std::string& date, const std::string& file,
                                        const std::optional<std::string>& range,
                                        const std::optional<std::string>& if_range,
                                        IResponseSink& out);

  GatewayResponse health();
  GatewayResponse cameras();
  GatewayResponse camera_stream(const std::string& id);
  GatewayResponse live_hls(const std::string& id, const std::string& profile);
  GatewayResponse recordings();
  GatewayResponse recording_days(const std::string& id);
  /// `public_base` is the gateway's own scheme://host[:port] as seen by the client.
  GatewayResponse recording_segments(const std::string& id, const std::string& date,
                                     const std::string& public_base);

private:
  UpstreamResponse fetch(const std::string& path, std::chrono::milliseconds timeout,
                         std::vector<std::pair<std::string, std::string>> headers = {},
                         std::size_t max_body = 0, IBodySink* sink = nullptr);
  bool recording_request(const std::string& id, const std::string& date, const std::string& file,
                         const std::optional<std::string>& range, const std::optional<std::string>& if_range,
                         std::string& path, std::vector<std::pair<std::string, std::string>>& fwd,
                         GatewayResponse& bad) const;
  GatewayResponse  fetch_json(const std::string& what, const std::string& path, nlohmann::json& out);
  GatewayResponse  proxy_live(const std::string& what, const std::string& id, const std::string& profile,
                              const std::string& file, const char* default_type);

  IUpstream& up_;
  const GatewayConfig cfg_;
  const std::string upstream_host_;
  std::atomic<bool> enabled_;
};

} // namespace linkstation::stream
