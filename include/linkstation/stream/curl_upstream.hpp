#pragma once
/**
 * @file curl_upstream.hpp
 * @brief IUpstream over libcurl: one easy handle per request.
 *
 * curl_global_init() must have run once before the first request; Context does
 * that through CurlGlobal.
 */

#include "linkstation/stream/upstream.hpp"

namespace linkstation::stream {

/// RAII holder for curl_global_init / curl_global_cleanup.
class CurlGlobal {
public:
  CurlGlobal();
  ~CurlGlobal();
  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
  bool ok() const { return ok_; }
private:
  bool ok_{false};
};

class CurlUpstream : public IUpstream {
public:
  explicit CurlUpstream(std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(2000));

  UpstreamResponse get(const UpstreamRequest& req) override;
  const char*      name() const override { return "curl"; }

private:
  std::chrono::milliseconds connect_timeout_;
};

} // namespace linkstation::stream
