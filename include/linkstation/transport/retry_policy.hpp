#pragma once
/**
 * @file retry_policy.hpp
 * @brief Reconnect schedule used after an I/O failure on the AT channel.
 *
 * Each entry is the wait before one reopen attempt. The first entry is normally 0
 * (immediate attempt). The schedule is a plain value so tests can pass zero delays.
 */

#include <chrono>
#include <cstddef>
#include <vector>

namespace linkstation::transport {

struct RetryPolicy {
  std::vector<std::chrono::milliseconds> delays{
      std::chrono::milliseconds{0},
      std::chrono::milliseconds{2000},
      std::chrono::milliseconds{5000},
      std::chrono::milliseconds{10000}};
  std::size_t max_attempts{4};

  std::size_t attempts() const {
    return delays.size() < max_attempts ? delays.size() : max_attempts;
  }

  static RetryPolicy none() { RetryPolicy p; p.delays.clear(); p.max_attempts = 0; return p; }
};

} // namespace linkstation::transport
