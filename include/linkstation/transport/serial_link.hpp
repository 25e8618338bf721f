#pragma once
/**
 * @file serial_link.hpp
 * @brief Linux tty link (termios raw 8N1, non-blocking fd, poll(2) for waits).
 */

#if !defined(__linux__)
#  error "serial_link.hpp is Linux-only."
#endif

#include "linkstation/transport/link_base.hpp"

#include <string>

namespace linkstation::transport {

class SerialLink : public ILink {
public:
  SerialLink() = default;
  ~SerialLink() override { close(); }

  SerialLink(const SerialLink&) = delete;
  SerialLink& operator=(const SerialLink&) = delete;

  bool        open(const std::string& path, int baud, std::string& err) override;
  void        close() override;
  bool        is_open() const override { return fd_ >= 0; }
  bool        discard_input() override;
  bool        write_all(const std::string& data) override;
  ReadResult  read_some(std::string& out, std::chrono::milliseconds wait) override;
  const char* name() const override { return "serial"; }

private:
  int fd_{-1};
};

} // namespace linkstation::transport
