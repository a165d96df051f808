#pragma once

#include "can_link.hpp"

#include <optional>
#include <string>

namespace tradar::io::can {

// Raw SocketCAN socket bound to one kernel interface (can0, vcan0, ...).
// The interface must already be up.
class SocketCanLink : public ICanLink {
 public:
  SocketCanLink();
  ~SocketCanLink() override;

  SocketCanLink(const SocketCanLink&) = delete;
  SocketCanLink& operator=(const SocketCanLink&) = delete;

  bool open(const std::string& iface, bool enable_loopback = false) override;
  void close() override;

  // False when the kernel queue is full or the interface went down.
  bool send(const can_frame& frame) override;
  std::optional<can_frame> receive(std::chrono::milliseconds timeout) override;

  bool valid() const override { return fd_ >= 0; }

 private:
  int fd_;
  std::string iface_;
};

}  // namespace tradar::io::can
