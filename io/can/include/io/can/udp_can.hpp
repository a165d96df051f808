#pragma once

#include "can_link.hpp"

#include <netinet/in.h>

#include <optional>
#include <string>

namespace tradar::io::can {

// CAN frames tunnelled over loopback UDP for bench setups without CAN
// hardware. The channel names the ports (see parse_udp_channel): frames are
// received on rx_port and sent to tx_port on 127.0.0.1.
class UdpCanLink : public ICanLink {
 public:
  UdpCanLink() = default;
  ~UdpCanLink() override;

  UdpCanLink(const UdpCanLink&) = delete;
  UdpCanLink& operator=(const UdpCanLink&) = delete;

  bool open(const std::string& channel, bool enable_loopback = false) override;
  void close() override;

  bool send(const can_frame& frame) override;
  std::optional<can_frame> receive(std::chrono::milliseconds timeout) override;

  bool valid() const override { return fd_ >= 0; }

 private:
  int fd_{-1};
  sockaddr_in peer_{};
};

}  // namespace tradar::io::can
