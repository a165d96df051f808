#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "can_defs.hpp"

namespace tradar::io::can {

constexpr uint16_t kDefaultCanUdpPort = 47010;

constexpr const char* kInterfaceSocketCan = "socketcan";
constexpr const char* kInterfaceUdp = "udp";
constexpr const char* kInterfaceVirtual = "virtual";

class ICanLink {
 public:
  virtual ~ICanLink() = default;

  virtual bool open(const std::string& channel, bool enable_loopback) = 0;
  virtual void close() = 0;
  virtual bool send(const can_frame& frame) = 0;
  // Waits at most `timeout` for one frame. A zero timeout polls.
  virtual std::optional<can_frame> receive(std::chrono::milliseconds timeout) = 0;
  virtual bool valid() const = 0;
};

// Returns nullptr when the interface name is not supported on this platform.
std::unique_ptr<ICanLink> make_can_link(const std::string& interface_name);
std::string canonicalize_interface(const std::string& interface_name);
bool is_supported_interface(const std::string& interface_name);

struct UdpPorts {
  uint16_t rx_port{kDefaultCanUdpPort};
  uint16_t tx_port{kDefaultCanUdpPort};
};

// Parses "<port>" or "<rx_port>:<tx_port>"; malformed parts fall back to the default port.
UdpPorts parse_udp_channel(const std::string& channel);

}  // namespace tradar::io::can
