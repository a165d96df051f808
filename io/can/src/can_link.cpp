#include "io/can/can_link.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>

#include "io/can/socketcan.hpp"
#include "io/can/udp_can.hpp"
#include "io/can/virtual_can.hpp"

namespace tradar::io::can {
namespace {

std::string to_lower(const std::string& value) {
  std::string lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::string trim(const std::string& text) {
  std::size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  std::size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}

uint16_t parse_port(const std::string& text, uint16_t fallback) {
  const std::string trimmed = trim(text);
  if (trimmed.empty()) {
    return fallback;
  }
  char* end = nullptr;
  long value = std::strtol(trimmed.c_str(), &end, 10);
  if (end == trimmed.c_str() || *end != '\0') {
    return fallback;
  }
  if (value <= 0 || value > 65535) {
    return fallback;
  }
  return static_cast<uint16_t>(value);
}

}  // namespace

std::unique_ptr<ICanLink> make_can_link(const std::string& interface_name) {
  const std::string canonical = canonicalize_interface(interface_name);
  if (canonical == kInterfaceSocketCan) {
    return std::make_unique<SocketCanLink>();
  }
  if (canonical == kInterfaceUdp) {
    return std::make_unique<UdpCanLink>();
  }
  if (canonical == kInterfaceVirtual) {
    return std::make_unique<VirtualCanLink>();
  }
  return nullptr;
}

std::string canonicalize_interface(const std::string& interface_name) {
  const std::string lowered = to_lower(trim(interface_name));
  if (lowered.empty()) {
    return kInterfaceSocketCan;
  }
  return lowered;
}

bool is_supported_interface(const std::string& interface_name) {
  const std::string canonical = canonicalize_interface(interface_name);
  return canonical == kInterfaceSocketCan || canonical == kInterfaceUdp ||
         canonical == kInterfaceVirtual;
}

UdpPorts parse_udp_channel(const std::string& channel) {
  UdpPorts ports{};
  const auto colon_pos = channel.find(':');
  if (colon_pos == std::string::npos) {
    ports.rx_port = parse_port(channel, kDefaultCanUdpPort);
    ports.tx_port = ports.rx_port;
    return ports;
  }
  ports.rx_port = parse_port(channel.substr(0, colon_pos), kDefaultCanUdpPort);
  ports.tx_port = parse_port(channel.substr(colon_pos + 1), kDefaultCanUdpPort);
  return ports;
}

}  // namespace tradar::io::can
