#include "io/can/udp_can.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <common/logging.hpp>

namespace tradar::io::can {
namespace {

// Wire layout: big-endian can_id (flags included), dlc, eight data bytes.
constexpr std::size_t kDatagramSize = 4 + 1 + CAN_MAX_DLEN;

void Pack(const can_frame& frame, uint8_t (&out)[kDatagramSize]) {
  std::memset(out, 0, sizeof(out));
  const uint32_t id_be = htonl(frame.can_id);
  std::memcpy(out, &id_be, sizeof(id_be));
  const uint8_t dlc = std::min<uint8_t>(frame.can_dlc, CAN_MAX_DLEN);
  out[4] = dlc;
  std::memcpy(out + 5, frame.data, dlc);
}

can_frame Unpack(const uint8_t (&in)[kDatagramSize]) {
  can_frame frame{};
  uint32_t id_be = 0;
  std::memcpy(&id_be, in, sizeof(id_be));
  frame.can_id = ntohl(id_be);
  frame.can_dlc = std::min<uint8_t>(in[4], CAN_MAX_DLEN);
  std::memcpy(frame.data, in + 5, frame.can_dlc);
  return frame;
}

}  // namespace

UdpCanLink::~UdpCanLink() { close(); }

bool UdpCanLink::open(const std::string& channel, bool /*enable_loopback*/) {
  close();
  const UdpPorts ports = parse_udp_channel(channel);

  const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    log::Logf(log::Level::kError, "socket(AF_INET) for udp channel %s failed: %s",
              channel.c_str(), std::strerror(errno));
    return false;
  }
  const int reuse = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    log::Logf(log::Level::kWarning, "setsockopt(SO_REUSEADDR) failed: %s", std::strerror(errno));
  }

  sockaddr_in local{};
  local.sin_family = AF_INET;
  local.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  local.sin_port = htons(ports.rx_port);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
    log::Logf(log::Level::kError, "bind(127.0.0.1:%u) failed: %s",
              static_cast<unsigned>(ports.rx_port), std::strerror(errno));
    ::close(fd);
    return false;
  }
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }

  peer_ = local;
  peer_.sin_port = htons(ports.tx_port);
  fd_ = fd;
  return true;
}

void UdpCanLink::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool UdpCanLink::send(const can_frame& frame) {
  if (fd_ < 0) {
    return false;
  }
  uint8_t datagram[kDatagramSize];
  Pack(frame, datagram);
  const ssize_t sent = ::sendto(fd_, datagram, sizeof(datagram), 0,
                                reinterpret_cast<const sockaddr*>(&peer_), sizeof(peer_));
  return sent == static_cast<ssize_t>(sizeof(datagram));
}

std::optional<can_frame> UdpCanLink::receive(std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    return std::nullopt;
  }
  pollfd pfd{fd_, POLLIN, 0};
  if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0 || (pfd.revents & POLLIN) == 0) {
    return std::nullopt;
  }
  uint8_t datagram[kDatagramSize];
  const ssize_t n = ::recv(fd_, datagram, sizeof(datagram), 0);
  if (n != static_cast<ssize_t>(sizeof(datagram))) {
    return std::nullopt;
  }
  return Unpack(datagram);
}

}  // namespace tradar::io::can
