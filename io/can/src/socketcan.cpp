#include "io/can/socketcan.hpp"

#include <fcntl.h>
#include <linux/can.h>
#include <linux/can/raw.h>
#include <net/if.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <common/logging.hpp>

namespace tradar::io::can {
namespace {

void LogErrno(log::Level level, const char* what, const std::string& iface) {
  log::Logf(level, "%s on %s failed: %s", what, iface.c_str(), std::strerror(errno));
}

// Radar and car traffic are standard data frames; bus error frames are not
// requested so they never reach the decode path.
bool ConfigureRaw(int fd, bool enable_loopback, const std::string& iface) {
  const int recv_own = enable_loopback ? 1 : 0;
  if (::setsockopt(fd, SOL_CAN_RAW, CAN_RAW_RECV_OWN_MSGS, &recv_own, sizeof(recv_own)) < 0) {
    LogErrno(log::Level::kWarning, "setsockopt(CAN_RAW_RECV_OWN_MSGS)", iface);
  }
  const can_err_mask_t err_mask = 0;
  if (::setsockopt(fd, SOL_CAN_RAW, CAN_RAW_ERR_FILTER, &err_mask, sizeof(err_mask)) < 0) {
    LogErrno(log::Level::kWarning, "setsockopt(CAN_RAW_ERR_FILTER)", iface);
  }
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    LogErrno(log::Level::kError, "fcntl(O_NONBLOCK)", iface);
    return false;
  }
  return true;
}

}  // namespace

SocketCanLink::SocketCanLink() : fd_(-1) {}

SocketCanLink::~SocketCanLink() { close(); }

bool SocketCanLink::open(const std::string& iface, bool enable_loopback) {
  close();
  if (iface.empty() || iface.size() >= IFNAMSIZ) {
    log::Logf(log::Level::kError, "Invalid SocketCAN interface name '%s'", iface.c_str());
    return false;
  }

  const unsigned int ifindex = ::if_nametoindex(iface.c_str());
  if (ifindex == 0) {
    LogErrno(log::Level::kError, "if_nametoindex", iface);
    return false;
  }

  const int fd = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
  if (fd < 0) {
    LogErrno(log::Level::kError, "socket(PF_CAN)", iface);
    return false;
  }

  sockaddr_can addr{};
  addr.can_family = AF_CAN;
  addr.can_ifindex = static_cast<int>(ifindex);
  if (!ConfigureRaw(fd, enable_loopback, iface)) {
    ::close(fd);
    return false;
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    LogErrno(log::Level::kError, "bind(can)", iface);
    ::close(fd);
    return false;
  }

  fd_ = fd;
  iface_ = iface;
  return true;
}

void SocketCanLink::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool SocketCanLink::send(const can_frame& frame) {
  if (fd_ < 0) {
    return false;
  }
  ssize_t written = -1;
  do {
    written = ::write(fd_, &frame, sizeof(frame));
  } while (written < 0 && errno == EINTR);
  if (written == static_cast<ssize_t>(sizeof(frame))) {
    return true;
  }
  if (written < 0 && errno != EAGAIN && errno != ENOBUFS) {
    LogErrno(log::Level::kWarning, "write(can)", iface_);
  }
  return false;
}

std::optional<can_frame> SocketCanLink::receive(std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    return std::nullopt;
  }
  pollfd pfd{fd_, POLLIN, 0};
  if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0 || (pfd.revents & POLLIN) == 0) {
    return std::nullopt;
  }
  can_frame frame{};
  const ssize_t n = ::read(fd_, &frame, sizeof(frame));
  if (n != static_cast<ssize_t>(sizeof(frame))) {
    return std::nullopt;
  }
  return frame;
}

}  // namespace tradar::io::can
