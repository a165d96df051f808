#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "can_defs.hpp"
#include "can_link.hpp"

namespace tradar::io::can {

// In-process bus. Every link opened on the same channel name receives the
// frames the other links send; with loopback enabled it also sees its own.
class VirtualCanLink : public ICanLink {
 public:
  static constexpr size_t kMaxPendingFrames = 4096;

  VirtualCanLink();
  ~VirtualCanLink() override;

  VirtualCanLink(const VirtualCanLink&) = delete;
  VirtualCanLink& operator=(const VirtualCanLink&) = delete;

  bool open(const std::string& channel, bool enable_loopback) override;
  void close() override;
  bool send(const can_frame& frame) override;
  std::optional<can_frame> receive(std::chrono::milliseconds timeout) override;
  bool valid() const override;

  struct Endpoint {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<can_frame> pending;
    bool loopback{false};
  };

 private:
  std::shared_ptr<Endpoint> endpoint_;
  std::string channel_;
};

}  // namespace tradar::io::can
