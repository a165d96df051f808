#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "can_defs.hpp"
#include "can_link.hpp"

namespace tradar::io::can {

// One open connection to a CAN channel. Sends are serialized; receives are
// expected from a single thread (the notifier).
class CanBus {
 public:
  CanBus(std::string channel, std::string interface_name, std::unique_ptr<ICanLink> link);
  ~CanBus();

  CanBus(const CanBus&) = delete;
  CanBus& operator=(const CanBus&) = delete;

  // Opens `channel` through the named back end. Throws errors::TransportError.
  // The bitrate is recorded only; link bring-up applies it to the interface.
  static std::unique_ptr<CanBus> Open(const std::string& channel,
                                      const std::string& interface_name,
                                      uint32_t bitrate);

  // Throws errors::TransportError when the frame could not be written.
  void Send(const can_frame& frame);
  std::optional<can_frame> Receive(std::chrono::milliseconds timeout);

  // Idempotent.
  void Shutdown();
  bool IsOpen() const { return open_.load(); }

  const std::string& channel() const { return channel_; }
  const std::string& interface_name() const { return interface_name_; }
  uint32_t bitrate() const { return bitrate_; }

 private:
  std::string channel_;
  std::string interface_name_;
  uint32_t bitrate_{0};
  std::unique_ptr<ICanLink> link_;
  std::mutex tx_mutex_;
  std::atomic<bool> open_{false};
};

// Receive loop on a background thread. Listeners are registered before Start()
// and are invoked on the loop thread for every inbound frame.
class CanNotifier {
 public:
  using Listener = std::function<void(const can_frame&)>;

  CanNotifier(CanBus& bus, std::chrono::milliseconds poll_timeout);
  ~CanNotifier();

  CanNotifier(const CanNotifier&) = delete;
  CanNotifier& operator=(const CanNotifier&) = delete;

  void AddListener(Listener listener);
  void Start();
  // Returns within roughly one poll timeout.
  void Stop();
  bool IsRunning() const { return running_.load(); }

  std::chrono::milliseconds poll_timeout() const { return poll_timeout_; }

 private:
  void Run();

  CanBus& bus_;
  std::chrono::milliseconds poll_timeout_;
  std::vector<Listener> listeners_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

// Seconds to a receive timeout, never below one millisecond.
std::chrono::milliseconds ToPollTimeout(double seconds);

}  // namespace tradar::io::can
