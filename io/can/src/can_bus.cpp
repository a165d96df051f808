#include "io/can/can_bus.hpp"

#include <cmath>
#include <cstdio>
#include <exception>
#include <stdexcept>

#include <common/errors.hpp>
#include <common/logging.hpp>

namespace tradar::io::can {

CanBus::CanBus(std::string channel, std::string interface_name, std::unique_ptr<ICanLink> link)
    : channel_(std::move(channel)),
      interface_name_(std::move(interface_name)),
      link_(std::move(link)) {
  open_.store(link_ != nullptr && link_->valid());
}

CanBus::~CanBus() { Shutdown(); }

std::unique_ptr<CanBus> CanBus::Open(const std::string& channel,
                                     const std::string& interface_name,
                                     uint32_t bitrate) {
  const std::string canonical = canonicalize_interface(interface_name);
  auto link = make_can_link(canonical);
  if (!link) {
    throw errors::TransportError("Unsupported CAN interface '" + interface_name + "'",
                                 channel);
  }
  if (channel.empty()) {
    throw errors::TransportError("CAN channel name is empty", canonical);
  }
  if (!link->open(channel, false)) {
    throw errors::TransportError("Failed to open " + canonical + " channel", channel);
  }
  auto bus = std::make_unique<CanBus>(channel, canonical, std::move(link));
  bus->bitrate_ = bitrate;
  log::Logf(log::Level::kInfo, "Opened CAN bus %s (%s)", channel.c_str(), canonical.c_str());
  return bus;
}

void CanBus::Send(const can_frame& frame) {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  if (!open_.load() || !link_) {
    throw errors::TransportError("Send on closed bus", channel_);
  }
  if (!link_->send(frame)) {
    char id[16];
    std::snprintf(id, sizeof(id), "0x%X", ArbitrationId(frame));
    throw errors::TransportError(std::string("Failed to send frame ") + id, channel_);
  }
}

std::optional<can_frame> CanBus::Receive(std::chrono::milliseconds timeout) {
  if (!open_.load() || !link_) {
    std::this_thread::sleep_for(timeout);
    return std::nullopt;
  }
  return link_->receive(timeout);
}

void CanBus::Shutdown() {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  if (!open_.exchange(false)) {
    return;
  }
  if (link_) {
    link_->close();
  }
  log::Logf(log::Level::kInfo, "Closed CAN bus %s", channel_.c_str());
}

CanNotifier::CanNotifier(CanBus& bus, std::chrono::milliseconds poll_timeout)
    : bus_(bus), poll_timeout_(poll_timeout) {}

CanNotifier::~CanNotifier() { Stop(); }

void CanNotifier::AddListener(Listener listener) {
  if (running_.load()) {
    throw std::logic_error("CanNotifier listeners must be added before Start()");
  }
  listeners_.push_back(std::move(listener));
}

void CanNotifier::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&CanNotifier::Run, this);
}

void CanNotifier::Stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }
}

void CanNotifier::Run() {
  while (running_.load()) {
    std::optional<can_frame> frame = bus_.Receive(poll_timeout_);
    if (!frame) {
      continue;
    }
    for (const auto& listener : listeners_) {
      try {
        listener(*frame);
      } catch (const std::exception& e) {
        log::Logf(log::Level::kError, "CAN listener on %s failed: %s", bus_.channel().c_str(),
                  e.what());
      } catch (...) {
        log::Logf(log::Level::kError, "CAN listener on %s failed with unknown exception",
                  bus_.channel().c_str());
      }
    }
  }
}

std::chrono::milliseconds ToPollTimeout(double seconds) {
  if (!std::isfinite(seconds) || seconds <= 0.0) {
    return std::chrono::milliseconds(1);
  }
  const auto ms = static_cast<long long>(std::llround(seconds * 1000.0));
  return std::chrono::milliseconds(ms < 1 ? 1 : ms);
}

}  // namespace tradar::io::can
