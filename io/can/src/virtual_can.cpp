#include "io/can/virtual_can.hpp"

#include <algorithm>
#include <map>
#include <vector>

namespace tradar::io::can {
namespace {

struct Hub {
  std::mutex mutex;
  std::map<std::string, std::vector<std::weak_ptr<VirtualCanLink::Endpoint>>> channels;
};

Hub& GetHub() {
  static Hub hub;
  return hub;
}

void Deliver(VirtualCanLink::Endpoint& endpoint, const can_frame& frame) {
  {
    std::lock_guard<std::mutex> lock(endpoint.mutex);
    endpoint.pending.push_back(frame);
    if (endpoint.pending.size() > VirtualCanLink::kMaxPendingFrames) {
      endpoint.pending.pop_front();
    }
  }
  endpoint.cv.notify_one();
}

}  // namespace

VirtualCanLink::VirtualCanLink() = default;

VirtualCanLink::~VirtualCanLink() { close(); }

bool VirtualCanLink::open(const std::string& channel, bool enable_loopback) {
  close();
  auto endpoint = std::make_shared<Endpoint>();
  endpoint->loopback = enable_loopback;

  auto& hub = GetHub();
  {
    std::lock_guard<std::mutex> lock(hub.mutex);
    hub.channels[channel].push_back(endpoint);
  }
  endpoint_ = std::move(endpoint);
  channel_ = channel;
  return true;
}

void VirtualCanLink::close() {
  if (!endpoint_) {
    return;
  }
  auto& hub = GetHub();
  {
    std::lock_guard<std::mutex> lock(hub.mutex);
    auto it = hub.channels.find(channel_);
    if (it != hub.channels.end()) {
      auto& peers = it->second;
      peers.erase(std::remove_if(peers.begin(), peers.end(),
                                 [this](const std::weak_ptr<Endpoint>& peer) {
                                   auto locked = peer.lock();
                                   return !locked || locked == endpoint_;
                                 }),
                  peers.end());
      if (peers.empty()) {
        hub.channels.erase(it);
      }
    }
  }
  endpoint_->cv.notify_all();
  endpoint_.reset();
  channel_.clear();
}

bool VirtualCanLink::send(const can_frame& frame) {
  if (!endpoint_) {
    return false;
  }
  std::vector<std::shared_ptr<Endpoint>> targets;
  {
    auto& hub = GetHub();
    std::lock_guard<std::mutex> lock(hub.mutex);
    auto it = hub.channels.find(channel_);
    if (it != hub.channels.end()) {
      for (const auto& peer : it->second) {
        auto locked = peer.lock();
        if (!locked) {
          continue;
        }
        if (locked == endpoint_ && !endpoint_->loopback) {
          continue;
        }
        targets.push_back(std::move(locked));
      }
    }
  }
  for (const auto& target : targets) {
    Deliver(*target, frame);
  }
  return true;
}

std::optional<can_frame> VirtualCanLink::receive(std::chrono::milliseconds timeout) {
  std::shared_ptr<Endpoint> endpoint = endpoint_;
  if (!endpoint) {
    return std::nullopt;
  }
  std::unique_lock<std::mutex> lock(endpoint->mutex);
  if (!endpoint->cv.wait_for(lock, timeout, [&] { return !endpoint->pending.empty(); })) {
    return std::nullopt;
  }
  can_frame frame = endpoint->pending.front();
  endpoint->pending.pop_front();
  return frame;
}

bool VirtualCanLink::valid() const { return endpoint_ != nullptr; }

}  // namespace tradar::io::can
