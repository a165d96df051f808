#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "io/can/can_bus.hpp"
#include "io/can/dbc_database.hpp"
#include "keepalive.hpp"
#include "link_setup.hpp"
#include "radar_types.hpp"
#include "track_cache.hpp"
#include "track_listener.hpp"

namespace tradar::radar {

// Owns both bus sessions, both signal databases, the heartbeat scheduler and
// the radar-bus listener, and exposes the live track table.
class RadarDriver {
 public:
  // Throws errors::ConfigError when `config` is invalid. A null configurator
  // means link bring-up runs through the shell.
  explicit RadarDriver(RadarConfig config = {},
                       std::unique_ptr<LinkConfigurator> configurator = nullptr);
  ~RadarDriver();

  RadarDriver(const RadarDriver&) = delete;
  RadarDriver& operator=(const RadarDriver&) = delete;

  // No-op when already running. On failure everything opened so far is torn
  // down and the error (ConfigError or TransportError) is rethrown.
  void Start();
  // Idempotent; never throws.
  void Stop();

  TrackMap GetTracks();
  TrackMap GetTracks(uint64_t now_ns);

  // Register before Start() to observe the earliest frames. Safe to call from
  // inside a callback.
  void RegisterTrackCallback(TrackCallback callback);
  void RegisterRawCallback(RawFrameCallback callback);

  // The queries below never block on Start()/Stop() and may be called from
  // callbacks. nullopt when keep-alive is disabled or has not been started.
  std::optional<KeepAliveStatus> GetKeepAliveStatus() const;
  uint64_t MessageCount() const;
  ListenerStats GetListenerStats() const;
  bool IsRunning() const { return running_.load(); }

  const RadarConfig& config() const { return config_; }

 private:
  void SendInitialFrames();
  void TearDown();
  void ReleaseComponents();

  const RadarConfig config_;
  std::unique_ptr<LinkConfigurator> configurator_;
  TrackCache cache_;

  io::can::dbc::Database radar_db_;
  io::can::dbc::Database control_db_;
  std::unique_ptr<io::can::CanBus> car_bus_;
  std::unique_ptr<io::can::CanBus> radar_bus_;
  std::unique_ptr<io::can::CanNotifier> notifier_;

  // Held across Start()/Stop(), including the joins of the worker threads.
  mutable std::mutex lifecycle_mutex_;

  // Short-held; guards the members below so that queries and callback
  // registration from inside a callback never wait on lifecycle_mutex_.
  mutable std::mutex components_mutex_;
  std::shared_ptr<KeepAliveScheduler> keepalive_;
  std::shared_ptr<TrackListener> listener_;
  std::vector<TrackCallback> track_callbacks_;
  std::vector<RawFrameCallback> raw_callbacks_;

  std::atomic<bool> running_{false};
};

}  // namespace tradar::radar
