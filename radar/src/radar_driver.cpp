#include "radar/radar_driver.hpp"

#include <exception>
#include <string>
#include <utility>

#include <common/logging.hpp>
#include <common/time/radar_clock.hpp>
#include "radar/static_frames.hpp"

namespace tradar::radar {
namespace {

struct InitFrame {
  const char* message;
  io::can::dbc::SignalValues values;
};

// Baseline cruise state the radar expects to see before it streams tracks.
const std::vector<InitFrame>& InitialFrames() {
  static const std::vector<InitFrame> kFrames = {
      {"SPEED", {{"ENCODER", 0.0}, {"SPEED", 1.44}, {"CHECKSUM", 0.0}}},
      {"PCM_CRUISE",
       {{"CRUISE_STATE", 9.0},
        {"GAS_RELEASED", 0.0},
        {"STANDSTILL_ON", 0.0},
        {"ACCEL_NET", 0.0},
        {"CHECKSUM", 0.0}}},
      {"PCM_CRUISE_2",
       {{"MAIN_ON", 0.0}, {"LOW_SPEED_LOCKOUT", 0.0}, {"SET_SPEED", 0.0}, {"CHECKSUM", 0.0}}},
      {"ACC_CONTROL",
       {{"ACCEL_CMD", 0.0},
        {"SET_ME_X63", 0.0},
        {"RELEASE_STANDSTILL", 0.0},
        {"SET_ME_1", 0.0},
        {"CANCEL_REQ", 0.0},
        {"CHECKSUM", 0.0}}},
      {"PCM_CRUISE_SM", {{"MAIN_ON", 0.0}, {"CRUISE_CONTROL_STATE", 0.0}, {"UI_SET_SPEED", 0.0}}},
  };
  return kFrames;
}

RadarConfig Validated(RadarConfig config) {
  config.Validate();
  return config;
}

}  // namespace

RadarDriver::RadarDriver(RadarConfig config, std::unique_ptr<LinkConfigurator> configurator)
    : config_(Validated(std::move(config))),
      configurator_(configurator ? std::move(configurator)
                                 : std::make_unique<ShellLinkConfigurator>()),
      cache_(time::fromSeconds(config_.track_timeout_s)) {}

RadarDriver::~RadarDriver() { Stop(); }

void RadarDriver::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load()) {
    return;
  }
  ReleaseComponents();
  try {
    if (config_.auto_setup) {
      BringUpLinks(*configurator_, config_);
    }

    radar_db_ = io::can::dbc::Database::LoadFile(config_.radar_dbc);
    control_db_ = io::can::dbc::Database::LoadFile(config_.control_dbc);

    car_bus_ = io::can::CanBus::Open(config_.car_channel, config_.CarInterface(), config_.bitrate);
    radar_bus_ =
        io::can::CanBus::Open(config_.radar_channel, config_.RadarInterface(), config_.bitrate);

    SendInitialFrames();

    if (config_.keepalive_enabled) {
      auto keepalive = std::make_shared<KeepAliveScheduler>(*car_bus_, *radar_bus_, control_db_,
                                                            ToyotaDsuFrames(),
                                                            config_.keepalive_rate_hz);
      {
        std::lock_guard<std::mutex> components(components_mutex_);
        keepalive_ = keepalive;
      }
      keepalive->Start();
    }

    auto listener_owner = std::make_shared<TrackListener>(radar_db_, cache_);
    {
      std::lock_guard<std::mutex> components(components_mutex_);
      for (const auto& callback : track_callbacks_) {
        listener_owner->AddTrackCallback(callback);
      }
      for (const auto& callback : raw_callbacks_) {
        listener_owner->AddRawCallback(callback);
      }
      listener_ = listener_owner;
    }

    notifier_ = std::make_unique<io::can::CanNotifier>(
        *radar_bus_, io::can::ToPollTimeout(config_.poll_timeout_s));
    TrackListener* listener = listener_owner.get();
    notifier_->AddListener([listener](const can_frame& frame) { listener->OnFrame(frame); });
    notifier_->Start();
  } catch (const std::exception& e) {
    log::Logf(log::Level::kError, "Radar driver failed to start: %s", e.what());
    TearDown();
    ReleaseComponents();
    throw;
  }

  running_.store(true);
  log::Logf(log::Level::kInfo, "Radar driver running (car %s, radar %s)",
            config_.car_channel.c_str(), config_.radar_channel.c_str());
}

void RadarDriver::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.load()) {
    return;
  }
  TearDown();
  running_.store(false);
  log::LogInfo("Radar driver stopped");
}

void RadarDriver::TearDown() {
  if (notifier_) {
    notifier_->Stop();
  }
  if (keepalive_) {
    keepalive_->Stop();
  }
  if (radar_bus_) {
    radar_bus_->Shutdown();
  }
  if (car_bus_) {
    car_bus_->Shutdown();
  }
  cache_.Clear();
}

// Components reference the buses and databases, so they go first. A query
// still holding a copy only reads counters, which outlive the buses safely.
void RadarDriver::ReleaseComponents() {
  notifier_.reset();
  std::shared_ptr<TrackListener> listener;
  std::shared_ptr<KeepAliveScheduler> keepalive;
  {
    std::lock_guard<std::mutex> components(components_mutex_);
    listener.swap(listener_);
    keepalive.swap(keepalive_);
  }
  listener.reset();
  keepalive.reset();
  radar_bus_.reset();
  car_bus_.reset();
}

void RadarDriver::SendInitialFrames() {
  for (const auto& frame : InitialFrames()) {
    if (!control_db_.HasMessage(frame.message)) {
      log::Logf(log::Level::kDebug, "Init frame %s not in control database", frame.message);
      continue;
    }
    try {
      car_bus_->Send(control_db_.EncodeFrame(frame.message, frame.values));
    } catch (const std::exception& e) {
      log::Logf(log::Level::kWarning, "Init frame %s not sent (non-fatal): %s", frame.message,
                e.what());
    }
  }
}

TrackMap RadarDriver::GetTracks() { return cache_.SnapshotWithEviction(time::now()); }

TrackMap RadarDriver::GetTracks(uint64_t now_ns) { return cache_.SnapshotWithEviction(now_ns); }

// A listener left over from a stopped session may also receive the callback;
// it is replaced on the next Start().
void RadarDriver::RegisterTrackCallback(TrackCallback callback) {
  std::lock_guard<std::mutex> lock(components_mutex_);
  if (listener_) {
    listener_->AddTrackCallback(callback);
  }
  track_callbacks_.push_back(std::move(callback));
}

void RadarDriver::RegisterRawCallback(RawFrameCallback callback) {
  std::lock_guard<std::mutex> lock(components_mutex_);
  if (listener_) {
    listener_->AddRawCallback(callback);
  }
  raw_callbacks_.push_back(std::move(callback));
}

std::optional<KeepAliveStatus> RadarDriver::GetKeepAliveStatus() const {
  std::shared_ptr<KeepAliveScheduler> keepalive;
  {
    std::lock_guard<std::mutex> lock(components_mutex_);
    keepalive = keepalive_;
  }
  if (!keepalive) {
    return std::nullopt;
  }
  return keepalive->Status();
}

uint64_t RadarDriver::MessageCount() const {
  std::shared_ptr<TrackListener> listener;
  {
    std::lock_guard<std::mutex> lock(components_mutex_);
    listener = listener_;
  }
  return listener ? listener->MessageCount() : 0;
}

ListenerStats RadarDriver::GetListenerStats() const {
  std::shared_ptr<TrackListener> listener;
  {
    std::lock_guard<std::mutex> lock(components_mutex_);
    listener = listener_;
  }
  return listener ? listener->Stats() : ListenerStats{};
}

}  // namespace tradar::radar
