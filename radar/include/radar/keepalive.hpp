#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "io/can/can_bus.hpp"
#include "io/can/dbc_database.hpp"
#include "radar_types.hpp"
#include "static_frames.hpp"

namespace tradar::radar {

constexpr const char* kAccControlMessage = "ACC_CONTROL";

// Emulates the driver-support ECU heartbeat. Each tick sends ACC_CONTROL on the
// car bus followed by every static frame whose divisor divides the tick count.
class KeepAliveScheduler {
 public:
  enum class State { kIdle, kRunning, kStopping, kStopped };

  static constexpr std::chrono::milliseconds kDefaultJoinTimeout{1000};

  KeepAliveScheduler(io::can::CanBus& car_bus, io::can::CanBus& radar_bus,
                     const io::can::dbc::Database& control_db, StaticFrameTable table,
                     double rate_hz,
                     std::chrono::milliseconds join_timeout = kDefaultJoinTimeout);
  ~KeepAliveScheduler();

  KeepAliveScheduler(const KeepAliveScheduler&) = delete;
  KeepAliveScheduler& operator=(const KeepAliveScheduler&) = delete;

  // Idle -> Running. Ignored in any other state.
  void Start();
  // Running -> Stopping -> Stopped, waiting at most the join timeout for the
  // loop to acknowledge. Idle -> Stopped directly. If the acknowledgement
  // times out a warning is logged and the thread is still joined, so a tick
  // blocked inside a bus send delays the return until that send completes.
  void Stop();

  // One tick on the calling thread. Not to be mixed with a running loop.
  void RunTick();

  State state() const { return state_.load(); }
  KeepAliveStatus Status() const;
  std::chrono::nanoseconds period() const { return period_; }

 private:
  void Run();

  io::can::CanBus& car_bus_;
  io::can::CanBus& radar_bus_;
  const io::can::dbc::Database& control_db_;
  const StaticFrameTable table_;
  const std::chrono::nanoseconds period_;
  const std::chrono::milliseconds join_timeout_;
  const bool has_acc_control_;
  bool warned_missing_acc_{false};

  std::atomic<State> state_{State::kIdle};
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  bool stop_requested_{false};
  std::condition_variable stopped_cv_;
  std::thread thread_;

  mutable std::mutex status_mutex_;
  KeepAliveStatus status_{};
};

const char* ToString(KeepAliveScheduler::State state);

}  // namespace tradar::radar
