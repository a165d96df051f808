#include "radar/keepalive.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#include <common/logging.hpp>

namespace tradar::radar {
namespace {

std::chrono::nanoseconds PeriodFor(double rate_hz) {
  const double rate = std::max(rate_hz, 1.0);
  return std::chrono::nanoseconds(static_cast<int64_t>(1e9 / rate));
}

const io::can::dbc::SignalValues& AccControlValues() {
  static const io::can::dbc::SignalValues kValues = {
      {"ACCEL_CMD", 0.0},
      {"SET_ME_X63", 0x63},
      {"SET_ME_1", 1.0},
      {"RELEASE_STANDSTILL", 1.0},
      {"CANCEL_REQ", 0.0},
  };
  return kValues;
}

}  // namespace

KeepAliveScheduler::KeepAliveScheduler(io::can::CanBus& car_bus, io::can::CanBus& radar_bus,
                                       const io::can::dbc::Database& control_db,
                                       StaticFrameTable table, double rate_hz,
                                       std::chrono::milliseconds join_timeout)
    : car_bus_(car_bus),
      radar_bus_(radar_bus),
      control_db_(control_db),
      table_(std::move(table)),
      period_(PeriodFor(rate_hz)),
      join_timeout_(join_timeout),
      has_acc_control_(control_db.HasMessage(kAccControlMessage)) {}

KeepAliveScheduler::~KeepAliveScheduler() { Stop(); }

void KeepAliveScheduler::Start() {
  State expected = State::kIdle;
  if (!state_.compare_exchange_strong(expected, State::kRunning)) {
    log::Logf(log::Level::kWarning, "Keep-alive start ignored in state %s", ToString(expected));
    return;
  }
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&KeepAliveScheduler::Run, this);
  log::Logf(log::Level::kInfo, "Keep-alive started at %.1f Hz",
            1e9 / static_cast<double>(period_.count()));
}

void KeepAliveScheduler::Stop() {
  State expected = State::kIdle;
  if (state_.compare_exchange_strong(expected, State::kStopped)) {
    return;
  }
  expected = State::kRunning;
  if (state_.compare_exchange_strong(expected, State::kStopping)) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    stop_requested_ = true;
    wake_cv_.notify_all();
    const bool acknowledged = stopped_cv_.wait_for(
        lock, join_timeout_, [this] { return state_.load() == State::kStopped; });
    lock.unlock();
    if (!acknowledged) {
      log::Logf(log::Level::kWarning, "Keep-alive loop did not stop within %lld ms",
                static_cast<long long>(join_timeout_.count()));
    }
  }
  if (thread_.joinable()) {
    thread_.join();
  }
}

void KeepAliveScheduler::RunTick() {
  uint64_t frame_counter = 0;
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    frame_counter = status_.frame_counter;
  }

  uint64_t sent = 0;
  std::optional<std::string> error;

  if (has_acc_control_) {
    try {
      car_bus_.Send(control_db_.EncodeFrame(kAccControlMessage, AccControlValues()));
      ++sent;
    } catch (const std::exception& e) {
      error = e.what();
    }
  } else if (!warned_missing_acc_) {
    warned_missing_acc_ = true;
    log::Logf(log::Level::kWarning, "Control database %s has no %s; heartbeat sent without it",
              control_db_.origin().c_str(), kAccControlMessage);
  }

  for (const auto& frame : table_) {
    if (!IsDue(frame, frame_counter)) {
      continue;
    }
    io::can::CanBus& bus = frame.bus == BusSelect::kCar ? car_bus_ : radar_bus_;
    try {
      bus.Send(io::can::MakeFrame(frame.address, BuildPayload(frame, frame_counter)));
      ++sent;
    } catch (const std::exception& e) {
      error = e.what();
    }
  }

  if (error) {
    log::Logf(log::Level::kDebug, "Keep-alive tick %llu: %s",
              static_cast<unsigned long long>(frame_counter), error->c_str());
  }

  std::lock_guard<std::mutex> lock(status_mutex_);
  status_.tx_count += sent;
  status_.last_error = std::move(error);
  ++status_.frame_counter;
}

KeepAliveStatus KeepAliveScheduler::Status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_;
}

void KeepAliveScheduler::Run() {
  for (;;) {
    {
      std::lock_guard<std::mutex> lock(wake_mutex_);
      if (stop_requested_) {
        break;
      }
    }
    const auto tick_start = std::chrono::steady_clock::now();
    RunTick();
    // An overrunning tick is followed immediately by the next one, never a burst.
    std::unique_lock<std::mutex> lock(wake_mutex_);
    if (wake_cv_.wait_until(lock, tick_start + period_, [this] { return stop_requested_; })) {
      break;
    }
  }
  std::lock_guard<std::mutex> lock(wake_mutex_);
  state_.store(State::kStopped);
  stopped_cv_.notify_all();
  log::LogInfo("Keep-alive stopped");
}

const char* ToString(KeepAliveScheduler::State state) {
  switch (state) {
    case KeepAliveScheduler::State::kIdle:
      return "idle";
    case KeepAliveScheduler::State::kRunning:
      return "running";
    case KeepAliveScheduler::State::kStopping:
      return "stopping";
    case KeepAliveScheduler::State::kStopped:
      return "stopped";
  }
  return "unknown";
}

}  // namespace tradar::radar
