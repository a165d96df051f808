#include <common/time/radar_clock.hpp>

#include <chrono>
#include <cmath>
#include <mutex>

namespace tradar::time {
namespace {

constexpr double kNsPerSec = 1e9;

struct ClockState {
  std::mutex mutex;
  Mode mode{Mode::kRealtime};
  uint64_t base_ns{0};
  std::chrono::steady_clock::time_point origin{std::chrono::steady_clock::now()};
  uint64_t sim_now_ns{0};
};

ClockState& State() {
  static ClockState state;
  return state;
}

uint64_t NowLocked(const ClockState& state) {
  if (state.mode == Mode::kSimulated) {
    return state.sim_now_ns;
  }
  const auto elapsed = std::chrono::steady_clock::now() - state.origin;
  return state.base_ns +
         static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
}

}  // namespace

uint64_t now() {
  ClockState& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  return NowLocked(state);
}

uint64_t advance(uint64_t delta_ns) {
  ClockState& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  if (state.mode == Mode::kSimulated) {
    state.sim_now_ns += delta_ns;
  }
  return NowLocked(state);
}

uint64_t set(uint64_t absolute_ns) {
  ClockState& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  if (state.mode == Mode::kSimulated) {
    state.sim_now_ns = absolute_ns;
  } else {
    state.base_ns = absolute_ns;
    state.origin = std::chrono::steady_clock::now();
  }
  return absolute_ns;
}

Mode mode() {
  ClockState& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  return state.mode;
}

void useSimulated(uint64_t start_ns) {
  ClockState& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.mode = Mode::kSimulated;
  state.sim_now_ns = start_ns;
}

void useRealtime() {
  ClockState& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.mode = Mode::kRealtime;
  state.base_ns = 0;
  state.origin = std::chrono::steady_clock::now();
}

uint64_t fromSeconds(double seconds) {
  if (!(seconds > 0.0)) {
    return 0;
  }
  return static_cast<uint64_t>(std::llround(seconds * kNsPerSec));
}

double toSeconds(uint64_t nanoseconds) { return static_cast<double>(nanoseconds) / kNsPerSec; }

}  // namespace tradar::time
