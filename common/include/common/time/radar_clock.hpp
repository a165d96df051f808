#pragma once

#include <cstdint>

// Process-wide nanosecond clock used to stamp tracks and age them out.
// Realtime mode follows std::chrono::steady_clock; simulated mode only moves
// when advanced or set, which makes expiry deterministic under test.
namespace tradar::time {

enum class Mode {
  kRealtime,
  kSimulated,
};

uint64_t now();

// Returns the new time. No effect in realtime mode.
uint64_t advance(uint64_t delta_ns);

// Realtime mode re-bases the clock so that now() continues from `absolute_ns`.
uint64_t set(uint64_t absolute_ns);

Mode mode();
inline bool isSimulated() { return mode() == Mode::kSimulated; }

void useSimulated(uint64_t start_ns = 0);
void useRealtime();

// Non-positive durations map to zero.
uint64_t fromSeconds(double seconds);
double toSeconds(uint64_t nanoseconds);

}  // namespace tradar::time
