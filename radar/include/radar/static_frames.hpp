#pragma once

#include <cstdint>
#include <vector>

namespace tradar::radar {

// ECU a heartbeat frame impersonates.
enum class Ecu : uint8_t { kCam = 0, kDsu = 1, kApgs = 2 };

enum class BusSelect : uint8_t { kCar = 0, kRadar = 1 };

struct StaticFrame {
  uint32_t address{0};
  Ecu ecu{Ecu::kDsu};
  BusSelect bus{BusSelect::kCar};
  // Sent on ticks 0, divisor, 2 * divisor, ...
  uint32_t divisor{1};
  std::vector<uint8_t> payload;
};

using StaticFrameTable = std::vector<StaticFrame>;

// Addresses that carry a rolling counter byte after their fixed payload.
constexpr uint32_t kRollingCounterAddress = 0x489;
constexpr uint32_t kRollingCounterFlaggedAddress = 0x48A;

// Driver-support ECU heartbeat table for Prius-family radars.
const StaticFrameTable& ToyotaDsuFrames();

bool IsDue(const StaticFrame& frame, uint64_t frame_counter);

// ((frame_counter / 100) % 15) + 1, with bit 7 set for the flagged address.
uint8_t RollingCounter(uint32_t address, uint64_t frame_counter);

// Payload to transmit for `frame` on tick `frame_counter`.
std::vector<uint8_t> BuildPayload(const StaticFrame& frame, uint64_t frame_counter);

}  // namespace tradar::radar
