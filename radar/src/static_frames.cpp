#include "radar/static_frames.hpp"

namespace tradar::radar {

const StaticFrameTable& ToyotaDsuFrames() {
  static const StaticFrameTable kTable = {
      {0x141, Ecu::kDsu, BusSelect::kRadar, 2, {0x00, 0x00, 0x00, 0x46}},
      {0x128, Ecu::kDsu, BusSelect::kRadar, 3, {0xf4, 0x01, 0x90, 0x83, 0x00, 0x37}},
      {0x283, Ecu::kDsu, BusSelect::kCar, 3, {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x8c}},
      {0x344, Ecu::kDsu, BusSelect::kCar, 5, {0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x50}},
      {0x160, Ecu::kDsu, BusSelect::kRadar, 7, {0x00, 0x00, 0x08, 0x12, 0x01, 0x31, 0x9c, 0x51}},
      {0x161, Ecu::kDsu, BusSelect::kRadar, 7, {0x00, 0x1e, 0x00, 0x00, 0x00, 0x80, 0x07}},
      {0x365, Ecu::kDsu, BusSelect::kCar, 20, {0x00, 0x00, 0x00, 0x80, 0xfc, 0x00, 0x08}},
      {0x366, Ecu::kDsu, BusSelect::kCar, 20, {0x00, 0x72, 0x07, 0xff, 0x09, 0xfe, 0x00}},
      {0x4CB, Ecu::kDsu, BusSelect::kCar, 100, {0x0c, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}},
  };
  return kTable;
}

bool IsDue(const StaticFrame& frame, uint64_t frame_counter) {
  if (frame.divisor == 0) {
    return false;
  }
  return frame_counter % frame.divisor == 0;
}

uint8_t RollingCounter(uint32_t address, uint64_t frame_counter) {
  uint8_t counter = static_cast<uint8_t>(((frame_counter / 100) % 15) + 1);
  if (address == kRollingCounterFlaggedAddress) {
    counter |= 0x80;
  }
  return counter;
}

std::vector<uint8_t> BuildPayload(const StaticFrame& frame, uint64_t frame_counter) {
  std::vector<uint8_t> data = frame.payload;
  const bool rolling = frame.address == kRollingCounterAddress ||
                       frame.address == kRollingCounterFlaggedAddress;
  // 0x489/0x48A are not in the current DSU table.
  if (rolling && frame.bus == BusSelect::kCar) {
    data.push_back(RollingCounter(frame.address, frame_counter));
  }
  return data;
}

}  // namespace tradar::radar
