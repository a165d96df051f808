#pragma once

#include <linux/can.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <vector>

namespace tradar::io::can {

inline uint32_t ArbitrationId(const can_frame& frame) {
  if (frame.can_id & CAN_EFF_FLAG) {
    return frame.can_id & CAN_EFF_MASK;
  }
  return frame.can_id & CAN_SFF_MASK;
}

inline bool IsExtended(const can_frame& frame) { return (frame.can_id & CAN_EFF_FLAG) != 0; }

// Build a classic CAN frame; payloads longer than eight bytes are truncated.
inline can_frame MakeFrame(uint32_t id, const uint8_t* data, size_t size, bool extended = false) {
  can_frame frame{};
  frame.can_id = extended ? ((id & CAN_EFF_MASK) | CAN_EFF_FLAG) : (id & CAN_SFF_MASK);
  frame.can_dlc = static_cast<uint8_t>(std::min<size_t>(size, CAN_MAX_DLEN));
  if (data && frame.can_dlc > 0) {
    std::memcpy(frame.data, data, frame.can_dlc);
  }
  return frame;
}

inline can_frame MakeFrame(uint32_t id, const std::vector<uint8_t>& data, bool extended = false) {
  return MakeFrame(id, data.data(), data.size(), extended);
}

inline can_frame MakeFrame(uint32_t id, std::initializer_list<uint8_t> data) {
  const std::vector<uint8_t> bytes(data);
  return MakeFrame(id, bytes);
}

inline std::vector<uint8_t> Payload(const can_frame& frame) {
  const size_t size = std::min<size_t>(frame.can_dlc, CAN_MAX_DLEN);
  return std::vector<uint8_t>(frame.data, frame.data + size);
}

}  // namespace tradar::io::can
