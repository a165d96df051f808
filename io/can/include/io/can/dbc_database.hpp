#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "can_defs.hpp"

namespace tradar::io::can::dbc {

using SignalValues = std::map<std::string, double>;

constexpr const char* kChecksumSignal = "CHECKSUM";

enum class ByteOrder {
  kMotorola,  // @0, start bit is the most significant bit
  kIntel,     // @1, start bit is the least significant bit
};

struct SignalDef {
  std::string name;
  int start_bit{0};
  int length{0};
  ByteOrder byte_order{ByteOrder::kIntel};
  bool is_signed{false};
  double factor{1.0};
  double offset{0.0};
  double minimum{0.0};
  double maximum{0.0};
  std::string unit;

  // [0|0] in a DBC file means the signal is unbounded.
  bool HasRange() const { return !(minimum == 0.0 && maximum == 0.0); }
};

struct MessageDef {
  uint32_t id{0};
  bool extended{false};
  std::string name;
  uint8_t length{0};
  std::string sender;
  std::vector<SignalDef> signals;

  const SignalDef* FindSignal(const std::string& signal_name) const;
};

// Signal database loaded from a DBC description. Immutable after loading and
// safe to share between threads.
class Database {
 public:
  Database() = default;

  // Throws errors::DatabaseNotFoundError or errors::DatabaseParseError.
  static Database LoadFile(const std::string& path);
  // `origin` names the source in error messages.
  static Database LoadString(const std::string& text, const std::string& origin = "<string>");

  const MessageDef* FindMessage(uint32_t id) const;
  const MessageDef* FindMessage(const std::string& name) const;
  bool HasMessage(const std::string& name) const { return FindMessage(name) != nullptr; }

  // Throws errors::DecodeError for an unknown id or a short payload.
  SignalValues Decode(uint32_t id, const std::vector<uint8_t>& data) const;
  SignalValues Decode(const can_frame& frame) const;

  // Throws errors::EncodeError. A CHECKSUM signal left out of `values` is
  // filled with the Toyota checksum of the encoded payload.
  std::vector<uint8_t> Encode(const std::string& message_name, const SignalValues& values) const;
  can_frame EncodeFrame(const std::string& message_name, const SignalValues& values) const;

  const std::vector<MessageDef>& messages() const { return messages_; }
  const std::string& origin() const { return origin_; }

 private:
  std::vector<MessageDef> messages_;
  std::map<uint32_t, size_t> by_id_;
  std::map<std::string, size_t> by_name_;
  std::string origin_;
};

// Toyota checksum: low and high address bytes, the length, and every payload
// byte except the last, which holds the checksum itself.
uint8_t ToyotaChecksum(uint32_t id, const std::vector<uint8_t>& payload);

}  // namespace tradar::io::can::dbc
