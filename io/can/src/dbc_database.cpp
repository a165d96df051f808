#include "io/can/dbc_database.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

#include <common/errors.hpp>

namespace tradar::io::can::dbc {
namespace {

constexpr uint32_t kDbcExtendedFlag = 0x80000000u;
constexpr const char* kIndependentSignalsMessage = "VECTOR__INDEPENDENT_SIG_MSG";

std::string Trim(const std::string& text) {
  std::size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  std::size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}

std::string FirstToken(const std::string& text) {
  std::size_t end = 0;
  while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) {
    ++end;
  }
  return text.substr(0, end);
}

// Unescaped double quotes on a line.
int CountQuotes(const std::string& text) {
  int count = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\\') {
      ++i;
      continue;
    }
    if (text[i] == '"') {
      ++count;
    }
  }
  return count;
}

std::string FormatId(uint32_t id) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "0x%X", id);
  return buffer;
}

// Payload bit positions of a signal, most significant bit first.
std::vector<int> BitPositions(const SignalDef& signal) {
  std::vector<int> positions;
  positions.reserve(static_cast<std::size_t>(signal.length));
  if (signal.byte_order == ByteOrder::kIntel) {
    for (int i = signal.length - 1; i >= 0; --i) {
      positions.push_back(signal.start_bit + i);
    }
    return positions;
  }
  int position = signal.start_bit;
  for (int i = 0; i < signal.length; ++i) {
    positions.push_back(position);
    if (position % 8 == 0) {
      position += 15;
    } else {
      position -= 1;
    }
  }
  return positions;
}

uint64_t ReadRaw(const std::vector<uint8_t>& data, const SignalDef& signal) {
  uint64_t raw = 0;
  for (int position : BitPositions(signal)) {
    const uint8_t bit = (data[static_cast<std::size_t>(position / 8)] >> (position % 8)) & 0x1u;
    raw = (raw << 1) | bit;
  }
  return raw;
}

void WriteRaw(std::vector<uint8_t>& data, const SignalDef& signal, uint64_t raw) {
  const std::vector<int> positions = BitPositions(signal);
  for (std::size_t i = 0; i < positions.size(); ++i) {
    const int position = positions[i];
    const int shift = signal.length - 1 - static_cast<int>(i);
    const uint8_t mask = static_cast<uint8_t>(1u << (position % 8));
    uint8_t& byte = data[static_cast<std::size_t>(position / 8)];
    if ((raw >> shift) & 0x1u) {
      byte |= mask;
    } else {
      byte &= static_cast<uint8_t>(~mask);
    }
  }
}

double ToPhysical(const SignalDef& signal, uint64_t raw) {
  double value = 0.0;
  if (signal.is_signed) {
    int64_t signed_raw = static_cast<int64_t>(raw);
    if (signal.length < 64 && ((raw >> (signal.length - 1)) & 0x1u)) {
      signed_raw = static_cast<int64_t>(raw) - (int64_t{1} << signal.length);
    }
    value = static_cast<double>(signed_raw);
  } else {
    value = static_cast<double>(raw);
  }
  return value * signal.factor + signal.offset;
}

uint64_t ToRaw(const SignalDef& signal, double value, const std::string& message_name) {
  const std::string context = message_name + "." + signal.name;
  if (!std::isfinite(value)) {
    throw errors::EncodeError("Value is not finite", context);
  }
  if (signal.HasRange()) {
    const double tolerance = std::fabs(signal.factor) * 1e-6;
    if (value < signal.minimum - tolerance || value > signal.maximum + tolerance) {
      std::ostringstream message;
      message << "Value " << value << " outside [" << signal.minimum << ", " << signal.maximum
              << "]";
      throw errors::EncodeError(message.str(), context);
    }
  }

  const double scaled = std::round((value - signal.offset) / signal.factor);
  const double lower = signal.is_signed ? -std::ldexp(1.0, signal.length - 1) : 0.0;
  const double upper = signal.is_signed ? std::ldexp(1.0, signal.length - 1) - 1.0
                                        : std::ldexp(1.0, signal.length) - 1.0;
  if (scaled < lower || scaled > upper) {
    std::ostringstream message;
    message << "Value " << value << " does not fit in " << signal.length << " bits";
    throw errors::EncodeError(message.str(), context);
  }

  const uint64_t mask =
      signal.length >= 64 ? ~uint64_t{0} : ((uint64_t{1} << signal.length) - 1u);
  if (signal.is_signed) {
    return static_cast<uint64_t>(static_cast<int64_t>(scaled)) & mask;
  }
  return static_cast<uint64_t>(scaled) & mask;
}

class Parser {
 public:
  Parser(const std::string& text, const std::string& origin) : text_(text), origin_(origin) {}

  std::vector<MessageDef> Run() {
    std::istringstream stream(text_);
    std::string line;
    bool in_string = false;
    while (std::getline(stream, line)) {
      ++line_number_;
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (in_string) {
        if (CountQuotes(line) % 2 == 1) {
          in_string = false;
        }
        continue;
      }
      const std::string trimmed = Trim(line);
      if (trimmed.empty()) {
        current_.reset();
        skip_current_ = false;
        continue;
      }
      const std::string keyword = FirstToken(trimmed);
      if (keyword == "BO_") {
        ParseMessage(trimmed);
      } else if (keyword == "SG_") {
        ParseSignal(trimmed);
      } else {
        current_.reset();
        skip_current_ = false;
        if (CountQuotes(trimmed) % 2 == 1) {
          in_string = true;
        }
      }
    }
    if (messages_.empty()) {
      throw errors::DatabaseParseError("No message definitions found", origin_);
    }
    return std::move(messages_);
  }

 private:
  errors::DatabaseParseError Error(const std::string& what) const {
    return errors::DatabaseParseError("line " + std::to_string(line_number_) + ": " + what,
                                      origin_);
  }

  void ParseMessage(const std::string& line) {
    std::istringstream tokens(line);
    std::string keyword;
    std::string id_text;
    std::string name;
    tokens >> keyword >> id_text >> name;
    if (name.empty()) {
      throw Error("malformed BO_ line");
    }
    if (name.back() == ':') {
      name.pop_back();
    } else {
      std::string colon;
      tokens >> colon;
      if (colon != ":") {
        throw Error("malformed BO_ line, expected ':' after " + name);
      }
    }
    int length = -1;
    std::string sender;
    if (!(tokens >> length) || length < 0 || length > 64) {
      throw Error("invalid length for message " + name);
    }
    tokens >> sender;

    char* end = nullptr;
    const unsigned long long raw_id = std::strtoull(id_text.c_str(), &end, 10);
    if (id_text.empty() || end == id_text.c_str() || *end != '\0' || raw_id > 0xFFFFFFFFull) {
      throw Error("invalid id '" + id_text + "' for message " + name);
    }

    if (name == kIndependentSignalsMessage) {
      current_.reset();
      skip_current_ = true;
      return;
    }

    MessageDef message;
    message.extended = (raw_id & kDbcExtendedFlag) != 0;
    message.id = static_cast<uint32_t>(raw_id) & ~kDbcExtendedFlag;
    message.name = name;
    message.length = static_cast<uint8_t>(length);
    message.sender = sender;
    for (const auto& existing : messages_) {
      if (existing.id == message.id) {
        throw Error("duplicate message id " + FormatId(message.id) + " (" + existing.name +
                    ", " + message.name + ")");
      }
    }
    messages_.push_back(std::move(message));
    current_ = messages_.size() - 1;
    skip_current_ = false;
  }

  void ParseSignal(const std::string& line) {
    if (skip_current_) {
      return;
    }
    if (!current_) {
      throw Error("SG_ outside of a message definition");
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      throw Error("malformed SG_ line");
    }
    std::istringstream head(line.substr(0, colon));
    std::string keyword;
    SignalDef signal;
    head >> keyword >> signal.name;
    if (signal.name.empty()) {
      throw Error("SG_ without a name");
    }

    const std::string body = line.substr(colon + 1);
    char order = 0;
    char sign = 0;
    const int matched = std::sscanf(body.c_str(), " %d|%d@%c%c (%lf,%lf) [%lf|%lf]",
                                    &signal.start_bit, &signal.length, &order, &sign,
                                    &signal.factor, &signal.offset, &signal.minimum,
                                    &signal.maximum);
    if (matched != 8) {
      throw Error("malformed definition for signal " + signal.name);
    }
    if (order == '0') {
      signal.byte_order = ByteOrder::kMotorola;
    } else if (order == '1') {
      signal.byte_order = ByteOrder::kIntel;
    } else {
      throw Error("invalid byte order for signal " + signal.name);
    }
    if (sign != '+' && sign != '-') {
      throw Error("invalid sign for signal " + signal.name);
    }
    signal.is_signed = sign == '-';
    if (signal.length <= 0 || signal.length > 64) {
      throw Error("invalid length for signal " + signal.name);
    }
    if (signal.factor == 0.0) {
      throw Error("zero factor for signal " + signal.name);
    }
    const auto quote_open = body.find('"');
    if (quote_open != std::string::npos) {
      const auto quote_close = body.find('"', quote_open + 1);
      if (quote_close != std::string::npos) {
        signal.unit = body.substr(quote_open + 1, quote_close - quote_open - 1);
      }
    }

    MessageDef& message = messages_[*current_];
    const int payload_bits = static_cast<int>(message.length) * 8;
    for (int position : BitPositions(signal)) {
      if (position < 0 || position >= payload_bits) {
        throw Error("signal " + signal.name + " exceeds the " + std::to_string(message.length) +
                    "-byte payload of " + message.name);
      }
    }
    message.signals.push_back(std::move(signal));
  }

  const std::string& text_;
  const std::string& origin_;
  std::vector<MessageDef> messages_;
  std::optional<std::size_t> current_;
  bool skip_current_{false};
  int line_number_{0};
};

}  // namespace

const SignalDef* MessageDef::FindSignal(const std::string& signal_name) const {
  for (const auto& signal : signals) {
    if (signal.name == signal_name) {
      return &signal;
    }
  }
  return nullptr;
}

Database Database::LoadFile(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw errors::DatabaseNotFoundError("Signal database not found", path);
  }
  std::ifstream in(path);
  if (!in) {
    throw errors::DatabaseNotFoundError("Unable to open signal database", path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return LoadString(buffer.str(), path);
}

Database Database::LoadString(const std::string& text, const std::string& origin) {
  Database db;
  db.origin_ = origin;
  db.messages_ = Parser(text, origin).Run();
  for (std::size_t i = 0; i < db.messages_.size(); ++i) {
    db.by_id_.emplace(db.messages_[i].id, i);
    db.by_name_.emplace(db.messages_[i].name, i);
  }
  return db;
}

const MessageDef* Database::FindMessage(uint32_t id) const {
  auto it = by_id_.find(id);
  return it == by_id_.end() ? nullptr : &messages_[it->second];
}

const MessageDef* Database::FindMessage(const std::string& name) const {
  auto it = by_name_.find(name);
  return it == by_name_.end() ? nullptr : &messages_[it->second];
}

SignalValues Database::Decode(uint32_t id, const std::vector<uint8_t>& data) const {
  const MessageDef* message = FindMessage(id);
  if (!message) {
    throw errors::DecodeError("Unknown message id " + FormatId(id), origin_);
  }
  if (data.size() < message->length) {
    throw errors::DecodeError("Payload of " + std::to_string(data.size()) +
                                  " bytes is shorter than " + std::to_string(message->length),
                              message->name);
  }
  SignalValues values;
  for (const auto& signal : message->signals) {
    values[signal.name] = ToPhysical(signal, ReadRaw(data, signal));
  }
  return values;
}

SignalValues Database::Decode(const can_frame& frame) const {
  return Decode(ArbitrationId(frame), Payload(frame));
}

std::vector<uint8_t> Database::Encode(const std::string& message_name,
                                      const SignalValues& values) const {
  const MessageDef* message = FindMessage(message_name);
  if (!message) {
    throw errors::EncodeError("Unknown message", message_name);
  }
  std::vector<uint8_t> payload(message->length, 0);
  const SignalDef* checksum = nullptr;
  for (const auto& signal : message->signals) {
    auto it = values.find(signal.name);
    if (it == values.end()) {
      if (signal.name == kChecksumSignal) {
        checksum = &signal;
        continue;
      }
      throw errors::EncodeError("Missing signal " + signal.name, message_name);
    }
    WriteRaw(payload, signal, ToRaw(signal, it->second, message_name));
  }
  if (checksum) {
    WriteRaw(payload, *checksum, ToyotaChecksum(message->id, payload));
  }
  return payload;
}

can_frame Database::EncodeFrame(const std::string& message_name,
                                const SignalValues& values) const {
  const std::vector<uint8_t> payload = Encode(message_name, values);
  const MessageDef* message = FindMessage(message_name);
  if (payload.size() > CAN_MAX_DLEN) {
    throw errors::EncodeError("Payload does not fit a classic CAN frame", message_name);
  }
  return MakeFrame(message->id, payload, message->extended);
}

uint8_t ToyotaChecksum(uint32_t id, const std::vector<uint8_t>& payload) {
  uint32_t sum = (id & 0xFFu) + ((id >> 8) & 0xFFu) + static_cast<uint32_t>(payload.size());
  for (std::size_t i = 0; i + 1 < payload.size(); ++i) {
    sum += payload[i];
  }
  return static_cast<uint8_t>(sum & 0xFFu);
}

}  // namespace tradar::io::can::dbc
