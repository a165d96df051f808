#include "radar/radar_types.hpp"

#include <cmath>
#include <sstream>

#include <common/errors.hpp>
#include "io/can/can_link.hpp"

namespace tradar::radar {
namespace {

std::string BuildInvalidFieldMessage(const std::string& field, const std::string& detail) {
  std::ostringstream oss;
  oss << "Invalid value for '" << field << "': " << detail;
  return oss.str();
}

void ValidatePositive(double value, const std::string& field) {
  if (!std::isfinite(value) || value <= 0.0) {
    throw errors::ConfigError(BuildInvalidFieldMessage(field, "must be a positive number"),
                              "radar config");
  }
}

void ValidateChannel(const std::string& channel, const std::string& field) {
  if (channel.empty()) {
    throw errors::ConfigError(BuildInvalidFieldMessage(field, "channel name is empty"),
                              "radar config");
  }
}

void ValidateInterface(const std::string& interface_name, const std::string& field) {
  if (!io::can::is_supported_interface(interface_name)) {
    throw errors::ConfigError(
        BuildInvalidFieldMessage(field, "unsupported interface '" + interface_name + "'"),
        "radar config");
  }
}

}  // namespace

void RadarConfig::Validate() const {
  ValidateChannel(car_channel, "car_channel");
  ValidateChannel(radar_channel, "radar_channel");
  ValidateInterface(CarInterface(), "car_interface");
  ValidateInterface(RadarInterface(), "radar_interface");
  if (bitrate == 0) {
    throw errors::ConfigError(BuildInvalidFieldMessage("bitrate", "must be non-zero"),
                              "radar config");
  }
  ValidatePositive(keepalive_rate_hz, "keepalive_rate_hz");
  ValidatePositive(track_timeout_s, "track_timeout_s");
  ValidatePositive(poll_timeout_s, "poll_timeout_s");
}

}  // namespace tradar::radar
