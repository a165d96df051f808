#pragma once

#include <cstddef>
#include <string>

#include "radar_types.hpp"

namespace tradar::radar {

struct MonitorConfig {
  double print_interval_s{1.0};
  // Zero or negative runs until interrupted.
  double duration_s{0.0};
  // Empty disables recording.
  std::string tracks_csv{};
  std::size_t csv_flush_interval{10};
  bool verbose{false};
};

struct RadarRuntimeConfig {
  RadarConfig radar{};
  MonitorConfig monitor{};
};

// Reads a YAML radar configuration. Keys that are absent keep their defaults;
// relative DBC paths are resolved against the file's directory. Throws
// errors::ConfigError naming the file and the offending key.
RadarRuntimeConfig LoadRadarConfig(const std::string& path);

}  // namespace tradar::radar
