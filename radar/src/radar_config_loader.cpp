#include "radar/radar_config_loader.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include <common/errors.hpp>

namespace tradar::radar {
namespace {

std::string BuildInvalidFieldMessage(const std::string& section, const char* key) {
  std::ostringstream oss;
  oss << "Invalid value for '" << section << "." << key << "'";
  return oss.str();
}

template <typename T>
T ReadScalar(const YAML::Node& node, const std::string& section, const char* key, T def,
             const std::string& path) {
  if (!node || !node[key]) {
    return def;
  }
  try {
    return node[key].as<T>();
  } catch (const YAML::Exception&) {
    throw errors::ConfigError(BuildInvalidFieldMessage(section, key), path);
  }
}

std::string ReadString(const YAML::Node& node, const std::string& section, const char* key,
                       const std::string& def, const std::string& path) {
  return ReadScalar<std::string>(node, section, key, def, path);
}

std::vector<std::string> ReadStringList(const YAML::Node& node, const std::string& section,
                                        const char* key, const std::vector<std::string>& def,
                                        const std::string& path) {
  if (!node || !node[key]) {
    return def;
  }
  const YAML::Node list = node[key];
  if (!list.IsSequence()) {
    throw errors::ConfigError(BuildInvalidFieldMessage(section, key), path);
  }
  std::vector<std::string> values;
  for (const auto& item : list) {
    try {
      values.push_back(item.as<std::string>());
    } catch (const YAML::Exception&) {
      throw errors::ConfigError(BuildInvalidFieldMessage(section, key), path);
    }
  }
  return values;
}

std::string ResolvePath(const std::string& value, const std::string& def,
                        const std::filesystem::path& base_dir) {
  if (value == def || value.empty()) {
    return value;
  }
  const std::filesystem::path candidate(value);
  if (candidate.is_absolute()) {
    return value;
  }
  return (base_dir / candidate).lexically_normal().string();
}

}  // namespace

RadarRuntimeConfig LoadRadarConfig(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& ex) {
    throw errors::ConfigError(std::string("Failed to load radar config: ") + ex.what(), path);
  }
  if (root && !root.IsNull() && !root.IsMap()) {
    throw errors::ConfigError("Radar config root must be a mapping", path);
  }

  RadarRuntimeConfig cfg;
  RadarConfig& radar = cfg.radar;
  const std::filesystem::path base_dir = std::filesystem::path(path).parent_path();

  const YAML::Node bus = root["bus"];
  radar.interface = ReadString(bus, "bus", "interface", radar.interface, path);
  const int64_t bitrate = ReadScalar<int64_t>(bus, "bus", "bitrate", radar.bitrate, path);
  if (bitrate <= 0 || bitrate > static_cast<int64_t>(UINT32_MAX)) {
    throw errors::ConfigError(BuildInvalidFieldMessage("bus", "bitrate"), path);
  }
  radar.bitrate = static_cast<uint32_t>(bitrate);
  radar.poll_timeout_s = ReadScalar(bus, "bus", "poll_timeout_s", radar.poll_timeout_s, path);
  radar.auto_setup = ReadScalar(bus, "bus", "auto_setup", radar.auto_setup, path);
  radar.use_sudo = ReadScalar(bus, "bus", "use_sudo", radar.use_sudo, path);
  radar.setup_extra_args =
      ReadStringList(bus, "bus", "setup_extra_args", radar.setup_extra_args, path);

  const YAML::Node car = root["car"];
  radar.car_channel = ReadString(car, "car", "channel", radar.car_channel, path);
  radar.car_interface = ReadString(car, "car", "interface", radar.car_interface, path);

  const YAML::Node radar_node = root["radar"];
  radar.radar_channel = ReadString(radar_node, "radar", "channel", radar.radar_channel, path);
  radar.radar_interface =
      ReadString(radar_node, "radar", "interface", radar.radar_interface, path);

  const RadarConfig defaults;
  const YAML::Node dbc = root["dbc"];
  radar.radar_dbc = ResolvePath(ReadString(dbc, "dbc", "radar", radar.radar_dbc, path),
                                defaults.radar_dbc, base_dir);
  radar.control_dbc = ResolvePath(ReadString(dbc, "dbc", "control", radar.control_dbc, path),
                                  defaults.control_dbc, base_dir);

  const YAML::Node keepalive = root["keepalive"];
  radar.keepalive_enabled =
      ReadScalar(keepalive, "keepalive", "enabled", radar.keepalive_enabled, path);
  radar.keepalive_rate_hz =
      ReadScalar(keepalive, "keepalive", "rate_hz", radar.keepalive_rate_hz, path);

  const YAML::Node tracks = root["tracks"];
  radar.track_timeout_s = ReadScalar(tracks, "tracks", "timeout_s", radar.track_timeout_s, path);

  MonitorConfig& monitor = cfg.monitor;
  const YAML::Node monitor_node = root["monitor"];
  monitor.print_interval_s =
      ReadScalar(monitor_node, "monitor", "print_interval_s", monitor.print_interval_s, path);
  monitor.duration_s = ReadScalar(monitor_node, "monitor", "duration_s", monitor.duration_s, path);
  monitor.tracks_csv = ReadString(monitor_node, "monitor", "tracks_csv", monitor.tracks_csv, path);
  if (!monitor.tracks_csv.empty() && std::filesystem::path(monitor.tracks_csv).is_relative()) {
    monitor.tracks_csv = (base_dir / monitor.tracks_csv).lexically_normal().string();
  }
  const int64_t flush_interval = ReadScalar<int64_t>(
      monitor_node, "monitor", "csv_flush_interval",
      static_cast<int64_t>(monitor.csv_flush_interval), path);
  if (flush_interval <= 0) {
    throw errors::ConfigError(BuildInvalidFieldMessage("monitor", "csv_flush_interval"), path);
  }
  monitor.csv_flush_interval = static_cast<std::size_t>(flush_interval);
  monitor.verbose = ReadScalar(monitor_node, "monitor", "verbose", monitor.verbose, path);
  if (!std::isfinite(monitor.print_interval_s) || monitor.print_interval_s <= 0.0) {
    throw errors::ConfigError(BuildInvalidFieldMessage("monitor", "print_interval_s"), path);
  }

  try {
    radar.Validate();
  } catch (const errors::ConfigError& ex) {
    throw errors::ConfigError(ex.what(), path);
  }
  return cfg;
}

}  // namespace tradar::radar
