#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "io/can/can_defs.hpp"
#include "io/can/dbc_database.hpp"

namespace tradar::radar {

// Track reports occupy sixteen consecutive identifiers; slot = id - base.
constexpr uint32_t kTrackBaseId = 0x210;
constexpr uint32_t kTrackMaxId = 0x21F;
constexpr std::size_t kTrackSlots = kTrackMaxId - kTrackBaseId + 1;

struct RadarConfig {
  std::string car_channel{"can0"};
  std::string radar_channel{"can1"};
  std::string interface{"socketcan"};
  // Empty means "use `interface`".
  std::string car_interface{};
  std::string radar_interface{};
  uint32_t bitrate{500000};
  std::string radar_dbc{"opendbc/toyota_prius_2017_adas.dbc"};
  std::string control_dbc{"opendbc/toyota_prius_2017_pt_generated.dbc"};
  double keepalive_rate_hz{100.0};
  double track_timeout_s{0.5};
  double poll_timeout_s{0.1};
  bool auto_setup{true};
  bool use_sudo{false};
  std::vector<std::string> setup_extra_args{};
  bool keepalive_enabled{true};

  std::string CarInterface() const { return car_interface.empty() ? interface : car_interface; }
  std::string RadarInterface() const {
    return radar_interface.empty() ? interface : radar_interface;
  }

  // Throws errors::ConfigError naming the first offending field.
  void Validate() const;
};

struct RadarTrack {
  int track_id{0};
  double long_dist{0.0};
  double lat_dist{0.0};
  double rel_speed{0.0};
  bool new_track{false};
  uint64_t timestamp_ns{0};
  io::can::dbc::SignalValues raw{};
};

using TrackMap = std::map<int, RadarTrack>;

struct KeepAliveStatus {
  uint64_t tx_count{0};
  std::optional<std::string> last_error{};
  uint64_t frame_counter{0};
};

struct ListenerStats {
  uint64_t messages{0};
  uint64_t raw_frames{0};
  uint64_t track_updates{0};
  uint64_t invalid_tracks{0};
  uint64_t decode_failures{0};
  uint64_t callback_failures{0};
};

using TrackCallback = std::function<void(const RadarTrack&)>;
using RawFrameCallback = std::function<void(const can_frame&)>;

}  // namespace tradar::radar
