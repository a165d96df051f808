#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "io/can/can_defs.hpp"
#include "io/can/dbc_database.hpp"
#include "radar_types.hpp"
#include "track_cache.hpp"

namespace tradar::radar {

// Radar-bus frame handler. Frames inside the track range are decoded, gated on
// VALID and written to the cache; everything else goes to raw observers.
class TrackListener {
 public:
  TrackListener(const io::can::dbc::Database& radar_db, TrackCache& cache);

  TrackListener(const TrackListener&) = delete;
  TrackListener& operator=(const TrackListener&) = delete;

  void AddTrackCallback(TrackCallback callback);
  void AddRawCallback(RawFrameCallback callback);

  // Called on the receive thread for every radar-bus frame.
  void OnFrame(const can_frame& frame);

  uint64_t MessageCount() const { return messages_.load(); }
  ListenerStats Stats() const;

  static bool InTrackRange(const can_frame& frame);

 private:
  std::optional<RadarTrack> BuildTrack(uint32_t id, const io::can::dbc::SignalValues& values);
  void DispatchRaw(const can_frame& frame);
  void DispatchTrack(const RadarTrack& track);

  const io::can::dbc::Database& radar_db_;
  TrackCache& cache_;

  std::mutex callbacks_mutex_;
  std::vector<TrackCallback> track_callbacks_;
  std::vector<RawFrameCallback> raw_callbacks_;

  std::atomic<uint64_t> messages_{0};
  std::atomic<uint64_t> raw_frames_{0};
  std::atomic<uint64_t> track_updates_{0};
  std::atomic<uint64_t> invalid_tracks_{0};
  std::atomic<uint64_t> decode_failures_{0};
  std::atomic<uint64_t> callback_failures_{0};
};

}  // namespace tradar::radar
