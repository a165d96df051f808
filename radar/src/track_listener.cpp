#include "radar/track_listener.hpp"

#include <cmath>
#include <exception>
#include <utility>

#include <common/errors.hpp>
#include <common/logging.hpp>
#include <common/time/radar_clock.hpp>

namespace tradar::radar {
namespace {

std::optional<double> Field(const io::can::dbc::SignalValues& values, const char* name) {
  auto it = values.find(name);
  if (it == values.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace

TrackListener::TrackListener(const io::can::dbc::Database& radar_db, TrackCache& cache)
    : radar_db_(radar_db), cache_(cache) {}

void TrackListener::AddTrackCallback(TrackCallback callback) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  track_callbacks_.push_back(std::move(callback));
}

void TrackListener::AddRawCallback(RawFrameCallback callback) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  raw_callbacks_.push_back(std::move(callback));
}

bool TrackListener::InTrackRange(const can_frame& frame) {
  if (io::can::IsExtended(frame)) {
    return false;
  }
  const uint32_t id = io::can::ArbitrationId(frame);
  return id >= kTrackBaseId && id <= kTrackMaxId;
}

void TrackListener::OnFrame(const can_frame& frame) {
  messages_.fetch_add(1);
  if (!InTrackRange(frame)) {
    raw_frames_.fetch_add(1);
    DispatchRaw(frame);
    return;
  }

  const uint32_t id = io::can::ArbitrationId(frame);
  io::can::dbc::SignalValues values;
  try {
    values = radar_db_.Decode(frame);
  } catch (const errors::DecodeError& e) {
    decode_failures_.fetch_add(1);
    log::Logf(log::Level::kDebug, "Dropped track frame 0x%X: %s", id, e.what());
    return;
  }

  const auto valid = Field(values, "VALID");
  if (!valid || std::lround(*valid) != 1) {
    invalid_tracks_.fetch_add(1);
    return;
  }

  std::optional<RadarTrack> track = BuildTrack(id, values);
  if (!track) {
    decode_failures_.fetch_add(1);
    return;
  }
  cache_.Upsert(*track);
  track_updates_.fetch_add(1);
  DispatchTrack(*track);
}

std::optional<RadarTrack> TrackListener::BuildTrack(uint32_t id,
                                                    const io::can::dbc::SignalValues& values) {
  const auto long_dist = Field(values, "LONG_DIST");
  const auto lat_dist = Field(values, "LAT_DIST");
  const auto rel_speed = Field(values, "REL_SPEED");
  const auto new_track = Field(values, "NEW_TRACK");
  if (!long_dist || !lat_dist || !rel_speed || !new_track) {
    log::Logf(log::Level::kDebug, "Track frame 0x%X is missing required fields", id);
    return std::nullopt;
  }
  RadarTrack track;
  track.track_id = static_cast<int>(id - kTrackBaseId);
  track.long_dist = *long_dist;
  track.lat_dist = *lat_dist;
  track.rel_speed = *rel_speed;
  track.new_track = std::lround(*new_track) != 0;
  track.timestamp_ns = time::now();
  track.raw = values;
  return track;
}

void TrackListener::DispatchRaw(const can_frame& frame) {
  std::vector<RawFrameCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks = raw_callbacks_;
  }
  for (const auto& callback : callbacks) {
    try {
      callback(frame);
    } catch (const std::exception& e) {
      callback_failures_.fetch_add(1);
      log::Logf(log::Level::kError, "Raw frame callback failed: %s", e.what());
    } catch (...) {
      callback_failures_.fetch_add(1);
      log::LogError("Raw frame callback failed with unknown exception");
    }
  }
}

void TrackListener::DispatchTrack(const RadarTrack& track) {
  std::vector<TrackCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks = track_callbacks_;
  }
  for (const auto& callback : callbacks) {
    try {
      callback(track);
    } catch (const std::exception& e) {
      callback_failures_.fetch_add(1);
      log::Logf(log::Level::kError, "Track callback for id %d failed: %s", track.track_id,
                e.what());
    } catch (...) {
      callback_failures_.fetch_add(1);
      log::Logf(log::Level::kError, "Track callback for id %d failed with unknown exception",
                track.track_id);
    }
  }
}

ListenerStats TrackListener::Stats() const {
  ListenerStats stats;
  stats.messages = messages_.load();
  stats.raw_frames = raw_frames_.load();
  stats.track_updates = track_updates_.load();
  stats.invalid_tracks = invalid_tracks_.load();
  stats.decode_failures = decode_failures_.load();
  stats.callback_failures = callback_failures_.load();
  return stats;
}

}  // namespace tradar::radar
