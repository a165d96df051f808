#include "radar/track_cache.hpp"

#include <utility>

namespace tradar::radar {

TrackCache::TrackCache(uint64_t ttl_ns) : ttl_ns_(ttl_ns) {}

void TrackCache::Upsert(RadarTrack track) {
  const int track_id = track.track_id;
  std::lock_guard<std::mutex> lock(mutex_);
  tracks_[track_id] = std::move(track);
}

TrackMap TrackCache::SnapshotWithEviction(uint64_t now_ns) {
  // The clock may start near zero, so the cutoff saturates instead of wrapping.
  const uint64_t cutoff = now_ns > ttl_ns_ ? now_ns - ttl_ns_ : 0;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = tracks_.begin(); it != tracks_.end();) {
    if (it->second.timestamp_ns < cutoff) {
      it = tracks_.erase(it);
    } else {
      ++it;
    }
  }
  return tracks_;
}

void TrackCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  tracks_.clear();
}

std::size_t TrackCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tracks_.size();
}

}  // namespace tradar::radar
