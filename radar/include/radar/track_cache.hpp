#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>

#include "radar_types.hpp"

namespace tradar::radar {

// Latest report per track slot. Entries older than the TTL are invisible to
// readers and are erased by the read that finds them.
class TrackCache {
 public:
  explicit TrackCache(uint64_t ttl_ns);

  TrackCache(const TrackCache&) = delete;
  TrackCache& operator=(const TrackCache&) = delete;

  // Replaces the slot wholesale; last writer wins.
  void Upsert(RadarTrack track);

  // Erases every entry with timestamp < now_ns - ttl and returns a copy of the rest.
  TrackMap SnapshotWithEviction(uint64_t now_ns);

  void Clear();
  std::size_t Size() const;

  uint64_t ttl_ns() const { return ttl_ns_; }

 private:
  const uint64_t ttl_ns_;
  mutable std::mutex mutex_;
  TrackMap tracks_;
};

}  // namespace tradar::radar
