#include "gtest/gtest.h"

#include <random>
#include <thread>
#include <vector>

#include <common/time/radar_clock.hpp>
#include "radar/track_cache.hpp"

using tradar::radar::RadarTrack;
using tradar::radar::TrackCache;

namespace {

RadarTrack Track(int id, double seconds, double long_dist = 10.0) {
  RadarTrack track;
  track.track_id = id;
  track.long_dist = long_dist;
  track.timestamp_ns = tradar::time::fromSeconds(seconds);
  return track;
}

}  // namespace

TEST(TrackCacheTest, EvictsAfterTimeToLive) {
  TrackCache cache(tradar::time::fromSeconds(0.5));
  cache.Upsert(Track(3, 0.0));

  const auto early = cache.SnapshotWithEviction(tradar::time::fromSeconds(0.4));
  EXPECT_EQ(early.count(3), 1u);

  const auto late = cache.SnapshotWithEviction(tradar::time::fromSeconds(0.6));
  EXPECT_EQ(late.count(3), 0u);
  EXPECT_EQ(cache.Size(), 0u);
}

TEST(TrackCacheTest, EntryAtCutoffIsKept) {
  TrackCache cache(tradar::time::fromSeconds(0.5));
  cache.Upsert(Track(1, 1.0));
  EXPECT_EQ(cache.SnapshotWithEviction(tradar::time::fromSeconds(1.5)).size(), 1u);
}

TEST(TrackCacheTest, EarlyClockDoesNotWrap) {
  TrackCache cache(tradar::time::fromSeconds(0.5));
  cache.Upsert(Track(0, 0.0));
  EXPECT_EQ(cache.SnapshotWithEviction(tradar::time::fromSeconds(0.1)).size(), 1u);
}

TEST(TrackCacheTest, LastWriteWins) {
  TrackCache cache(tradar::time::fromSeconds(0.5));
  cache.Upsert(Track(7, 1.0, 10.0));
  cache.Upsert(Track(7, 1.1, 20.0));
  const auto tracks = cache.SnapshotWithEviction(tradar::time::fromSeconds(1.2));
  ASSERT_EQ(tracks.size(), 1u);
  EXPECT_DOUBLE_EQ(tracks.at(7).long_dist, 20.0);
}

TEST(TrackCacheTest, SnapshotIsIndependentCopy) {
  TrackCache cache(tradar::time::fromSeconds(0.5));
  cache.Upsert(Track(2, 1.0, 5.0));
  auto tracks = cache.SnapshotWithEviction(tradar::time::fromSeconds(1.0));
  tracks.at(2).long_dist = 99.0;
  tracks.erase(2);
  const auto again = cache.SnapshotWithEviction(tradar::time::fromSeconds(1.0));
  ASSERT_EQ(again.size(), 1u);
  EXPECT_DOUBLE_EQ(again.at(2).long_dist, 5.0);
}

TEST(TrackCacheTest, SnapshotNeverContainsStaleEntries) {
  const uint64_t ttl = tradar::time::fromSeconds(0.5);
  TrackCache cache(ttl);
  std::mt19937 rng(1234);
  std::uniform_int_distribution<int> id_dist(0, 15);
  std::uniform_int_distribution<uint64_t> time_dist(0, tradar::time::fromSeconds(5.0));

  for (int i = 0; i < 500; ++i) {
    cache.Upsert(Track(id_dist(rng), tradar::time::toSeconds(time_dist(rng))));
    if (i % 25 == 0) {
      const uint64_t now = tradar::time::fromSeconds(2.5);
      for (const auto& [id, track] : cache.SnapshotWithEviction(now)) {
        EXPECT_GE(track.timestamp_ns + ttl, now) << "track " << id;
      }
    }
  }
}

TEST(TrackCacheTest, ConcurrentWritersAndReaders) {
  TrackCache cache(tradar::time::fromSeconds(10.0));
  std::thread writer([&] {
    for (int i = 0; i < 2000; ++i) {
      cache.Upsert(Track(i % 16, 1.0, static_cast<double>(i)));
    }
  });
  for (int i = 0; i < 200; ++i) {
    const auto tracks = cache.SnapshotWithEviction(tradar::time::fromSeconds(1.0));
    EXPECT_LE(tracks.size(), 16u);
  }
  writer.join();
  EXPECT_EQ(cache.Size(), 16u);
  cache.Clear();
  EXPECT_EQ(cache.Size(), 0u);
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
