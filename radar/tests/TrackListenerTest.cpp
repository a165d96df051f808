#include "gtest/gtest.h"

#include <stdexcept>
#include <vector>

#include <common/time/radar_clock.hpp>
#include "RadarTestSupport.hpp"
#include "radar/track_listener.hpp"

using tradar::io::can::MakeFrame;
using tradar::io::can::dbc::Database;
using tradar::radar::RadarTrack;
using tradar::radar::TrackCache;
using tradar::radar::TrackListener;
using tradar::test::DataPath;
using tradar::test::MakeTrackFrame;

namespace {

class TrackListenerTest : public ::testing::Test {
 protected:
  void SetUp() override { tradar::time::useSimulated(tradar::time::fromSeconds(5.0)); }
  void TearDown() override { tradar::time::useRealtime(); }

  Database db_ = Database::LoadFile(DataPath("toyota_radar_tracks.dbc"));
  TrackCache cache_{tradar::time::fromSeconds(0.5)};
  TrackListener listener_{db_, cache_};

  tradar::radar::TrackMap Tracks() {
    return cache_.SnapshotWithEviction(tradar::time::now());
  }
};

}  // namespace

TEST_F(TrackListenerTest, AcceptsValidTrackFrame) {
  std::vector<RadarTrack> seen;
  listener_.AddTrackCallback([&](const RadarTrack& track) { seen.push_back(track); });

  listener_.OnFrame(MakeTrackFrame(db_, 0x213, 25.0, -1.2, 3.5, true, true));

  const auto tracks = Tracks();
  ASSERT_EQ(tracks.count(3), 1u);
  const RadarTrack& track = tracks.at(3);
  EXPECT_EQ(track.track_id, 3);
  EXPECT_NEAR(track.long_dist, 25.0, 1e-9);
  EXPECT_NEAR(track.lat_dist, -1.2, 1e-9);
  EXPECT_NEAR(track.rel_speed, 3.5, 1e-9);
  EXPECT_TRUE(track.new_track);
  EXPECT_EQ(track.timestamp_ns, tradar::time::fromSeconds(5.0));
  EXPECT_EQ(track.raw.count("COUNTER"), 1u);

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].track_id, 3);

  const auto stats = listener_.Stats();
  EXPECT_EQ(stats.messages, 1u);
  EXPECT_EQ(stats.track_updates, 1u);
  EXPECT_EQ(stats.raw_frames, 0u);
}

TEST_F(TrackListenerTest, OutOfRangeFramesOnlyReachRawObservers) {
  int track_calls = 0;
  std::vector<uint32_t> raw_ids;
  listener_.AddTrackCallback([&](const RadarTrack&) { ++track_calls; });
  listener_.AddRawCallback([&](const can_frame& frame) {
    raw_ids.push_back(tradar::io::can::ArbitrationId(frame));
  });

  listener_.OnFrame(MakeFrame(0x20F, std::vector<uint8_t>(8, 0xFF)));
  listener_.OnFrame(MakeFrame(0x220, std::vector<uint8_t>(8, 0xFF)));
  listener_.OnFrame(MakeFrame(0x210, std::vector<uint8_t>(8, 0xFF), true));
  listener_.OnFrame(MakeTrackFrame(db_, 0x210, 10.0, 0.0, 0.0, true));

  EXPECT_EQ(raw_ids, (std::vector<uint32_t>{0x20F, 0x220, 0x210}));
  EXPECT_EQ(track_calls, 1);
  EXPECT_EQ(listener_.MessageCount(), 4u);

  const auto tracks = Tracks();
  EXPECT_EQ(tracks.size(), 1u);
  EXPECT_EQ(tracks.count(0), 1u);
}

TEST_F(TrackListenerTest, InvalidTracksAreDropped) {
  listener_.OnFrame(MakeTrackFrame(db_, 0x215, 30.0, 1.0, -2.0, false));
  EXPECT_TRUE(Tracks().empty());
  EXPECT_EQ(listener_.Stats().invalid_tracks, 1u);
  EXPECT_EQ(listener_.Stats().track_updates, 0u);
}

TEST_F(TrackListenerTest, DecodeFailureKeepsExistingTracks) {
  listener_.OnFrame(MakeTrackFrame(db_, 0x212, 8.0, 0.4, 0.0, true));
  listener_.OnFrame(MakeFrame(0x212, {0x01, 0x02, 0x03}));

  const auto tracks = Tracks();
  ASSERT_EQ(tracks.count(2), 1u);
  EXPECT_NEAR(tracks.at(2).long_dist, 8.0, 1e-9);
  EXPECT_EQ(listener_.Stats().decode_failures, 1u);
  EXPECT_EQ(listener_.MessageCount(), 2u);
}

TEST_F(TrackListenerTest, ThrowingCallbacksAreIsolated) {
  int good_track_calls = 0;
  int good_raw_calls = 0;
  listener_.AddTrackCallback([](const RadarTrack&) { throw std::runtime_error("consumer bug"); });
  listener_.AddTrackCallback([](const RadarTrack&) { throw 42; });
  listener_.AddTrackCallback([&](const RadarTrack&) { ++good_track_calls; });
  listener_.AddRawCallback([](const can_frame&) { throw std::logic_error("raw consumer bug"); });
  listener_.AddRawCallback([&](const can_frame&) { ++good_raw_calls; });

  EXPECT_NO_THROW(listener_.OnFrame(MakeTrackFrame(db_, 0x21F, 50.0, 2.0, 1.0, true)));
  EXPECT_NO_THROW(listener_.OnFrame(MakeFrame(0x100, {0x00})));
  EXPECT_NO_THROW(listener_.OnFrame(MakeTrackFrame(db_, 0x21E, 60.0, 2.0, 1.0, true)));

  EXPECT_EQ(good_track_calls, 2);
  EXPECT_EQ(good_raw_calls, 1);
  EXPECT_EQ(Tracks().size(), 2u);
  EXPECT_EQ(listener_.Stats().callback_failures, 5u);
}

TEST_F(TrackListenerTest, TracksExpireThroughSimulatedClock) {
  listener_.OnFrame(MakeTrackFrame(db_, 0x211, 12.0, 0.0, 0.0, true));
  tradar::time::advance(tradar::time::fromSeconds(0.4));
  EXPECT_EQ(Tracks().count(1), 1u);
  tradar::time::advance(tradar::time::fromSeconds(0.2));
  EXPECT_EQ(Tracks().count(1), 0u);
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
