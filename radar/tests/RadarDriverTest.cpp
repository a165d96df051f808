#include "gtest/gtest.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <common/errors.hpp>
#include <common/time/radar_clock.hpp>
#include "RadarTestSupport.hpp"
#include "radar/radar_driver.hpp"

using namespace std::chrono_literals;
using tradar::io::can::CanBus;
using tradar::io::can::dbc::Database;
using tradar::radar::LinkConfigurator;
using tradar::radar::RadarConfig;
using tradar::radar::RadarDriver;
using tradar::radar::RadarTrack;
using tradar::test::DataPath;
using tradar::test::MakeTrackFrame;
using tradar::test::WaitFor;

namespace {

struct CommandLog {
  std::mutex mutex;
  std::vector<std::vector<std::string>> commands;
  bool fail_link_up{false};
};

class FakeLinkConfigurator : public LinkConfigurator {
 public:
  explicit FakeLinkConfigurator(std::shared_ptr<CommandLog> log) : log_(std::move(log)) {}

  void Run(const std::vector<std::string>& args, bool ignore_errors) override {
    std::lock_guard<std::mutex> lock(log_->mutex);
    log_->commands.push_back(args);
    if (log_->fail_link_up && !args.empty() && args.back() == "up" && !ignore_errors) {
      throw tradar::errors::TransportError("link up refused", args[args.size() - 2]);
    }
  }

 private:
  std::shared_ptr<CommandLog> log_;
};

class RadarDriverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const std::string test_name =
        ::testing::UnitTest::GetInstance()->current_test_info()->name();
    config_.car_channel = "car_" + test_name;
    config_.radar_channel = "radar_" + test_name;
    config_.interface = "virtual";
    config_.radar_dbc = DataPath("toyota_radar_tracks.dbc");
    config_.control_dbc = DataPath("toyota_control.dbc");
    config_.auto_setup = false;
    config_.poll_timeout_s = 0.02;
  }

  void TearDown() override { tradar::time::useRealtime(); }

  std::unique_ptr<CanBus> OpenPeer(const std::string& channel) {
    return CanBus::Open(channel, "virtual", config_.bitrate);
  }

  RadarConfig config_;
  Database tracks_db_ = Database::LoadFile(DataPath("toyota_radar_tracks.dbc"));
};

std::vector<can_frame> Drain(CanBus& bus) {
  std::vector<can_frame> frames;
  while (auto frame = bus.Receive(0ms)) {
    frames.push_back(*frame);
  }
  return frames;
}

}  // namespace

TEST_F(RadarDriverTest, DecodesTracksFromRadarBus) {
  RadarDriver driver(config_);
  auto radar = OpenPeer(config_.radar_channel);
  driver.Start();
  EXPECT_TRUE(driver.IsRunning());

  radar->Send(MakeTrackFrame(tracks_db_, 0x213, 18.0, -0.8, 2.5, true));
  radar->Send(MakeTrackFrame(tracks_db_, 0x21A, 40.0, 1.6, -1.0, false));
  ASSERT_TRUE(WaitFor([&] { return driver.GetTracks().count(3) == 1; }, 1000ms));

  const auto tracks = driver.GetTracks();
  EXPECT_NEAR(tracks.at(3).long_dist, 18.0, 1e-9);
  EXPECT_EQ(tracks.count(10), 0u);
  EXPECT_TRUE(WaitFor([&] { return driver.MessageCount() >= 2; }, 1000ms));
  EXPECT_EQ(driver.GetListenerStats().invalid_tracks, 1u);

  driver.Stop();
  EXPECT_FALSE(driver.IsRunning());
  EXPECT_TRUE(driver.GetTracks().empty());
}

TEST_F(RadarDriverTest, SendsInitFramesOnCarBus) {
  config_.keepalive_enabled = false;
  RadarDriver driver(config_);
  auto car = OpenPeer(config_.car_channel);
  driver.Start();

  const auto frames = Drain(*car);
  ASSERT_EQ(frames.size(), 5u);
  const std::vector<uint32_t> expected_ids{0xB4, 0x1D2, 0x1D3, 0x343, 0x399};
  for (std::size_t i = 0; i < frames.size(); ++i) {
    EXPECT_EQ(tradar::io::can::ArbitrationId(frames[i]), expected_ids[i]);
  }
  // SPEED = 1.44 kph with a zero checksum.
  EXPECT_EQ(frames[0].data[5], 0x00);
  EXPECT_EQ(frames[0].data[6], 0x90);
  EXPECT_EQ(frames[0].data[7], 0x00);
  // PCM_CRUISE carries CRUISE_STATE 9 in the high nibble of byte 6.
  EXPECT_EQ(frames[1].data[6], 0x90);
  // ACC_CONTROL init frame is all zero.
  EXPECT_EQ(tradar::io::can::Payload(frames[3]), std::vector<uint8_t>(8, 0x00));

  EXPECT_FALSE(driver.GetKeepAliveStatus().has_value());
  driver.Stop();
}

TEST_F(RadarDriverTest, ReportsKeepAliveStatus) {
  RadarDriver driver(config_);
  EXPECT_FALSE(driver.GetKeepAliveStatus().has_value());
  auto car = OpenPeer(config_.car_channel);
  auto radar = OpenPeer(config_.radar_channel);
  driver.Start();

  ASSERT_TRUE(WaitFor(
      [&] {
        const auto status = driver.GetKeepAliveStatus();
        return status && status->tx_count >= 20;
      },
      2000ms));
  const auto status = driver.GetKeepAliveStatus();
  ASSERT_TRUE(status.has_value());
  EXPECT_FALSE(status->last_error.has_value());
  driver.Stop();

  // The driver's heartbeat on the radar channel is seen by peers, never by itself.
  bool saw_dsu = false;
  for (const auto& frame : Drain(*radar)) {
    saw_dsu = saw_dsu || tradar::io::can::ArbitrationId(frame) == 0x141;
  }
  EXPECT_TRUE(saw_dsu);
  EXPECT_EQ(driver.GetListenerStats().raw_frames, 0u);
}

TEST_F(RadarDriverTest, InvalidConfigIsRejectedAtConstruction) {
  RadarConfig bad_interface = config_;
  bad_interface.radar_interface = "pcan";
  EXPECT_THROW(RadarDriver driver(bad_interface), tradar::errors::ConfigError);

  RadarConfig bad_rate = config_;
  bad_rate.keepalive_rate_hz = 0.0;
  EXPECT_THROW(RadarDriver driver(bad_rate), tradar::errors::ConfigError);

  RadarConfig bad_channel = config_;
  bad_channel.car_channel.clear();
  EXPECT_THROW(RadarDriver driver(bad_channel), tradar::errors::ConfigError);
}

TEST_F(RadarDriverTest, MissingDatabaseFailsStart) {
  config_.control_dbc = DataPath("missing_control.dbc");
  RadarDriver driver(config_);
  EXPECT_THROW(driver.Start(), tradar::errors::ConfigError);
  EXPECT_FALSE(driver.IsRunning());
  EXPECT_FALSE(driver.GetKeepAliveStatus().has_value());
  EXPECT_NO_THROW(driver.Stop());
}

TEST_F(RadarDriverTest, LinkBringUpFailureIsFatal) {
  auto log = std::make_shared<CommandLog>();
  log->fail_link_up = true;
  config_.interface = "socketcan";
  config_.auto_setup = true;
  RadarDriver driver(config_, std::make_unique<FakeLinkConfigurator>(log));

  EXPECT_THROW(driver.Start(), tradar::errors::TransportError);
  EXPECT_FALSE(driver.IsRunning());
  std::lock_guard<std::mutex> lock(log->mutex);
  ASSERT_EQ(log->commands.size(), 2u);
  EXPECT_EQ(log->commands[0].back(), "500000");
  EXPECT_EQ(log->commands[1].back(), "up");
}

TEST_F(RadarDriverTest, BringUpSkipsVirtualChannels) {
  auto log = std::make_shared<CommandLog>();
  config_.auto_setup = true;
  RadarDriver driver(config_, std::make_unique<FakeLinkConfigurator>(log));
  driver.Start();
  driver.Stop();
  std::lock_guard<std::mutex> lock(log->mutex);
  EXPECT_TRUE(log->commands.empty());
}

TEST_F(RadarDriverTest, TracksExpireWithSimulatedClock) {
  tradar::time::useSimulated(tradar::time::fromSeconds(100.0));
  config_.keepalive_enabled = false;
  RadarDriver driver(config_);
  auto radar = OpenPeer(config_.radar_channel);
  driver.Start();

  radar->Send(MakeTrackFrame(tracks_db_, 0x213, 22.0, 0.0, 0.0, true));
  ASSERT_TRUE(WaitFor([&] { return driver.GetTracks().count(3) == 1; }, 1000ms));

  tradar::time::advance(tradar::time::fromSeconds(0.4));
  EXPECT_EQ(driver.GetTracks().count(3), 1u);
  tradar::time::advance(tradar::time::fromSeconds(0.2));
  EXPECT_EQ(driver.GetTracks().count(3), 0u);
  driver.Stop();
}

TEST_F(RadarDriverTest, CallbacksSeeTracksAndRawFramesOnce) {
  std::atomic<int> track_calls{0};
  std::atomic<int> raw_calls{0};
  RadarDriver driver(config_);
  driver.RegisterTrackCallback([&](const RadarTrack& track) {
    if (track.track_id == 5) {
      track_calls.fetch_add(1);
    }
  });
  driver.RegisterTrackCallback([](const RadarTrack&) { throw std::runtime_error("bad consumer"); });
  driver.RegisterRawCallback([&](const can_frame& frame) {
    if (tradar::io::can::ArbitrationId(frame) == 0x100) {
      raw_calls.fetch_add(1);
    }
  });

  auto radar = OpenPeer(config_.radar_channel);
  driver.Start();
  radar->Send(tradar::io::can::MakeFrame(0x100, {0x01, 0x02}));
  radar->Send(MakeTrackFrame(tracks_db_, 0x215, 9.0, 0.2, 0.0, true));

  ASSERT_TRUE(WaitFor([&] { return track_calls.load() == 1 && raw_calls.load() == 1; }, 1000ms));
  EXPECT_EQ(driver.GetTracks().count(5), 1u);
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(track_calls.load(), 1);
  EXPECT_EQ(raw_calls.load(), 1);
  EXPECT_GE(driver.GetListenerStats().callback_failures, 1u);
  driver.Stop();
}

TEST_F(RadarDriverTest, RadarBusOpenFailureTearsDownCarBus) {
  config_.radar_interface = "socketcan";
  config_.radar_channel = "nosuchcan0";
  RadarDriver driver(config_);
  auto car = OpenPeer(config_.car_channel);

  EXPECT_THROW(driver.Start(), tradar::errors::TransportError);
  EXPECT_FALSE(driver.IsRunning());
  EXPECT_FALSE(driver.GetKeepAliveStatus().has_value());
  EXPECT_EQ(driver.MessageCount(), 0u);
  EXPECT_NO_THROW(driver.Stop());
  // Nothing was transmitted on the car bus that had already been opened.
  EXPECT_TRUE(Drain(*car).empty());
}

TEST_F(RadarDriverTest, CallbackMayQueryDriverWhileStopping) {
  auto driver = std::make_unique<RadarDriver>(config_);
  std::atomic<bool> in_callback{false};
  std::atomic<bool> queried{false};
  driver->RegisterRawCallback([&](const can_frame&) {
    if (in_callback.exchange(true)) {
      return;
    }
    std::this_thread::sleep_for(100ms);
    driver->MessageCount();
    driver->GetKeepAliveStatus();
    driver->GetListenerStats();
    driver->RegisterTrackCallback([](const RadarTrack&) {});
    queried.store(true);
  });

  auto radar = OpenPeer(config_.radar_channel);
  driver->Start();
  radar->Send(tradar::io::can::MakeFrame(0x100, {0x00}));
  ASSERT_TRUE(WaitFor([&] { return in_callback.load(); }, 1000ms));

  std::atomic<bool> stopped{false};
  std::thread stopper([&] {
    driver->Stop();
    stopped.store(true);
  });
  const bool finished = WaitFor([&] { return stopped.load(); }, 3000ms);
  if (!finished) {
    // Leave the wedged driver alive so the test reports instead of hanging.
    stopper.detach();
    static_cast<void>(driver.release());
    FAIL() << "Stop() did not return while a callback queried the driver";
  }
  stopper.join();
  EXPECT_TRUE(queried.load());
  EXPECT_FALSE(driver->IsRunning());
  EXPECT_GE(driver->MessageCount(), 1u);
}

TEST_F(RadarDriverTest, StartAndStopAreIdempotent) {
  RadarDriver driver(config_);
  EXPECT_NO_THROW(driver.Stop());
  driver.Start();
  EXPECT_NO_THROW(driver.Start());
  EXPECT_TRUE(driver.IsRunning());
  driver.Stop();
  EXPECT_NO_THROW(driver.Stop());
  EXPECT_FALSE(driver.IsRunning());

  driver.Start();
  EXPECT_TRUE(driver.IsRunning());
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
