#include "gtest/gtest.h"

#include <string>

#include <common/errors.hpp>
#include <common/logging.hpp>
#include <common/time/radar_clock.hpp>

namespace {

class ClockTest : public ::testing::Test {
 protected:
  void TearDown() override { tradar::time::useRealtime(); }
};

}  // namespace

TEST_F(ClockTest, SimulatedTimeOnlyMovesWhenAdvanced) {
  tradar::time::useSimulated(tradar::time::fromSeconds(3.0));
  EXPECT_TRUE(tradar::time::isSimulated());
  EXPECT_EQ(tradar::time::now(), 3000000000ULL);
  EXPECT_EQ(tradar::time::now(), 3000000000ULL);
  EXPECT_EQ(tradar::time::advance(tradar::time::fromSeconds(0.25)), 3250000000ULL);
  EXPECT_EQ(tradar::time::set(42), 42ULL);
  EXPECT_EQ(tradar::time::now(), 42ULL);
}

TEST_F(ClockTest, RealtimeIsMonotonic) {
  tradar::time::useRealtime();
  EXPECT_FALSE(tradar::time::isSimulated());
  const uint64_t first = tradar::time::now();
  const uint64_t second = tradar::time::now();
  EXPECT_LE(first, second);
}

TEST_F(ClockTest, SecondConversions) {
  EXPECT_EQ(tradar::time::fromSeconds(-1.0), 0ULL);
  EXPECT_EQ(tradar::time::fromSeconds(0.5), 500000000ULL);
  EXPECT_DOUBLE_EQ(tradar::time::toSeconds(1500000000ULL), 1.5);
}

TEST(LoggingTest, BuffersFormattedEntries) {
  tradar::log::Clear();
  tradar::log::Logf(tradar::log::Level::kWarning, "bus %s dropped %d frames\n", "can1", 3);
  tradar::log::LogError("link down");

  const auto entries = tradar::log::Snapshot();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].level, tradar::log::Level::kWarning);
  EXPECT_NE(entries[0].formatted.find("[WARN] bus can1 dropped 3 frames"), std::string::npos);
  EXPECT_NE(entries[0].formatted.back(), '\n');
  EXPECT_NE(entries[1].formatted.find("[ERROR] link down"), std::string::npos);

  tradar::log::Clear();
  EXPECT_TRUE(tradar::log::Snapshot().empty());
}

TEST(LoggingTest, BufferIsBounded) {
  tradar::log::Clear();
  for (int i = 0; i < 600; ++i) {
    tradar::log::Logf(tradar::log::Level::kDebug, "entry %d", i);
  }
  const auto entries = tradar::log::Snapshot();
  ASSERT_EQ(entries.size(), 512u);
  EXPECT_NE(entries.back().formatted.find("entry 599"), std::string::npos);
  tradar::log::Clear();
}

TEST(ErrorsTest, ContextPrefixesMessage) {
  const tradar::errors::DatabaseNotFoundError error("DBC file not found", "tracks.dbc");
  EXPECT_STREQ(error.what(), "tracks.dbc: DBC file not found");
  EXPECT_EQ(error.context(), "tracks.dbc");

  const tradar::errors::TransportError bare("no such device");
  EXPECT_STREQ(bare.what(), "no such device");

  try {
    throw tradar::errors::DatabaseParseError("line 3: bad signal", "control.dbc");
  } catch (const tradar::errors::ConfigError& ex) {
    EXPECT_NE(std::string(ex.what()).find("line 3"), std::string::npos);
  }
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
