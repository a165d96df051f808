#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <common/errors.hpp>
#include <common/logging.hpp>
#include "radar/radar_config_loader.hpp"
#include "radar/radar_driver.hpp"
#include "radar/track_recorder.hpp"

namespace {
std::atomic_bool g_running{true};

void handle_signal(int) { g_running.store(false, std::memory_order_relaxed); }

double WallTimeSeconds() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

void PrintTracks(const tradar::radar::TrackMap& tracks,
                 const std::optional<tradar::radar::KeepAliveStatus>& keepalive,
                 uint64_t message_count) {
  std::printf("\n%-4s %9s %9s %9s %4s\n", "id", "long[m]", "lat[m]", "vrel[m/s]", "new");
  for (const auto& [track_id, track] : tracks) {
    std::printf("%-4d %9.2f %9.2f %9.2f %4s\n", track_id, track.long_dist, track.lat_dist,
                track.rel_speed, track.new_track ? "*" : "");
  }
  std::printf("tracks=%zu rx=%llu", tracks.size(), static_cast<unsigned long long>(message_count));
  if (keepalive) {
    std::printf(" keepalive_tx=%llu", static_cast<unsigned long long>(keepalive->tx_count));
    if (keepalive->last_error) {
      std::printf(" keepalive_error=\"%s\"", keepalive->last_error->c_str());
    }
  }
  std::printf("\n");
  std::fflush(stdout);
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  std::string config_path = "configs/radar/radar.yaml";
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      std::printf("usage: %s [config.yaml]\n", argv[0]);
      return 0;
    }
    config_path = arg;
  }

  tradar::radar::RadarRuntimeConfig cfg;
  try {
    cfg = tradar::radar::LoadRadarConfig(config_path);
  } catch (const tradar::errors::ConfigError& ex) {
    std::fprintf(stderr, "%s\n", ex.what());
    return 2;
  }

  tradar::log::SetEcho(true, cfg.monitor.verbose ? tradar::log::Level::kDebug
                                                 : tradar::log::Level::kInfo);

  std::unique_ptr<tradar::radar::TrackRecorder> recorder;
  if (!cfg.monitor.tracks_csv.empty()) {
    recorder = std::make_unique<tradar::radar::TrackRecorder>(cfg.monitor.tracks_csv,
                                                              cfg.monitor.csv_flush_interval);
    if (!recorder->valid()) {
      return 1;
    }
  }

  tradar::radar::RadarDriver driver(cfg.radar);
  try {
    driver.Start();
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Failed to start radar driver: %s\n", ex.what());
    return 1;
  }

  const auto started = std::chrono::steady_clock::now();
  const auto print_interval = std::chrono::duration<double>(cfg.monitor.print_interval_s);
  auto next_print = started;
  while (g_running.load(std::memory_order_relaxed)) {
    const auto now = std::chrono::steady_clock::now();
    if (cfg.monitor.duration_s > 0.0 &&
        now - started >= std::chrono::duration<double>(cfg.monitor.duration_s)) {
      break;
    }
    if (now >= next_print) {
      const auto tracks = driver.GetTracks();
      PrintTracks(tracks, driver.GetKeepAliveStatus(), driver.MessageCount());
      if (recorder) {
        recorder->Record(WallTimeSeconds(), tracks);
      }
      next_print += std::chrono::duration_cast<std::chrono::steady_clock::duration>(print_interval);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  driver.Stop();
  if (recorder) {
    recorder->Flush();
    tradar::log::Logf(tradar::log::Level::kInfo, "Recorded %llu rows to %s",
                      static_cast<unsigned long long>(recorder->rows()),
                      cfg.monitor.tracks_csv.c_str());
  }
  return 0;
}
