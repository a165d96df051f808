#include "radar/track_recorder.hpp"

#include <common/logging.hpp>
#include <common/time/radar_clock.hpp>

namespace tradar::radar {

TrackRecorder::TrackRecorder(const std::string& path, std::size_t flush_interval)
    : flush_interval_(flush_interval == 0 ? 1 : flush_interval) {
  file_ = std::fopen(path.c_str(), "w");
  if (!file_) {
    log::Logf(log::Level::kError, "Unable to open track log %s", path.c_str());
    return;
  }
  std::fprintf(file_, "wall_time,frame_index,track_id,long_dist,lat_dist,rel_speed,new_track,timestamp\n");
}

TrackRecorder::~TrackRecorder() {
  if (file_) {
    std::fflush(file_);
    std::fclose(file_);
    file_ = nullptr;
  }
}

void TrackRecorder::Record(double wall_time_s, const TrackMap& tracks) {
  if (!file_) {
    return;
  }
  for (const auto& [track_id, track] : tracks) {
    std::fprintf(file_, "%.6f,%llu,%d,%.3f,%.3f,%.3f,%d,%.6f\n", wall_time_s,
                 static_cast<unsigned long long>(snapshots_), track_id, track.long_dist,
                 track.lat_dist, track.rel_speed, track.new_track ? 1 : 0,
                 time::toSeconds(track.timestamp_ns));
    ++rows_;
  }
  ++snapshots_;
  if (snapshots_ % flush_interval_ == 0) {
    Flush();
  }
}

void TrackRecorder::Flush() {
  if (file_) {
    std::fflush(file_);
  }
}

}  // namespace tradar::radar
