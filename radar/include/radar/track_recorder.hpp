#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

#include "radar_types.hpp"

namespace tradar::radar {

// Appends track snapshots to a CSV file, one row per track.
class TrackRecorder {
 public:
  TrackRecorder(const std::string& path, std::size_t flush_interval = 10);
  ~TrackRecorder();

  TrackRecorder(const TrackRecorder&) = delete;
  TrackRecorder& operator=(const TrackRecorder&) = delete;

  bool valid() const { return file_ != nullptr; }

  void Record(double wall_time_s, const TrackMap& tracks);
  void Flush();

  uint64_t snapshots() const { return snapshots_; }
  uint64_t rows() const { return rows_; }

 private:
  std::FILE* file_ = nullptr;
  std::size_t flush_interval_;
  uint64_t snapshots_{0};
  uint64_t rows_{0};
};

}  // namespace tradar::radar
