#pragma once

#include <string>
#include <string_view>
#include <vector>

// Process-wide log used by the CAN layer and the radar driver. Entries are kept
// in a bounded ring (oldest dropped first) and optionally mirrored to stdout.
namespace tradar::log {

enum class Level {
  kDebug,
  kInfo,
  kWarning,
  kError,
};

struct Entry {
  Level level;
  // "[HH:MM:SS.mmm] [TAG] message"
  std::string formatted;
};

// `also_stdout` mirrors this entry regardless of the echo setting.
void Log(Level level, std::string_view message, bool also_stdout = false);
void LogDebug(std::string_view message);
void LogInfo(std::string_view message);
void LogWarning(std::string_view message);
void LogError(std::string_view message);
void Logf(Level level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

// Mirror entries at or above `min_level` to stdout. Off by default.
void SetEcho(bool enabled, Level min_level = Level::kInfo);

std::vector<Entry> Snapshot();
void Clear();

const char* LevelTag(Level level);

}  // namespace tradar::log
