#include <common/logging.hpp>

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <deque>
#include <mutex>
#include <string>

namespace tradar::log {
namespace {

constexpr std::size_t kMaxEntries = 512;

// Bounded in-memory history plus an optional stdout mirror. Driver threads
// (notifier, keep-alive) and the caller's thread all write here.
class LogSink {
 public:
  void Append(Level level, std::string_view message, bool force_echo) {
    Entry entry{level, Format(level, message)};
    bool echo = force_echo;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      echo = echo || (echo_ && level >= echo_level_);
      entries_.push_back(entry);
      while (entries_.size() > kMaxEntries) {
        entries_.pop_front();
      }
    }
    if (echo) {
      std::fprintf(stdout, "%s\n", entry.formatted.c_str());
      std::fflush(stdout);
    }
  }

  void SetEcho(bool enabled, Level min_level) {
    std::lock_guard<std::mutex> lock(mutex_);
    echo_ = enabled;
    echo_level_ = min_level;
  }

  std::vector<Entry> Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {entries_.begin(), entries_.end()};
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
  }

 private:
  static std::string Format(Level level, std::string_view message) {
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
      message.remove_suffix(1);
    }
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&seconds, &local);
    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "[%02d:%02d:%02d.%03d] [%s] ", local.tm_hour,
                  local.tm_min, local.tm_sec, static_cast<int>(millis), LevelTag(level));
    std::string formatted(stamp);
    formatted.append(message.data(), message.size());
    return formatted;
  }

  mutable std::mutex mutex_;
  std::deque<Entry> entries_;
  bool echo_{false};
  Level echo_level_{Level::kInfo};
};

LogSink& Sink() {
  static LogSink sink;
  return sink;
}

std::string VFormat(const char* fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  const int len = std::vsnprintf(nullptr, 0, fmt, sizing);
  va_end(sizing);
  if (len <= 0) {
    return {};
  }
  std::string out(static_cast<std::size_t>(len), '\0');
  std::vsnprintf(out.data(), out.size() + 1, fmt, args);
  return out;
}

}  // namespace

const char* LevelTag(Level level) {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarning:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "INFO";
}

void Log(Level level, std::string_view message, bool also_stdout) {
  Sink().Append(level, message, also_stdout);
}

void LogDebug(std::string_view message) { Log(Level::kDebug, message); }
void LogInfo(std::string_view message) { Log(Level::kInfo, message); }
void LogWarning(std::string_view message) { Log(Level::kWarning, message); }
void LogError(std::string_view message) { Log(Level::kError, message); }

void Logf(Level level, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  const std::string message = VFormat(fmt, args);
  va_end(args);
  Sink().Append(level, message, false);
}

void SetEcho(bool enabled, Level min_level) { Sink().SetEcho(enabled, min_level); }

std::vector<Entry> Snapshot() { return Sink().Snapshot(); }

void Clear() { Sink().Clear(); }

}  // namespace tradar::log
