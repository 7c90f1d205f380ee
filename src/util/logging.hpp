#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace weightfee::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

std::string_view LogLevelName(LogLevel level);
std::optional<LogLevel> LogLevelFromString(std::string_view name);

struct LogSettings {
  LogLevel level{LogLevel::kWarn};
  // Empty: records go to stderr.
  std::string file_path;
  // Once the file reaches this size it is moved to "<file_path>.old" and a
  // fresh file is started. Zero disables the rollover.
  std::uintmax_t max_file_bytes{0};
};

// Process-wide sink for "[time] [level] [component] message" records.
class Logger {
 public:
  // Replaces the current sink. Throws std::runtime_error when the log file
  // cannot be opened; the previous sink is kept in that case.
  void Apply(const LogSettings& settings);
  LogSettings Settings() const;
  bool WritesToFile() const;

  bool Enabled(LogLevel level) const;
  void Write(LogLevel level, std::string_view component, std::string_view message);

 private:
  void RollOverLocked();

  mutable std::mutex mutex_;
  LogSettings settings_;
  std::ofstream file_;
  std::uintmax_t file_bytes_{0};
};

Logger& GetLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

}  // namespace weightfee::util
