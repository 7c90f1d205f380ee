#include "util/logging.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace weightfee::util {

namespace {

constexpr std::array<std::string_view, 4> kLevelNames = {"debug", "info", "warn", "error"};

// "2026-10-18T09:30:00Z"; UTC so that records from different hosts sort.
std::string UtcTimestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &now);
#else
  gmtime_r(&now, &utc);
#endif
  char buffer[32];
  const auto length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buffer, length);
}

std::uintmax_t ExistingSize(const std::string& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : size;
}

}  // namespace

std::string_view LogLevelName(LogLevel level) {
  const auto index = static_cast<std::size_t>(level);
  return index < kLevelNames.size() ? kLevelNames[index] : "unknown";
}

std::optional<LogLevel> LogLevelFromString(std::string_view name) {
  std::string lower;
  lower.reserve(name.size());
  for (char c : name) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "warning") {
    return LogLevel::kWarn;
  }
  for (std::size_t i = 0; i < kLevelNames.size(); ++i) {
    if (lower == kLevelNames[i]) {
      return static_cast<LogLevel>(i);
    }
  }
  return std::nullopt;
}

void Logger::Apply(const LogSettings& settings) {
  std::ofstream file;
  std::uintmax_t file_bytes = 0;
  if (!settings.file_path.empty()) {
    const auto parent = std::filesystem::path(settings.file_path).parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
    }
    file.open(settings.file_path, std::ios::app);
    if (!file) {
      throw std::runtime_error("cannot open log file " + settings.file_path);
    }
    file_bytes = ExistingSize(settings.file_path);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  settings_ = settings;
  file_ = std::move(file);
  file_bytes_ = file_bytes;
}

LogSettings Logger::Settings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return settings_;
}

bool Logger::WritesToFile() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

bool Logger::Enabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level >= settings_.level;
}

void Logger::Write(LogLevel level, std::string_view component, std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < settings_.level) {
    return;
  }
  std::string record = "[" + UtcTimestamp() + "] [" + std::string(LogLevelName(level)) + "] [" +
                       std::string(component) + "] ";
  record.append(message);
  record.push_back('\n');
  if (!file_.is_open()) {
    std::cerr << record;
    return;
  }
  if (settings_.max_file_bytes != 0 && file_bytes_ != 0 &&
      file_bytes_ + record.size() > settings_.max_file_bytes) {
    RollOverLocked();
    if (!file_.is_open()) {
      std::cerr << record;
      return;
    }
  }
  file_ << record;
  file_.flush();
  file_bytes_ += record.size();
}

void Logger::RollOverLocked() {
  file_.close();
  const std::string previous = settings_.file_path + ".old";
  std::error_code ec;
  std::filesystem::remove(previous, ec);
  std::filesystem::rename(settings_.file_path, previous, ec);
  file_.open(settings_.file_path, std::ios::trunc);
  file_bytes_ = 0;
  if (!file_) {
    // Later records go to stderr.
    file_.close();
    std::cerr << "[" << UtcTimestamp() << "] [error] [log] cannot reopen "
              << settings_.file_path << "\n";
  }
}

Logger& GetLogger() {
  static Logger logger;
  return logger;
}

void LogDebug(std::string_view component, std::string_view message) {
  GetLogger().Write(LogLevel::kDebug, component, message);
}
void LogInfo(std::string_view component, std::string_view message) {
  GetLogger().Write(LogLevel::kInfo, component, message);
}
void LogWarn(std::string_view component, std::string_view message) {
  GetLogger().Write(LogLevel::kWarn, component, message);
}
void LogError(std::string_view component, std::string_view message) {
  GetLogger().Write(LogLevel::kError, component, message);
}

}  // namespace weightfee::util
