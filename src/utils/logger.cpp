#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>

namespace utils {

namespace {
std::mutex log_mutex;
std::ofstream log_file;
std::string log_file_path;
LogConfig active_config;
std::atomic<int> min_level{static_cast<int>(LogLevel::INFO)};

const char* getLevelStr(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
    default:
      return "UNKNOWN";
  }
}

const char* baseName(const char* file) {
  const char* slash = std::strrchr(file, '/');
  return slash ? slash + 1 : file;
}

std::string getCurrentTime() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm;
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count();
  return oss.str();
}

// Rotation failures must not take the process down; the current file keeps
// growing instead.
void rotateLogsIfNeeded() {
  std::error_code ec;
  if (log_file_path.empty()) return;
  auto size = std::filesystem::file_size(log_file_path, ec);
  if (ec || size < active_config.maxFileSize) return;

  log_file.close();
  for (int i = static_cast<int>(active_config.maxBackupFiles) - 1; i >= 0;
       --i) {
    std::string old_name =
        log_file_path + (i == 0 ? "" : ("." + std::to_string(i)));
    std::string new_name = log_file_path + "." + std::to_string(i + 1);
    if (std::filesystem::exists(old_name, ec)) {
      std::filesystem::rename(old_name, new_name, ec);
    }
  }
  log_file.open(log_file_path, std::ios::trunc);
}

void openLogFile() {
  std::error_code ec;
  std::filesystem::create_directories(active_config.logDir, ec);
  if (ec) {
    std::cerr << "Failed to create log directory " << active_config.logDir
              << ": " << ec.message() << std::endl;
    return;
  }
  log_file_path =
      (std::filesystem::path(active_config.logDir) / active_config.fileName)
          .string();
  log_file.open(log_file_path, std::ios::app);
  if (!log_file.is_open()) {
    std::cerr << "Failed to open log file: " << log_file_path << std::endl;
  }
}
}  // namespace

LogLevel parseLogLevel(const std::string& name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "DEBUG") return LogLevel::DEBUG;
  if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
  if (upper == "ERROR") return LogLevel::ERROR;
  if (upper == "FATAL") return LogLevel::FATAL;
  return LogLevel::INFO;
}

void Logger::initialize(const LogConfig& config) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open()) log_file.close();
  active_config = config;
  if (active_config.logDir.empty()) active_config.logDir = "logs";
  if (active_config.fileName.empty())
    active_config.fileName = "job_downloader.log";
  if (!active_config.maxFileSize) active_config.maxFileSize = 10 * 1024 * 1024;
  if (!active_config.maxBackupFiles) active_config.maxBackupFiles = 3;
  min_level.store(static_cast<int>(active_config.minLevel));
  openLogFile();
}

bool Logger::enabled(LogLevel level) {
  return static_cast<int>(level) >= min_level.load(std::memory_order_relaxed);
}

Logger::LogStream::LogStream(LogLevel level, const char* file, const char* func,
                             int line)
    : enabled_(Logger::enabled(level)), oss_() {
  if (!enabled_) return;
  oss_ << "[" << getLevelStr(level) << "] " << getCurrentTime() << " "
       << baseName(file) << ":" << line << " " << func << ": ";
}

Logger::LogStream::~LogStream() {
  if (!enabled_) return;
  oss_ << "\n";
  std::string msg = oss_.str();
  {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_file.is_open()) openLogFile();
    rotateLogsIfNeeded();
    if (active_config.toConsole) std::cout << msg;
    if (log_file.is_open()) log_file << msg, log_file.flush();
  }
}

}  // namespace utils
