#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define access _access
#define W_OK 2
#else
#include <unistd.h>
#endif

std::shared_ptr<spdlog::logger> Log::s_Logger;

namespace {
std::once_flag s_defaultOnce;
}

std::shared_ptr<spdlog::logger> &Log::get() {
  std::call_once(s_defaultOnce, [] {
    if (s_Logger)
      return;
    s_Logger = std::make_shared<spdlog::logger>(
        "QICERADAR", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    s_Logger->set_level(spdlog::level::warn);
  });
  return s_Logger;
}

spdlog::level::level_enum Log::levelFromString(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "trace")
    return spdlog::level::trace;
  if (lower == "debug")
    return spdlog::level::debug;
  if (lower == "info")
    return spdlog::level::info;
  if (lower == "error")
    return spdlog::level::err;
  return spdlog::level::warn;
}

void Log::init(const std::string &fallbackDir) {
  spdlog::set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%l] %v%$");

  std::vector<spdlog::sink_ptr> sinks;

  // 1. Stderr Color Sink
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  // 2. Rotating File Sink
  std::filesystem::path primaryPath = "/var/log/qiceradar";
  std::filesystem::path logFile;

  std::error_code ec;
  if (std::filesystem::exists(primaryPath, ec) &&
      access(primaryPath.string().c_str(), W_OK) == 0) {
    logFile = primaryPath / "qiceradar.log";
  } else if (!fallbackDir.empty()) {
    logFile = std::filesystem::path(fallbackDir) / "qiceradar.log";
  }

  if (!logFile.empty()) {
    try {
      // 5MB per file, 3 rotated files max (15MB total)
      auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          logFile.string(), 5 * 1024 * 1024, 3);
      sinks.push_back(fileSink);
      std::fprintf(stderr, "Logging to file: %s\n", logFile.string().c_str());
    } catch (const spdlog::spdlog_ex &ex) {
      std::fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    }
  }

  s_Logger =
      std::make_shared<spdlog::logger>("QICERADAR", sinks.begin(), sinks.end());
  // Default to WARN level - use --log-level to change
  s_Logger->set_level(spdlog::level::warn);
  s_Logger->flush_on(spdlog::level::warn);

  LOG_INFO("Logger initialized with {} sinks", sinks.size());
}
