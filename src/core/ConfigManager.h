#pragma once

#include "Constants.h"

#include <cstdint>
#include <filesystem>
#include <string>

struct AppConfig {
  // Storage
  std::string rootDir;   // downloaded radargrams live under here
  std::string indexPath; // JSON catalog of groundtracks

  // Credentials
  std::string nsidcToken;
  std::string aadAccessKey;
  std::string aadSecretKey;

  // Downloads
  int maxConcurrentTransfers = QIceRadar::DEFAULT_MAX_CONCURRENT_TRANSFERS;
  int connectTimeoutS = QIceRadar::DEFAULT_CONNECT_TIMEOUT_S;
  long lowSpeedBytes = QIceRadar::DEFAULT_LOW_SPEED_BYTES;
  int lowSpeedTimeS = QIceRadar::DEFAULT_LOW_SPEED_TIME_S;

  // Locator
  int maxCandidates = QIceRadar::DEFAULT_MAX_CANDIDATES;
  double cutoffKm = QIceRadar::DEFAULT_LOCATE_CUTOFF_KM;

  // Viewer
  std::string colormap = "gray";
  double stepOverlap = QIceRadar::DEFAULT_STEP_OVERLAP;
  std::uint64_t smallFileBytes = QIceRadar::DEFAULT_SMALL_FILE_BYTES;

  // Logging
  std::string logLevel = "warn";
};

class ConfigManager {
public:
  // Uses `dir` as the config directory, creating it if needed.
  // Returns false if the directory cannot be created.
  bool init(const std::filesystem::path &dir);

  // Load config from disk. Returns false if the file is missing or invalid,
  // or if no root directory is configured. Out-of-range values are clamped.
  bool load(AppConfig &config) const;

  // Save config to disk. Creates directories if needed. Returns false on
  // failure.
  bool save(const AppConfig &config) const;

  // Returns the resolved config file path (valid after init()).
  const std::filesystem::path &configPath() const { return configPath_; }
  const std::filesystem::path &configDir() const { return configDir_; }

private:
  std::filesystem::path configDir_;
  std::filesystem::path configPath_;
};
