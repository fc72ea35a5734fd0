#include "ConfigManager.h"
#include "Colormap.h"
#include "Logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>

bool ConfigManager::init(const std::filesystem::path &dir) {
  if (dir.empty()) {
    LOG_E("ConfigManager", "No config directory given");
    return false;
  }
  configDir_ = dir;

  // Ensure directory exists
  std::error_code ec;
  std::filesystem::create_directories(configDir_, ec);
  if (ec) {
    LOG_E("ConfigManager", "Failed to create dir {}: {}", configDir_.string(),
          ec.message());
    return false;
  }

  configPath_ = configDir_ / "config.json";
  return true;
}

bool ConfigManager::load(AppConfig &config) const {
  if (configPath_.empty())
    return false;

  std::ifstream ifs(configPath_);
  if (!ifs)
    return false;

  auto json = nlohmann::json::parse(ifs, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    LOG_E("ConfigManager", "Invalid JSON in {}", configPath_.string());
    return false;
  }

  try {
    if (json.contains("storage")) {
      auto &st = json["storage"];
      config.rootDir = st.value("root_dir", "");
      config.indexPath = st.value("index_path", "");
    }

    if (json.contains("credentials")) {
      auto &cr = json["credentials"];
      config.nsidcToken = cr.value("nsidc_token", "");
      config.aadAccessKey = cr.value("aad_access_key", "");
      config.aadSecretKey = cr.value("aad_secret_key", "");
    }

    if (json.contains("downloads")) {
      auto &dl = json["downloads"];
      config.maxConcurrentTransfers = std::max(
          1, dl.value("max_concurrent",
                      QIceRadar::DEFAULT_MAX_CONCURRENT_TRANSFERS));
      config.connectTimeoutS = std::max(
          1, dl.value("connect_timeout_s", QIceRadar::DEFAULT_CONNECT_TIMEOUT_S));
      config.lowSpeedBytes = std::max(
          0L, dl.value("low_speed_bytes", QIceRadar::DEFAULT_LOW_SPEED_BYTES));
      config.lowSpeedTimeS = std::max(
          0, dl.value("low_speed_time_s", QIceRadar::DEFAULT_LOW_SPEED_TIME_S));
    }

    if (json.contains("locator")) {
      auto &lo = json["locator"];
      config.maxCandidates = std::max(
          1, lo.value("max_candidates",
                      static_cast<int>(QIceRadar::DEFAULT_MAX_CANDIDATES)));
      config.cutoffKm =
          lo.value("cutoff_km", QIceRadar::DEFAULT_LOCATE_CUTOFF_KM);
      if (!(config.cutoffKm > 0.0))
        config.cutoffKm = QIceRadar::DEFAULT_LOCATE_CUTOFF_KM;
    }

    if (json.contains("viewer")) {
      auto &vw = json["viewer"];
      config.colormap = vw.value("colormap", "gray");
      if (!Colormap::isKnown(config.colormap)) {
        LOG_W("ConfigManager", "Unknown colormap '{}', using gray",
              config.colormap);
        config.colormap = "gray";
      }
      config.stepOverlap = std::clamp(
          vw.value("step_overlap", QIceRadar::DEFAULT_STEP_OVERLAP),
          QIceRadar::MIN_STEP_OVERLAP, QIceRadar::MAX_STEP_OVERLAP);
      config.smallFileBytes = vw.value(
          "small_file_bytes",
          static_cast<std::uint64_t>(QIceRadar::DEFAULT_SMALL_FILE_BYTES));
    }

    if (json.contains("logging")) {
      config.logLevel = json["logging"].value("level", "warn");
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_E("ConfigManager", "Bad value in {}: {}", configPath_.string(),
          e.what());
    return false;
  }

  // Require a root directory to consider config valid
  return !config.rootDir.empty();
}

bool ConfigManager::save(const AppConfig &config) const {
  if (configPath_.empty())
    return false;

  // Create directory if needed
  std::error_code ec;
  std::filesystem::create_directories(configDir_, ec);
  if (ec) {
    LOG_E("ConfigManager", "Cannot create {}: {}", configDir_.string(),
          ec.message());
    return false;
  }

  nlohmann::json json;
  json["storage"]["root_dir"] = config.rootDir;
  json["storage"]["index_path"] = config.indexPath;

  json["credentials"]["nsidc_token"] = config.nsidcToken;
  json["credentials"]["aad_access_key"] = config.aadAccessKey;
  json["credentials"]["aad_secret_key"] = config.aadSecretKey;

  json["downloads"]["max_concurrent"] = config.maxConcurrentTransfers;
  json["downloads"]["connect_timeout_s"] = config.connectTimeoutS;
  json["downloads"]["low_speed_bytes"] = config.lowSpeedBytes;
  json["downloads"]["low_speed_time_s"] = config.lowSpeedTimeS;

  json["locator"]["max_candidates"] = config.maxCandidates;
  json["locator"]["cutoff_km"] = config.cutoffKm;

  json["viewer"]["colormap"] = config.colormap;
  json["viewer"]["step_overlap"] = config.stepOverlap;
  json["viewer"]["small_file_bytes"] = config.smallFileBytes;

  json["logging"]["level"] = config.logLevel;

  std::ofstream ofs(configPath_);
  if (!ofs) {
    LOG_E("ConfigManager", "Cannot write {}", configPath_.string());
    return false;
  }

  ofs << json.dump(2) << "\n";
  return ofs.good();
}
