#include "GeometryIndex.h"
#include "Logger.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace {

bool parseTrack(const nlohmann::json &track, std::vector<LatLon> &out) {
  if (!track.is_array())
    return false;
  out.clear();
  out.reserve(track.size());
  for (const auto &pt : track) {
    if (!pt.is_array() || pt.size() < 2 || !pt[0].is_number() ||
        !pt[1].is_number())
      return false;
    out.push_back({pt[0].get<double>(), pt[1].get<double>()});
  }
  return true;
}

} // namespace

bool JsonGeometryIndex::parse(const std::string &text,
                              std::map<std::string, Segment> &out) {
  auto json = nlohmann::json::parse(text, nullptr, false);
  if (json.is_discarded()) {
    LOG_E("GeometryIndex", "Catalog is not valid JSON");
    return false;
  }
  if (!json.contains("segments") || !json["segments"].is_array()) {
    LOG_E("GeometryIndex", "Catalog has no 'segments' array");
    return false;
  }

  for (const auto &item : json["segments"]) {
    if (!item.is_object())
      continue;
    Segment seg;
    try {
      seg.id = item.value("granule_name", "");
      if (seg.id.empty()) {
        LOG_W("GeometryIndex", "Skipping catalog entry without granule_name");
        continue;
      }
      seg.institution = item.value("institution", "");
      seg.campaign = item.value("db_campaign", "");
      seg.segment = item.value("segment", "");
      seg.region = item.value("region", "");
      seg.dataFormat = item.value("data_format", "");
      seg.downloadMethod = item.value("download_method", "");
      seg.relativePath = item.value("relative_path", "");
      seg.availability =
          availabilityFromString(item.value("availability", "a"));

      seg.remote.url = item.value("url", "");
      seg.remote.credential = credentialForMethod(seg.downloadMethod);
      seg.remote.sizeBytes = item.value("filesize", std::uint64_t{0});
      seg.remote.checksum = item.value("checksum", "");
    } catch (const nlohmann::json::exception &e) {
      LOG_W("GeometryIndex", "Skipping malformed catalog entry {}: {}",
            seg.id, e.what());
      continue;
    }

    if (item.contains("groundtrack") &&
        !parseTrack(item["groundtrack"], seg.groundtrack)) {
      LOG_W("GeometryIndex", "Bad groundtrack for {}, ignoring geometry",
            seg.id);
      seg.groundtrack.clear();
    }
    out[seg.id] = std::move(seg);
  }
  return true;
}

bool JsonGeometryIndex::loadString(const std::string &text) {
  std::map<std::string, Segment> parsed;
  if (!parse(text, parsed))
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  segments_ = std::move(parsed);
  LOG_I("GeometryIndex", "Loaded {} segments", segments_.size());
  return true;
}

bool JsonGeometryIndex::loadFile(const std::filesystem::path &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    LOG_E("GeometryIndex", "Cannot open catalog {}", path.string());
    return false;
  }
  std::stringstream ss;
  ss << ifs.rdbuf();
  return loadString(ss.str());
}

void JsonGeometryIndex::addSegment(const Segment &segment) {
  std::lock_guard<std::mutex> lock(mutex_);
  segments_[segment.id] = segment;
}

std::size_t JsonGeometryIndex::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return segments_.size();
}

std::vector<Segment>
JsonGeometryIndex::segmentsWithin(const std::set<std::string> &ids) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Segment> out;
  for (const auto &id : ids) {
    auto it = segments_.find(id);
    if (it != segments_.end())
      out.push_back(it->second);
  }
  return out;
}

bool JsonGeometryIndex::find(const std::string &id, Segment &out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = segments_.find(id);
  if (it == segments_.end())
    return false;
  out = it->second;
  return true;
}

std::vector<std::string> JsonGeometryIndex::allIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(segments_.size());
  for (const auto &kv : segments_)
    ids.push_back(kv.first);
  return ids;
}
