#pragma once

#include "Segment.h"

#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Read-only view of the groundtrack index. The map host owns the real one;
// the core only ever asks for segments by id.
class GeometryIndex {
public:
  virtual ~GeometryIndex() = default;

  // Segments whose id is in `ids`, in id order. Unknown ids are ignored.
  virtual std::vector<Segment>
  segmentsWithin(const std::set<std::string> &ids) const = 0;

  // Returns false if the id is not in the index.
  virtual bool find(const std::string &id, Segment &out) const = 0;

  virtual std::vector<std::string> allIds() const = 0;
};

// Index loaded from a JSON catalog:
//
//   { "segments": [ { "granule_name": "...", "institution": "UTIG",
//                     "db_campaign": "...", "segment": "...",
//                     "region": "ANTARCTIC", "data_format": "utig_netcdf",
//                     "download_method": "wget", "url": "https://...",
//                     "relative_path": "UTIG/.../file.nc",
//                     "filesize": 123456, "checksum": "md5:...",
//                     "availability": "a",
//                     "groundtrack": [[lat, lon], ...] }, ... ] }
class JsonGeometryIndex : public GeometryIndex {
public:
  JsonGeometryIndex() = default;

  // Replaces the current contents. Returns false (and keeps the previous
  // contents) if the file is missing or not a valid catalog.
  bool loadFile(const std::filesystem::path &path);
  bool loadString(const std::string &text);

  // Inserts or replaces one segment.
  void addSegment(const Segment &segment);

  std::size_t size() const;

  std::vector<Segment>
  segmentsWithin(const std::set<std::string> &ids) const override;
  bool find(const std::string &id, Segment &out) const override;
  std::vector<std::string> allIds() const override;

private:
  bool parse(const std::string &text, std::map<std::string, Segment> &out);

  mutable std::mutex mutex_;
  std::map<std::string, Segment> segments_;
};
