#pragma once

#include "Constants.h"
#include "Geodesy.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// Thrown by RadargramStore::open when a file cannot be used as a radargram.
class FormatError : public std::runtime_error {
public:
  explicit FormatError(const std::string &what) : std::runtime_error(what) {}
};

// Half-open index range [start, end).
struct IndexRange {
  std::size_t start = 0;
  std::size_t end = 0;

  std::size_t size() const { return end > start ? end - start : 0; }
  bool empty() const { return end <= start; }
  bool contains(std::size_t i) const { return i >= start && i < end; }
  bool operator==(const IndexRange &o) const {
    return start == o.start && end == o.end;
  }
  bool operator!=(const IndexRange &o) const { return !(*this == o); }
};

// On-disk layouts the store understands.
enum class FormatProfile {
  UTIG,   // traces x samples, natural log for display
  BAS,    // samples x traces, log10 for display
  AWI,    // samples x traces, last sample first, values used as stored
  Generic // traces x samples, values used as stored
};

const char *profileName(FormatProfile p);

struct TraceGeolocation {
  double lat = 0.0;
  double lon = 0.0;
  double alongTrackM = 0.0;
};

// A decimated rectangle of the radar matrix, already transformed for display.
// values are trace-major: values[t * numSamples + s].
struct RadarSlice {
  IndexRange traces;
  IndexRange samples;
  std::size_t traceStride = 1;
  std::size_t sampleStride = 1;
  std::size_t numTraces = 0;
  std::size_t numSamples = 0;
  std::vector<float> values;

  float at(std::size_t t, std::size_t s) const {
    return values[t * numSamples + s];
  }
};

struct IntensityStats {
  float min = 0.0f;
  float max = 1.0f;
  bool valid = false;
};

// Read-only, windowed access to one local radar file (netCDF).
//
// Only the geolocation and time axes are held in memory. Sample data is read
// per window as a hyperslab, unless the matrix is smaller than the
// small-file threshold, in which case it is loaded once at open. All netCDF
// calls go through one mutex, so reads may come from any thread.
class RadargramStore {
public:
  // Throws FormatError if the file is unreadable or corrupt, a required
  // variable is missing, or the dimensions disagree.
  //
  // dataFormat is the catalog's format tag ("utig_netcdf", "bas_netcdf",
  // "awi_netcdf"). It pins the profile; when empty the profile is detected
  // from the variable names. Other tags are rejected with FormatError.
  static std::shared_ptr<RadargramStore>
  open(const std::filesystem::path &path,
       std::uint64_t smallFileBytes = QIceRadar::DEFAULT_SMALL_FILE_BYTES,
       const std::string &dataFormat = "");

  ~RadargramStore();

  RadargramStore(const RadargramStore &) = delete;
  RadargramStore &operator=(const RadargramStore &) = delete;

  std::size_t traceCount() const { return traceCount_; }
  std::size_t sampleCount() const { return sampleCount_; }

  // Throws std::invalid_argument for an empty range or zero stride and
  // std::out_of_range for a range past the matrix.
  RadarSlice readWindow(const IndexRange &traces, const IndexRange &samples,
                        std::size_t traceStride = 1,
                        std::size_t sampleStride = 1) const;

  // Display value of one sample.
  float value(std::size_t trace, std::size_t sample) const;

  // Throws std::out_of_range.
  TraceGeolocation traceGeolocation(std::size_t trace) const;

  // Two-way travel time in microseconds. Throws std::out_of_range.
  double twttMicros(std::size_t sample) const;

  bool hasUtc() const { return !utc_.empty(); }
  // Seconds as stored in the file; NaN if the file has no time axis.
  double utcSeconds(std::size_t trace) const;

  // Geographic extent of the traces in `traces` (fill values skipped).
  GeoBounds bounds(const IndexRange &traces) const;

  const std::vector<double> &latitudes() const { return lat_; }
  const std::vector<double> &longitudes() const { return lon_; }
  const std::vector<double> &alongTrack() const { return alongTrack_; }

  // Min/max of the display values, taken from an overview read at open.
  IntensityStats intensityStats() const { return stats_; }

  FormatProfile profile() const { return profile_; }
  const std::string &dataVariable() const { return dataVarName_; }
  const std::filesystem::path &path() const { return path_; }
  bool inMemory() const { return !cache_.empty(); }

private:
  RadargramStore() = default;

  void inspect(const std::string &dataFormat);
  bool findData(FormatProfile profile, const std::string &campaign);
  void loadAxes();
  // AGAP stores geolocation per pulse trace; returns the pulse trace behind
  // each chirp trace, or an empty vector for every other campaign.
  std::vector<std::size_t> chirpToPulse(std::size_t pulseCount) const;
  void loadCache();
  void computeStats();

  // Raw read in file order, caller holds ncMutex_.
  void readRaw(const IndexRange &traces, const IndexRange &samples,
               std::size_t traceStride, std::size_t sampleStride,
               std::vector<float> &out, std::size_t &nt,
               std::size_t &ns) const;
  float transform(float v) const;

  std::filesystem::path path_;
  int ncid_ = -1;
  int dataVar_ = -1;
  std::string dataVarName_;
  FormatProfile profile_ = FormatProfile::Generic;
  bool samplesMajor_ = false;
  bool samplesReversed_ = false; // file stores the last sample first
  std::string campaign_;

  std::size_t traceCount_ = 0;
  std::size_t sampleCount_ = 0;

  std::vector<double> lat_;
  std::vector<double> lon_;
  std::vector<double> alongTrack_;
  std::vector<double> fastTime_;
  std::vector<double> utc_;

  std::vector<float> cache_; // trace-major display values, small files only
  IntensityStats stats_;

  mutable std::mutex ncMutex_;
};
