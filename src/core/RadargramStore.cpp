#include "RadargramStore.h"
#include "Logger.h"

#include <netcdf.h>

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <limits>

namespace {

constexpr std::size_t kOverviewSize = 1024;
constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();

void check(int status, const std::string &what) {
  if (status != NC_NOERR)
    throw FormatError(what + ": " + nc_strerror(status));
}

int findVar(int ncid, std::initializer_list<const char *> names,
            std::string &found) {
  for (const char *name : names) {
    int varid = -1;
    if (nc_inq_varid(ncid, name, &varid) == NC_NOERR) {
      found = name;
      return varid;
    }
  }
  return -1;
}

std::string globalText(int ncid, const char *name) {
  nc_type type;
  std::size_t len = 0;
  if (nc_inq_att(ncid, NC_GLOBAL, name, &type, &len) != NC_NOERR ||
      type != NC_CHAR)
    return "";
  std::string value(len, '\0');
  if (nc_get_att_text(ncid, NC_GLOBAL, name, &value[0]) != NC_NOERR)
    return "";
  while (!value.empty() && value.back() == '\0')
    value.pop_back();
  return value;
}

// Reads a whole 1-D variable. Returns false if it is not 1-D.
bool readVector(int ncid, int varid, const std::string &name,
                std::vector<double> &out) {
  int ndims = 0;
  check(nc_inq_varndims(ncid, varid, &ndims), "inspect " + name);
  if (ndims != 1)
    return false;
  int dimid = -1;
  check(nc_inq_vardimid(ncid, varid, &dimid), "inspect " + name);
  std::size_t len = 0;
  check(nc_inq_dimlen(ncid, dimid, &len), "inspect " + name);
  out.resize(len);
  if (len > 0)
    check(nc_get_var_double(ncid, varid, out.data()), "read " + name);
  return true;
}

std::size_t strided(std::size_t n, std::size_t stride) {
  return (n + stride - 1) / stride;
}

// Finite and ordered, either way round.
bool isMonotonic(const std::vector<double> &v) {
  bool up = true, down = true;
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (!std::isfinite(v[i]))
      return false;
    if (i > 0) {
      up = up && v[i] >= v[i - 1];
      down = down && v[i] <= v[i - 1];
    }
  }
  return up || down;
}

// Piecewise-linear interpolation clamped to the end values. xp must be
// strictly increasing.
double interpolate(double x, const std::vector<double> &xp,
                   const std::vector<double> &fp) {
  if (x <= xp.front())
    return fp.front();
  if (x >= xp.back())
    return fp.back();
  const std::size_t k =
      std::upper_bound(xp.begin(), xp.end(), x) - xp.begin() - 1;
  return fp[k] + (x - xp[k]) * (fp[k + 1] - fp[k]) / (xp[k + 1] - xp[k]);
}

} // namespace

const char *profileName(FormatProfile p) {
  switch (p) {
  case FormatProfile::UTIG:
    return "utig";
  case FormatProfile::BAS:
    return "bas";
  case FormatProfile::AWI:
    return "awi";
  case FormatProfile::Generic:
    return "generic";
  }
  return "generic";
}

std::shared_ptr<RadargramStore>
RadargramStore::open(const std::filesystem::path &path,
                     std::uint64_t smallFileBytes,
                     const std::string &dataFormat) {
  std::shared_ptr<RadargramStore> store(new RadargramStore());
  store->path_ = path;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec))
    throw FormatError("not a readable file: " + path.string());

  check(nc_open(path.c_str(), NC_NOWRITE, &store->ncid_),
        "open " + path.string());

  store->inspect(dataFormat);
  store->loadAxes();

  const std::uint64_t bytes = static_cast<std::uint64_t>(store->traceCount_) *
                              store->sampleCount_ * sizeof(float);
  // The header can be fine while the data section is damaged
  try {
    if (bytes <= smallFileBytes)
      store->loadCache();
    store->computeStats();
  } catch (const FormatError &) {
    throw;
  } catch (const std::runtime_error &e) {
    throw FormatError(path.filename().string() + ": " + e.what());
  }

  LOG_I("RadargramStore", "Opened {} ({} profile, {}): {} traces x {} samples{}",
        path.filename().string(), profileName(store->profile_),
        store->dataVarName_, store->traceCount_, store->sampleCount_,
        store->inMemory() ? ", in memory" : "");
  return store;
}

RadargramStore::~RadargramStore() {
  if (ncid_ != -1) {
    int status = nc_close(ncid_);
    if (status != NC_NOERR)
      LOG_W("RadargramStore", "nc_close({}) failed: {}", path_.string(),
            nc_strerror(status));
  }
}

bool RadargramStore::findData(FormatProfile profile,
                              const std::string &campaign) {
  switch (profile) {
  case FormatProfile::UTIG:
    // AGASEA, then EAGLE, then OIA/ICECAP/GIMBLE/COLDEX
    dataVar_ = findVar(ncid_,
                       {"data_hi_gain", "amplitude_hi_gain",
                        "amplitude_high_gain"},
                       dataVarName_);
    break;
  case FormatProfile::BAS:
    // IMAFI shipped two chirp products; POLARGAP's early flights only have
    // the polarised one.
    if (campaign == "IMAFI")
      dataVar_ = findVar(ncid_, {"chirp_cHG_data", "chirp_data"}, dataVarName_);
    else if (campaign == "POLARGAP")
      dataVar_ = findVar(ncid_, {"polarised_chirp_PPVV_data", "chirp_data"},
                         dataVarName_);
    else
      dataVar_ = findVar(ncid_,
                         {"chirp_data", "chirp_cHG_data",
                          "polarised_chirp_PPVV_data"},
                         dataVarName_);
    break;
  case FormatProfile::AWI:
    dataVar_ = findVar(ncid_, {"WAVEFORM"}, dataVarName_);
    break;
  case FormatProfile::Generic:
    dataVar_ = findVar(ncid_, {"data"}, dataVarName_);
    break;
  }
  if (dataVar_ < 0)
    return false;
  profile_ = profile;
  return true;
}

void RadargramStore::inspect(const std::string &dataFormat) {
  campaign_ = globalText(ncid_, "campaign");

  bool found = false;
  if (dataFormat.empty()) {
    for (FormatProfile p : {FormatProfile::UTIG, FormatProfile::BAS,
                            FormatProfile::AWI, FormatProfile::Generic}) {
      found = findData(p, campaign_);
      if (found)
        break;
    }
  } else if (dataFormat == "utig_netcdf") {
    found = findData(FormatProfile::UTIG, campaign_);
  } else if (dataFormat == "bas_netcdf") {
    found = findData(FormatProfile::BAS, campaign_);
  } else if (dataFormat == "awi_netcdf") {
    found = findData(FormatProfile::AWI, campaign_);
  } else {
    throw FormatError("unsupported data format '" + dataFormat + "' for " +
                      path_.string());
  }
  if (!found)
    throw FormatError("no radar data variable in " + path_.string());

  int ndims = 0;
  check(nc_inq_varndims(ncid_, dataVar_, &ndims), "inspect " + dataVarName_);
  if (ndims != 2)
    throw FormatError(dataVarName_ + " has " + std::to_string(ndims) +
                      " dimensions, expected 2");
  int dimids[2];
  check(nc_inq_vardimid(ncid_, dataVar_, dimids), "inspect " + dataVarName_);
  std::size_t len0 = 0, len1 = 0;
  check(nc_inq_dimlen(ncid_, dimids[0], &len0), "inspect " + dataVarName_);
  check(nc_inq_dimlen(ncid_, dimids[1], &len1), "inspect " + dataVarName_);

  samplesMajor_ =
      profile_ == FormatProfile::BAS || profile_ == FormatProfile::AWI;
  samplesReversed_ = profile_ == FormatProfile::AWI;
  traceCount_ = samplesMajor_ ? len1 : len0;
  sampleCount_ = samplesMajor_ ? len0 : len1;
  if (traceCount_ == 0 || sampleCount_ == 0)
    throw FormatError(dataVarName_ + " is empty");
}

void RadargramStore::loadAxes() {
  std::string latName, lonName, timeName, utcName;
  int latVar = -1, lonVar = -1, timeVar = -1, utcVar = -1;

  if (profile_ == FormatProfile::BAS) {
    latVar = findVar(ncid_, {"latitude_layerData"}, latName);
    lonVar = findVar(ncid_, {"longitude_layerData"}, lonName);
    timeVar = findVar(ncid_, {"fast_time"}, timeName);
    // POLARGAP exported a broken UTC axis
    if (campaign_ != "POLARGAP")
      utcVar = findVar(ncid_, {"UTC_time_layerData"}, utcName);
  } else if (profile_ == FormatProfile::AWI) {
    latVar = findVar(ncid_, {"LATITUDE"}, latName);
    lonVar = findVar(ncid_, {"LONGITUDE"}, lonName);
    timeVar = findVar(ncid_, {"TWT"}, timeName);
    utcVar = findVar(ncid_, {"TIME"}, utcName);
  } else if (profile_ == FormatProfile::UTIG) {
    latVar = findVar(ncid_, {"latitude", "lat"}, latName);
    lonVar = findVar(ncid_, {"longitude", "lon"}, lonName);
    timeVar = findVar(ncid_, {"fasttime", "fast-time"}, timeName);
    utcVar = findVar(ncid_, {"time"}, utcName);
  } else {
    latVar = findVar(ncid_, {"lat", "latitude"}, latName);
    lonVar = findVar(ncid_, {"lon", "longitude"}, lonName);
    timeVar = findVar(ncid_, {"fast_time", "fasttime", "fast-time"}, timeName);
    utcVar = findVar(ncid_, {"time"}, utcName);
  }

  if (latVar < 0 || lonVar < 0)
    throw FormatError("no latitude/longitude variables in " + path_.string());
  if (timeVar < 0)
    throw FormatError("no fast-time variable in " + path_.string());

  if (!readVector(ncid_, latVar, latName, lat_) ||
      !readVector(ncid_, lonVar, lonName, lon_))
    throw FormatError("latitude/longitude must be 1-D");

  const std::size_t geoCount = lat_.size();
  const std::vector<std::size_t> pulse = chirpToPulse(geoCount);
  if (!pulse.empty() && lon_.size() == geoCount) {
    std::vector<double> lat(traceCount_), lon(traceCount_);
    for (std::size_t i = 0; i < traceCount_; ++i) {
      lat[i] = lat_[pulse[i]];
      lon[i] = lon_[pulse[i]];
    }
    lat_.swap(lat);
    lon_.swap(lon);
  }
  if (lat_.size() != traceCount_ || lon_.size() != traceCount_)
    throw FormatError("geolocation length (" + std::to_string(lat_.size()) +
                      ", " + std::to_string(lon_.size()) +
                      ") does not match trace count " +
                      std::to_string(traceCount_));

  // Fill values come back as huge numbers
  for (std::size_t i = 0; i < traceCount_; ++i) {
    if (!(std::fabs(lat_[i]) <= 90.0) || !(std::fabs(lon_[i]) <= 360.0)) {
      lat_[i] = std::numeric_limits<double>::quiet_NaN();
      lon_[i] = std::numeric_limits<double>::quiet_NaN();
    }
  }
  alongTrack_ = Geodesy::alongTrackDistances(lat_, lon_);

  if (!readVector(ncid_, timeVar, timeName, fastTime_))
    throw FormatError(timeName + " must be 1-D");
  if (fastTime_.size() != sampleCount_)
    throw FormatError(timeName + " length " +
                      std::to_string(fastTime_.size()) +
                      " does not match sample count " +
                      std::to_string(sampleCount_));
  if (!isMonotonic(fastTime_))
    throw FormatError(timeName + " is not monotonic");

  if (utcVar >= 0) {
    bool ok = readVector(ncid_, utcVar, utcName, utc_);
    if (ok && !pulse.empty() && utc_.size() == geoCount) {
      std::vector<double> utc(traceCount_);
      for (std::size_t i = 0; i < traceCount_; ++i)
        utc[i] = utc_[pulse[i]];
      utc_.swap(utc);
    }
    if (!ok || utc_.size() != traceCount_) {
      LOG_W("RadargramStore", "Ignoring {}: does not match trace axis",
            utcName);
      utc_.clear();
    }
  }
}

std::vector<std::size_t>
RadargramStore::chirpToPulse(std::size_t pulseCount) const {
  if (profile_ != FormatProfile::BAS || campaign_ != "AGAP")
    return {};

  std::string name;
  std::vector<double> tracesPulse, priChirp, priPulse;
  const int tracesVar = findVar(ncid_, {"traces_pulse"}, name);
  const int chirpVar = findVar(ncid_, {"PriNumber_chirp"}, name);
  const int pulseVar = findVar(ncid_, {"PriNumber_pulse"}, name);
  if (tracesVar < 0 || chirpVar < 0 || pulseVar < 0)
    throw FormatError("AGAP file without traces_pulse/PriNumber variables");
  if (!readVector(ncid_, tracesVar, "traces_pulse", tracesPulse) ||
      !readVector(ncid_, chirpVar, "PriNumber_chirp", priChirp) ||
      !readVector(ncid_, pulseVar, "PriNumber_pulse", priPulse))
    throw FormatError("AGAP trace clocks must be 1-D");
  if (priChirp.size() != traceCount_ || priPulse.empty() ||
      tracesPulse.size() != priPulse.size())
    throw FormatError("AGAP trace clocks do not match the trace axes");
  for (std::size_t i = 1; i < priPulse.size(); ++i) {
    if (!(priPulse[i] > priPulse[i - 1]))
      throw FormatError("PriNumber_pulse is not increasing");
  }

  // Truncated, as the pulse trace numbers are indices into the pulse axes
  std::vector<std::size_t> out(traceCount_);
  for (std::size_t i = 0; i < traceCount_; ++i) {
    const double t = interpolate(priChirp[i], priPulse, tracesPulse);
    if (!(t >= 0.0) || t >= static_cast<double>(pulseCount))
      throw FormatError("AGAP chirp trace " + std::to_string(i) +
                        " maps outside the pulse axis");
    out[i] = static_cast<std::size_t>(t);
  }
  return out;
}

void RadargramStore::readRaw(const IndexRange &traces,
                             const IndexRange &samples,
                             std::size_t traceStride, std::size_t sampleStride,
                             std::vector<float> &out, std::size_t &nt,
                             std::size_t &ns) const {
  nt = strided(traces.size(), traceStride);
  ns = strided(samples.size(), sampleStride);
  out.resize(nt * ns);

  int status;
  if (!samplesMajor_) {
    const std::size_t start[2] = {traces.start, samples.start};
    const std::size_t count[2] = {nt, ns};
    const std::ptrdiff_t stride[2] = {
        static_cast<std::ptrdiff_t>(traceStride),
        static_cast<std::ptrdiff_t>(sampleStride)};
    status = nc_get_vars_float(ncid_, dataVar_, start, count, stride,
                               out.data());
  } else {
    std::vector<float> buf(nt * ns);
    const std::size_t firstRow =
        samplesReversed_
            ? sampleCount_ - 1 - (samples.start + (ns - 1) * sampleStride)
            : samples.start;
    const std::size_t start[2] = {firstRow, traces.start};
    const std::size_t count[2] = {ns, nt};
    const std::ptrdiff_t stride[2] = {
        static_cast<std::ptrdiff_t>(sampleStride),
        static_cast<std::ptrdiff_t>(traceStride)};
    status = nc_get_vars_float(ncid_, dataVar_, start, count, stride,
                               buf.data());
    for (std::size_t s = 0; s < ns; ++s) {
      const std::size_t row = samplesReversed_ ? ns - 1 - s : s;
      for (std::size_t t = 0; t < nt; ++t)
        out[t * ns + s] = buf[row * nt + t];
    }
  }
  // NC_ERANGE only flags values that did not fit in a float
  if (status != NC_NOERR && status != NC_ERANGE)
    throw std::runtime_error("read " + dataVarName_ + ": " +
                             nc_strerror(status));
}

float RadargramStore::transform(float v) const {
  switch (profile_) {
  case FormatProfile::UTIG:
    return v > 0.0f ? std::log(v) : kNaN;
  case FormatProfile::BAS:
    return v > 0.0f ? std::log10(v) : kNaN;
  case FormatProfile::AWI:
  case FormatProfile::Generic:
    break;
  }
  return v;
}

void RadargramStore::loadCache() {
  std::vector<float> values;
  std::size_t nt = 0, ns = 0;
  {
    std::lock_guard<std::mutex> lock(ncMutex_);
    readRaw({0, traceCount_}, {0, sampleCount_}, 1, 1, values, nt, ns);
  }
  for (float &v : values)
    v = transform(v);
  cache_ = std::move(values);
}

void RadargramStore::computeStats() {
  const std::size_t ts = std::max<std::size_t>(
      1, (traceCount_ + kOverviewSize - 1) / kOverviewSize);
  const std::size_t ss = std::max<std::size_t>(
      1, (sampleCount_ + kOverviewSize - 1) / kOverviewSize);
  RadarSlice overview = readWindow({0, traceCount_}, {0, sampleCount_}, ts, ss);

  float lo = std::numeric_limits<float>::max();
  float hi = std::numeric_limits<float>::lowest();
  for (float v : overview.values) {
    if (!std::isfinite(v))
      continue;
    lo = std::min(lo, v);
    hi = std::max(hi, v);
  }
  if (lo > hi) {
    stats_ = IntensityStats();
    return;
  }
  if (hi <= lo)
    hi = lo + 1.0f;
  stats_.min = lo;
  stats_.max = hi;
  stats_.valid = true;
}

RadarSlice RadargramStore::readWindow(const IndexRange &traces,
                                      const IndexRange &samples,
                                      std::size_t traceStride,
                                      std::size_t sampleStride) const {
  if (traces.empty() || samples.empty())
    throw std::invalid_argument("readWindow: empty range");
  if (traceStride == 0 || sampleStride == 0)
    throw std::invalid_argument("readWindow: stride must be positive");
  if (traces.end > traceCount_ || samples.end > sampleCount_)
    throw std::out_of_range("readWindow: range outside matrix");

  RadarSlice slice;
  slice.traces = traces;
  slice.samples = samples;
  slice.traceStride = traceStride;
  slice.sampleStride = sampleStride;

  if (!cache_.empty()) {
    slice.numTraces = strided(traces.size(), traceStride);
    slice.numSamples = strided(samples.size(), sampleStride);
    slice.values.resize(slice.numTraces * slice.numSamples);
    for (std::size_t t = 0; t < slice.numTraces; ++t) {
      const float *row =
          &cache_[(traces.start + t * traceStride) * sampleCount_];
      for (std::size_t s = 0; s < slice.numSamples; ++s)
        slice.values[t * slice.numSamples + s] =
            row[samples.start + s * sampleStride];
    }
    return slice;
  }

  {
    std::lock_guard<std::mutex> lock(ncMutex_);
    readRaw(traces, samples, traceStride, sampleStride, slice.values,
            slice.numTraces, slice.numSamples);
  }
  for (float &v : slice.values)
    v = transform(v);
  return slice;
}

float RadargramStore::value(std::size_t trace, std::size_t sample) const {
  return readWindow({trace, trace + 1}, {sample, sample + 1}).values[0];
}

TraceGeolocation RadargramStore::traceGeolocation(std::size_t trace) const {
  if (trace >= traceCount_)
    throw std::out_of_range("traceGeolocation: trace " +
                            std::to_string(trace) + " of " +
                            std::to_string(traceCount_));
  return {lat_[trace], lon_[trace], alongTrack_[trace]};
}

double RadargramStore::twttMicros(std::size_t sample) const {
  if (sample >= sampleCount_)
    throw std::out_of_range("twttMicros: sample " + std::to_string(sample) +
                            " of " + std::to_string(sampleCount_));
  return fastTime_[sample];
}

double RadargramStore::utcSeconds(std::size_t trace) const {
  if (trace >= traceCount_)
    throw std::out_of_range("utcSeconds: trace out of range");
  if (utc_.empty())
    return std::numeric_limits<double>::quiet_NaN();
  return utc_[trace];
}

GeoBounds RadargramStore::bounds(const IndexRange &traces) const {
  GeoBounds b;
  const std::size_t end = std::min(traces.end, traceCount_);
  for (std::size_t i = traces.start; i < end; ++i) {
    if (std::isfinite(lat_[i]) && std::isfinite(lon_[i]))
      b.extend({lat_[i], lon_[i]});
  }
  return b;
}
