#pragma once

#include "Geodesy.h"

#include <cstdint>
#include <string>
#include <vector>

enum class Availability { AvailableRemote, Downloading, AvailableLocal, Unavailable };

// How the remote archive authenticates requests.
enum class CredentialClass {
  None,       // plain HTTP(S) fetch ("wget" in the index)
  BearerToken // NSIDC Earthdata token
};

struct RemoteResource {
  std::string url;
  CredentialClass credential = CredentialClass::None;
  // Expected size in bytes; 0 if the index does not know it.
  std::uint64_t sizeBytes = 0;
  // Optional "algorithm:hexdigest", e.g. "md5:9e107d9d372bb6826bd81d3542a419d6"
  std::string checksum;
};

struct Segment {
  std::string id; // unique granule name, e.g. "UTIG_ICECAP_JKB2h_F16T01a_001"
  std::string institution;
  std::string campaign;
  std::string segment; // transect name within the campaign
  std::string region;  // "ANTARCTIC" or "ARCTIC"

  std::string dataFormat;     // "utig_netcdf", "bas_netcdf", ...
  std::string downloadMethod; // "wget", "nsidc", or empty if not downloadable
  std::string relativePath;   // where the file lives under the root directory

  std::vector<LatLon> groundtrack;
  Availability availability = Availability::AvailableRemote;
  RemoteResource remote;
};

const char *availabilityName(Availability a);

// Parses the index's availability tags. Single-letter codes follow the index
// database: "u" unavailable, "a"/"s" available (supported) remotely.
Availability availabilityFromString(const std::string &s);

CredentialClass credentialForMethod(const std::string &downloadMethod);
