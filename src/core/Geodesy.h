#pragma once

#include <cstddef>
#include <vector>

struct LatLon {
  double lat = 0.0;
  double lon = 0.0;
};

// Axis-aligned geographic extent. Longitudes are not wrapped; a box crossing
// the antimeridian is reported with minLon > maxLon.
struct GeoBounds {
  double minLat = 0.0;
  double minLon = 0.0;
  double maxLat = 0.0;
  double maxLon = 0.0;
  bool valid = false;

  void extend(const LatLon &p);
};

struct PolylineHit {
  double distanceM = 0.0;
  LatLon nearest;
  // Index of the vertex that starts the closest edge
  std::size_t vertexIndex = 0;
};

namespace Geodesy {

// Great-circle distance on the mean Earth sphere.
double haversineMeters(const LatLon &a, const LatLon &b);

// Wrap a longitude difference into [-180, 180).
double wrapLonDelta(double dlon);

// Nearest point on edge a-b to p. Projection happens in an equirectangular
// frame centred on p, which is accurate for edges short compared to the
// Earth radius (groundtrack vertices are metres to a few km apart).
LatLon nearestOnEdge(const LatLon &p, const LatLon &a, const LatLon &b);

// Closest approach of p to the polyline. The polyline must not be empty.
PolylineHit distanceToPolyline(const LatLon &p,
                               const std::vector<LatLon> &polyline);

// Cumulative along-track distance in metres, starting at 0 for the first
// point.
std::vector<double> alongTrackDistances(const std::vector<double> &lats,
                                        const std::vector<double> &lons);

} // namespace Geodesy
