#include "Geodesy.h"
#include "Constants.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
constexpr double kDegToRad = M_PI / 180.0;
} // namespace

void GeoBounds::extend(const LatLon &p) {
  if (!valid) {
    minLat = maxLat = p.lat;
    minLon = maxLon = p.lon;
    valid = true;
    return;
  }
  minLat = std::min(minLat, p.lat);
  maxLat = std::max(maxLat, p.lat);
  minLon = std::min(minLon, p.lon);
  maxLon = std::max(maxLon, p.lon);
}

namespace Geodesy {

double haversineMeters(const LatLon &a, const LatLon &b) {
  const double lat1 = a.lat * kDegToRad;
  const double lat2 = b.lat * kDegToRad;
  const double dLat = lat2 - lat1;
  const double dLon = wrapLonDelta(b.lon - a.lon) * kDegToRad;
  const double s1 = std::sin(dLat / 2.0);
  const double s2 = std::sin(dLon / 2.0);
  double h = s1 * s1 + std::cos(lat1) * std::cos(lat2) * s2 * s2;
  h = std::min(1.0, std::max(0.0, h));
  return 2.0 * QIceRadar::EARTH_RADIUS_M * std::asin(std::sqrt(h));
}

double wrapLonDelta(double dlon) {
  dlon = std::fmod(dlon + 180.0, 360.0);
  if (dlon < 0)
    dlon += 360.0;
  return dlon - 180.0;
}

LatLon nearestOnEdge(const LatLon &p, const LatLon &a, const LatLon &b) {
  // Local frame in degrees of latitude, longitudes scaled by cos(lat).
  const double k = std::cos(p.lat * kDegToRad);
  const double ax = wrapLonDelta(a.lon - p.lon) * k;
  const double ay = a.lat - p.lat;
  const double bx = wrapLonDelta(b.lon - p.lon) * k;
  const double by = b.lat - p.lat;

  const double dx = bx - ax;
  const double dy = by - ay;
  const double len2 = dx * dx + dy * dy;
  double t = 0.0;
  if (len2 > 0.0) {
    t = -(ax * dx + ay * dy) / len2;
    t = std::clamp(t, 0.0, 1.0);
  }

  LatLon out;
  out.lat = a.lat + t * (b.lat - a.lat);
  out.lon = a.lon + t * wrapLonDelta(b.lon - a.lon);
  if (out.lon >= 180.0)
    out.lon -= 360.0;
  else if (out.lon < -180.0)
    out.lon += 360.0;
  return out;
}

PolylineHit distanceToPolyline(const LatLon &p,
                               const std::vector<LatLon> &polyline) {
  if (polyline.empty())
    throw std::invalid_argument("distanceToPolyline: empty polyline");

  PolylineHit best;
  best.nearest = polyline.front();
  best.distanceM = haversineMeters(p, polyline.front());

  for (std::size_t i = 0; i + 1 < polyline.size(); ++i) {
    LatLon q = nearestOnEdge(p, polyline[i], polyline[i + 1]);
    double d = haversineMeters(p, q);
    if (d < best.distanceM) {
      best.distanceM = d;
      best.nearest = q;
      best.vertexIndex = i;
    }
  }
  return best;
}

std::vector<double> alongTrackDistances(const std::vector<double> &lats,
                                        const std::vector<double> &lons) {
  if (lats.size() != lons.size())
    throw std::invalid_argument("alongTrackDistances: length mismatch");

  std::vector<double> dists(lats.size(), 0.0);
  for (std::size_t i = 1; i < lats.size(); ++i) {
    // Fill values in navigation data contribute no distance
    if (!std::isfinite(lats[i]) || !std::isfinite(lons[i]) ||
        !std::isfinite(lats[i - 1]) || !std::isfinite(lons[i - 1])) {
      dists[i] = dists[i - 1];
      continue;
    }
    dists[i] = dists[i - 1] + haversineMeters({lats[i - 1], lons[i - 1]},
                                              {lats[i], lons[i]});
  }
  return dists;
}

} // namespace Geodesy
