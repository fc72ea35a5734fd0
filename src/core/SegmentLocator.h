#pragma once

#include "Constants.h"
#include "GeometryIndex.h"

#include <set>
#include <string>
#include <vector>

struct Candidate {
  Segment segment;
  double distanceM = 0.0;
  LatLon nearest;
  std::size_t vertexIndex = 0;
};

// Finds the transects closest to a clicked map point.
class SegmentLocator {
public:
  explicit SegmentLocator(const GeometryIndex &index,
                          double cutoffKm = QIceRadar::DEFAULT_LOCATE_CUTOFF_KM);

  // Ranks the visible segments by distance from `click`. Hidden segments are
  // never returned even when closer. Ties are broken by segment id so
  // repeated calls give the same order. Segments further than the cutoff are
  // dropped; an empty result is not an error.
  std::vector<Candidate>
  locate(const LatLon &click, const std::set<std::string> &visibleIds,
         std::size_t maxCandidates = QIceRadar::DEFAULT_MAX_CANDIDATES) const;

  double cutoffKm() const { return cutoffKm_; }

private:
  const GeometryIndex &index_;
  double cutoffKm_;
};
