#include "SegmentLocator.h"
#include "Logger.h"

#include <algorithm>
#include <stdexcept>

SegmentLocator::SegmentLocator(const GeometryIndex &index, double cutoffKm)
    : index_(index), cutoffKm_(cutoffKm) {
  if (!(cutoffKm_ > 0.0))
    throw std::invalid_argument("SegmentLocator: cutoff must be positive");
}

std::vector<Candidate>
SegmentLocator::locate(const LatLon &click,
                       const std::set<std::string> &visibleIds,
                       std::size_t maxCandidates) const {
  std::vector<Candidate> out;
  if (visibleIds.empty() || maxCandidates == 0)
    return out;

  const double cutoffM = cutoffKm_ * 1000.0;
  for (auto &seg : index_.segmentsWithin(visibleIds)) {
    if (seg.groundtrack.empty())
      continue;
    PolylineHit hit = Geodesy::distanceToPolyline(click, seg.groundtrack);
    if (hit.distanceM > cutoffM)
      continue;

    Candidate c;
    c.distanceM = hit.distanceM;
    c.nearest = hit.nearest;
    c.vertexIndex = hit.vertexIndex;
    c.segment = std::move(seg);
    out.push_back(std::move(c));
  }

  std::sort(out.begin(), out.end(), [](const Candidate &a, const Candidate &b) {
    if (a.distanceM != b.distanceM)
      return a.distanceM < b.distanceM;
    return a.segment.id < b.segment.id;
  });
  if (out.size() > maxCandidates)
    out.resize(maxCandidates);

  LOG_D("SegmentLocator", "({:.4f}, {:.4f}): {} candidate(s) from {} visible",
        click.lat, click.lon, out.size(), visibleIds.size());
  return out;
}
