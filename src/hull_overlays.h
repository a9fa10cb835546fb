#ifndef HULLFORGE_HULL_OVERLAYS_H_
#define HULLFORGE_HULL_OVERLAYS_H_

#include <cstdint>
#include <vector>

#include "manifold/manifold.h"
#include "offset_table.h"

namespace hullforge {

// Polyline drawn over the hull at a waterline height or a station position
// (both in table units).
struct OverlayCurve {
  double key = 0.0;
  std::vector<manifold::vec3> points;
};

// Closed loop per waterline: starboard bow to stern, port stern to bow, then
// the first point again.
std::vector<OverlayCurve> WaterlineCurves(const OffsetTable &table);

// Port/starboard point pairs per station, bottom to top.
std::vector<OverlayCurve> StationCurves(const OffsetTable &table);

struct StationSection {
  double position = 0.0;
  manifold::MeshGL mesh;
};

// Filled cross-section per station with at least three distinct points.
std::vector<StationSection> StationSections(const OffsetTable &table);

// Orders points of one station plane by angle around their centroid.
std::vector<manifold::vec3> SortAroundCentroid(const std::vector<manifold::vec3> &points);

// Ear clipping in the x/y plane, falling back to a fan when no ear remains.
std::vector<uint32_t> TriangulateSection(const std::vector<manifold::vec3> &points);

}  // namespace hullforge

#endif  // HULLFORGE_HULL_OVERLAYS_H_
