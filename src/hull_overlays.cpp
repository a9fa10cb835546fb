#include "hull_overlays.h"

#include <algorithm>
#include <cmath>

#include "hull_builder.h"

namespace hullforge {

namespace {

using manifold::vec3;

constexpr double kDuplicatePointEps = 1e-9;
constexpr double kAreaEps = 1e-12;

double cross2(const vec3 &o, const vec3 &a, const vec3 &b) {
  return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

bool point_in_triangle(const vec3 &p, const vec3 &a, const vec3 &b, const vec3 &c) {
  const double d0 = cross2(a, b, p);
  const double d1 = cross2(b, c, p);
  const double d2 = cross2(c, a, p);
  const bool neg = d0 < 0.0 || d1 < 0.0 || d2 < 0.0;
  const bool pos = d0 > 0.0 || d1 > 0.0 || d2 > 0.0;
  return !(neg && pos);
}

bool is_ear(const std::vector<vec3> &pts, const std::vector<uint32_t> &remaining,
            uint32_t a, uint32_t b, uint32_t c) {
  if (cross2(pts[a], pts[b], pts[c]) <= kAreaEps) return false;
  for (const uint32_t idx : remaining) {
    if (idx == a || idx == b || idx == c) continue;
    if (point_in_triangle(pts[idx], pts[a], pts[b], pts[c])) return false;
  }
  return true;
}

std::vector<vec3> drop_duplicates(const std::vector<vec3> &sorted) {
  std::vector<vec3> out;
  for (const vec3 &p : sorted) {
    bool dup = false;
    for (const vec3 &q : out) {
      if (manifold::la::distance(p, q) < kDuplicatePointEps) {
        dup = true;
        break;
      }
    }
    if (!dup) out.push_back(p);
  }
  return out;
}

}  // namespace

std::vector<OverlayCurve> WaterlineCurves(const OffsetTable &table) {
  const double scale = UnitScale(table.metadata.units);
  const std::vector<const Station *> stations = SortedStations(table);

  std::vector<OverlayCurve> curves;
  for (const double height : SortedWaterlineHeights(table)) {
    OverlayCurve curve;
    curve.key = height;
    const double y = height * scale;

    for (const Station *station : stations) {
      const WaterlineSample *wl = FindSampleExact(*station, height);
      if (!wl || !IsFiniteSample(*station, *wl)) continue;
      curve.points.push_back(vec3(StarboardHalfBreadth(*wl) * scale, y, station->position * scale));
    }
    for (auto it = stations.rbegin(); it != stations.rend(); ++it) {
      const WaterlineSample *wl = FindSampleExact(**it, height);
      if (!wl || !IsFiniteSample(**it, *wl)) continue;
      curve.points.push_back(vec3(-wl->halfBreadthPort * scale, y, (*it)->position * scale));
    }
    if (!curve.points.empty()) curve.points.push_back(curve.points.front());
    curves.push_back(std::move(curve));
  }
  return curves;
}

std::vector<OverlayCurve> StationCurves(const OffsetTable &table) {
  const double scale = UnitScale(table.metadata.units);
  const std::vector<double> heights = SortedWaterlineHeights(table);

  std::vector<OverlayCurve> curves;
  for (const Station *station : SortedStations(table)) {
    OverlayCurve curve;
    curve.key = station->position;
    const double z = station->position * scale;
    for (const double height : heights) {
      const WaterlineSample *wl = FindSampleExact(*station, height);
      if (!wl || !IsFiniteSample(*station, *wl)) continue;
      curve.points.push_back(vec3(-wl->halfBreadthPort * scale, height * scale, z));
      curve.points.push_back(vec3(StarboardHalfBreadth(*wl) * scale, height * scale, z));
    }
    curves.push_back(std::move(curve));
  }
  return curves;
}

std::vector<vec3> SortAroundCentroid(const std::vector<vec3> &points) {
  if (points.empty()) return {};
  vec3 centroid(0.0, 0.0, 0.0);
  for (const vec3 &p : points) centroid += p;
  centroid /= (double)points.size();

  std::vector<vec3> sorted = points;
  std::stable_sort(sorted.begin(), sorted.end(), [&centroid](const vec3 &a, const vec3 &b) {
    return std::atan2(a.y - centroid.y, a.x - centroid.x) <
           std::atan2(b.y - centroid.y, b.x - centroid.x);
  });
  return sorted;
}

std::vector<uint32_t> TriangulateSection(const std::vector<vec3> &points) {
  std::vector<uint32_t> indices;
  const uint32_t n = (uint32_t)points.size();
  if (n < 3) return indices;

  std::vector<uint32_t> remaining(n);
  for (uint32_t i = 0; i < n; ++i) remaining[i] = i;

  while (remaining.size() > 2) {
    bool earFound = false;
    const size_t count = remaining.size();
    for (size_t i = 0; i < count; ++i) {
      const uint32_t a = remaining[(i + count - 1) % count];
      const uint32_t b = remaining[i];
      const uint32_t c = remaining[(i + 1) % count];
      if (!is_ear(points, remaining, a, b, c)) continue;
      indices.push_back(a);
      indices.push_back(b);
      indices.push_back(c);
      remaining.erase(remaining.begin() + (std::ptrdiff_t)i);
      earFound = true;
      break;
    }
    if (!earFound) {
      for (size_t i = 1; i + 1 < remaining.size(); ++i) {
        indices.push_back(remaining[0]);
        indices.push_back(remaining[i]);
        indices.push_back(remaining[i + 1]);
      }
      break;
    }
  }
  return indices;
}

std::vector<StationSection> StationSections(const OffsetTable &table) {
  std::vector<StationSection> sections;
  for (const OverlayCurve &curve : StationCurves(table)) {
    const std::vector<vec3> ring = drop_duplicates(SortAroundCentroid(curve.points));
    if (ring.size() < 3) continue;
    StationSection section;
    section.position = curve.key;
    section.mesh = MakeMesh(ring, TriangulateSection(ring));
    if (section.mesh.triVerts.empty()) continue;
    sections.push_back(std::move(section));
  }
  return sections;
}

}  // namespace hullforge
