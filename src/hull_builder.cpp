#include "hull_builder.h"

#include <cmath>

namespace hullforge {

const double kKeelDrop = 0.05;
const double kChineInset = 0.8;

namespace {

using manifold::vec3;

// Corner indices of one panel, one side. s0/s1 are the aft/fore stations,
// w0/w1 the lower/upper waterlines.
struct PanelSide {
  uint32_t s0w0 = 0;
  uint32_t s1w0 = 0;
  uint32_t s1w1 = 0;
  uint32_t s0w1 = 0;
};

bool lookup(const VertexIndexMap &map, uint32_t s, uint32_t w, VertexRole role, uint32_t *out) {
  const auto it = map.find(VertexKey{s, w, role});
  if (it == map.end()) return false;
  *out = it->second;
  return true;
}

bool panel_side(const VertexIndexMap &map, uint32_t s, uint32_t w, VertexRole role, PanelSide *out) {
  return lookup(map, s, w, role, &out->s0w0) &&
         lookup(map, s + 1, w, role, &out->s1w0) &&
         lookup(map, s + 1, w + 1, role, &out->s1w1) &&
         lookup(map, s, w + 1, role, &out->s0w1);
}

void push_tri(std::vector<uint32_t> *out, uint32_t a, uint32_t b, uint32_t c) {
  out->push_back(a);
  out->push_back(b);
  out->push_back(c);
}

// Starboard and port wind in opposite directions so both face outward.
void emit_standard_panel(std::vector<uint32_t> *out, const PanelSide &star, const PanelSide &port) {
  push_tri(out, star.s0w0, star.s1w0, star.s1w1);
  push_tri(out, star.s0w0, star.s1w1, star.s0w1);
  push_tri(out, port.s0w0, port.s0w1, port.s1w1);
  push_tri(out, port.s0w0, port.s1w1, port.s1w0);
}

// Bottom-row panel with an inset chine line between the hull bottom and the
// first waterline above it.
bool emit_chine_panel(std::vector<uint32_t> *out, const VertexIndexMap &map, uint32_t s,
                      uint32_t w, const PanelSide &star, const PanelSide &port) {
  uint32_t cs0 = 0, cs1 = 0, cp0 = 0, cp1 = 0;
  if (!lookup(map, s, w, VertexRole::ChineStarboard, &cs0) ||
      !lookup(map, s + 1, w, VertexRole::ChineStarboard, &cs1) ||
      !lookup(map, s, w, VertexRole::ChinePort, &cp0) ||
      !lookup(map, s + 1, w, VertexRole::ChinePort, &cp1)) {
    return false;
  }

  push_tri(out, star.s0w0, star.s1w0, cs1);
  push_tri(out, star.s0w0, cs1, cs0);
  push_tri(out, cs0, cs1, star.s1w1);
  push_tri(out, cs0, star.s1w1, star.s0w1);

  push_tri(out, port.s0w0, cp0, cp1);
  push_tri(out, port.s0w0, cp1, port.s1w0);
  push_tri(out, cp0, port.s0w1, port.s1w1);
  push_tri(out, cp0, port.s1w1, cp1);
  return true;
}

bool emit_keel_connection(std::vector<uint32_t> *out, const std::vector<int> &keel,
                          uint32_t s, const PanelSide &star, const PanelSide &port) {
  if (s + 1 >= keel.size()) return false;
  if (keel[s] < 0 || keel[s + 1] < 0) return false;
  const uint32_t k0 = (uint32_t)keel[s];
  const uint32_t k1 = (uint32_t)keel[s + 1];

  push_tri(out, star.s0w0, star.s1w0, k1);
  push_tri(out, star.s0w0, k1, k0);
  push_tri(out, port.s0w0, k0, k1);
  push_tri(out, port.s0w0, k1, port.s1w0);
  return true;
}

bool all_finite(double a, double b, double c, double d) {
  return std::isfinite(a) && std::isfinite(b) && std::isfinite(c) && std::isfinite(d);
}

void push_pair(std::vector<vec3> *out, const WaterlineSample &wl, double height,
               double position, double scale) {
  const double y = height * scale;
  const double z = position * scale;
  out->push_back(vec3(-wl.halfBreadthPort * scale, y, z));
  out->push_back(vec3(StarboardHalfBreadth(wl) * scale, y, z));
}

std::vector<vec3> station_cap_points(const OffsetTable &table, const Station *station) {
  std::vector<vec3> points;
  if (!station) return points;
  const double scale = UnitScale(table.metadata.units);
  for (const double height : SortedWaterlineHeights(table)) {
    const WaterlineSample *wl = FindSampleExact(*station, height);
    if (wl && IsFiniteSample(*station, *wl)) push_pair(&points, *wl, height, station->position, scale);
  }
  return points;
}

}  // namespace

HullVertexSet GenerateHullVertices(const OffsetTable &table) {
  HullVertexSet out;
  const double scale = UnitScale(table.metadata.units);
  const bool hasKeel = table.metadata.hasKeel;
  const bool hasChine = table.metadata.hasChine;

  const std::vector<const Station *> stations = SortedStations(table);
  const std::vector<double> heights = SortedWaterlineHeights(table);
  out.keelVertices.assign(stations.size(), -1);

  for (size_t s = 0; s < stations.size(); ++s) {
    const Station &station = *stations[s];
    const double z = station.position * scale;

    for (size_t w = 0; w < heights.size(); ++w) {
      const WaterlineSample *wl = FindSampleExact(station, heights[w]);
      if (!wl) continue;

      const double y = heights[w] * scale;
      const double xPort = wl->halfBreadthPort * scale;
      const double xStar = StarboardHalfBreadth(*wl) * scale;
      if (!all_finite(xPort, xStar, y, z)) continue;

      const uint32_t si = (uint32_t)s;
      const uint32_t wi = (uint32_t)w;

      if (hasKeel && w == 0) {
        out.keelVertices[s] = (int)out.vertices.size();
        out.vertices.push_back(vec3(0.0, y - kKeelDrop * scale, z));
      }

      out.indexMap[VertexKey{si, wi, VertexRole::Starboard}] = (uint32_t)out.vertices.size();
      out.vertices.push_back(vec3(xStar, y, z));
      out.indexMap[VertexKey{si, wi, VertexRole::Port}] = (uint32_t)out.vertices.size();
      out.vertices.push_back(vec3(-xPort, y, z));

      if (hasChine && w == 0) {
        out.indexMap[VertexKey{si, wi, VertexRole::ChineStarboard}] = (uint32_t)out.vertices.size();
        out.vertices.push_back(vec3(xStar * kChineInset, y, z));
        out.indexMap[VertexKey{si, wi, VertexRole::ChinePort}] = (uint32_t)out.vertices.size();
        out.vertices.push_back(vec3(-xPort * kChineInset, y, z));
      }
    }
  }
  return out;
}

std::vector<uint32_t> GenerateHullFaces(const OffsetTable &table, const HullVertexSet &verts) {
  std::vector<uint32_t> indices;
  const size_t stationCount = table.stations.size();
  const size_t waterlineCount = SortedWaterlineHeights(table).size();
  if (stationCount < 2 || waterlineCount < 2) return indices;

  const bool hasKeel = table.metadata.hasKeel;
  const bool hasChine = table.metadata.hasChine;

  for (uint32_t s = 0; s + 1 < stationCount; ++s) {
    for (uint32_t w = 0; w + 1 < waterlineCount; ++w) {
      PanelSide star;
      PanelSide port;
      if (!panel_side(verts.indexMap, s, w, VertexRole::Starboard, &star) ||
          !panel_side(verts.indexMap, s, w, VertexRole::Port, &port)) {
        continue;
      }

      if (hasChine && w == 0) {
        emit_chine_panel(&indices, verts.indexMap, s, w, star, port);
      } else {
        emit_standard_panel(&indices, star, port);
      }

      if (hasKeel && w == 0) {
        emit_keel_connection(&indices, verts.keelVertices, s, star, port);
      }
    }
  }
  return indices;
}

std::vector<vec3> BowPoints(const OffsetTable &table) {
  const std::vector<const Station *> stations = SortedStations(table);
  return station_cap_points(table, stations.empty() ? nullptr : stations.front());
}

std::vector<vec3> TransomPoints(const OffsetTable &table) {
  const std::vector<const Station *> stations = SortedStations(table);
  return station_cap_points(table, stations.empty() ? nullptr : stations.back());
}

std::vector<vec3> DeckPoints(const OffsetTable &table) {
  std::vector<vec3> points;
  const std::vector<double> heights = SortedWaterlineHeights(table);
  if (heights.empty()) return points;

  const double scale = UnitScale(table.metadata.units);
  const double top = heights.back();
  for (const Station *station : SortedStations(table)) {
    const WaterlineSample *wl = FindSampleExact(*station, top);
    if (wl && IsFiniteSample(*station, *wl)) push_pair(&points, *wl, top, station->position, scale);
  }
  return points;
}

std::vector<uint32_t> PairStripIndices(const std::vector<vec3> &points) {
  std::vector<uint32_t> indices;
  if (points.size() < 4) return indices;

  const uint32_t pairs = (uint32_t)(points.size() / 2);
  for (uint32_t i = 0; i + 1 < pairs; ++i) {
    const uint32_t port0 = i * 2;
    const uint32_t star0 = i * 2 + 1;
    const uint32_t port1 = (i + 1) * 2;
    const uint32_t star1 = (i + 1) * 2 + 1;
    push_tri(&indices, port0, star0, port1);
    push_tri(&indices, star0, star1, port1);
  }
  return indices;
}

manifold::MeshGL MakeMesh(const std::vector<vec3> &points, const std::vector<uint32_t> &indices) {
  manifold::MeshGL mesh;
  mesh.numProp = 3;
  mesh.vertProperties.reserve(points.size() * 3);
  for (const vec3 &p : points) {
    mesh.vertProperties.push_back((float)p.x);
    mesh.vertProperties.push_back((float)p.y);
    mesh.vertProperties.push_back((float)p.z);
  }
  mesh.triVerts = indices;
  return mesh;
}

}  // namespace hullforge
