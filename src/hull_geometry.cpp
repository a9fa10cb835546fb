#include "hull_geometry.h"

#include <algorithm>
#include <cmath>

#include "hull_builder.h"
#include "interpolator.h"
#include "log.h"

namespace hullforge {

namespace {

using manifold::vec3;

std::vector<double> scaled(std::vector<double> values, double scale) {
  for (double &v : values) v *= scale;
  return values;
}

std::vector<double> scaled_station_positions(const OffsetTable &table, double scale) {
  std::vector<double> out;
  for (const Station *station : SortedStations(table)) out.push_back(station->position * scale);
  return out;
}

bool first_non_finite(const std::vector<vec3> &vertices, size_t *at) {
  for (size_t i = 0; i < vertices.size(); ++i) {
    const vec3 &v = vertices[i];
    if (!std::isfinite(v.x) || !std::isfinite(v.y) || !std::isfinite(v.z)) {
      *at = i;
      return true;
    }
  }
  return false;
}

HullGeometry fail(const std::string &reason, uint64_t run_id) {
  log_event("HULL_BUILD_FAILED", run_id, reason);
  return MakePlaceholderGeometry(reason);
}

}  // namespace

const char *SurfaceKindName(SurfaceKind kind) {
  switch (kind) {
    case SurfaceKind::Hull: return "hull";
    case SurfaceKind::Bow: return "bow";
    case SurfaceKind::Transom: return "transom";
    case SurfaceKind::Deck: return "deck";
    case SurfaceKind::Station: return "station";
    case SurfaceKind::Unknown:
    default: return "unknown";
  }
}

HullGeometry MakePlaceholderGeometry(const std::string &reason) {
  static const float kCorners[8][3] = {
      {-0.5f, -0.5f, -0.5f}, {0.5f, -0.5f, -0.5f}, {0.5f, 0.5f, -0.5f}, {-0.5f, 0.5f, -0.5f},
      {-0.5f, -0.5f, 0.5f},  {0.5f, -0.5f, 0.5f},  {0.5f, 0.5f, 0.5f},  {-0.5f, 0.5f, 0.5f},
  };
  static const uint32_t kTris[12][3] = {
      {0, 2, 1}, {0, 3, 2}, {4, 5, 6}, {4, 6, 7}, {0, 1, 5}, {0, 5, 4},
      {3, 6, 2}, {3, 7, 6}, {0, 4, 7}, {0, 7, 3}, {1, 2, 6}, {1, 6, 5},
  };

  HullGeometry out;
  out.valid = false;
  out.error = reason;
  out.body.numProp = 3;
  for (const auto &c : kCorners) out.body.vertProperties.insert(out.body.vertProperties.end(), c, c + 3);
  for (const auto &t : kTris) out.body.triVerts.insert(out.body.triVerts.end(), t, t + 3);
  out.colors.assign(8, ColorMap().deck);
  out.coloredBody = MeshWithVertexColors(out.body, out.colors);
  return out;
}

bool MeshBounds(const manifold::MeshGL &mesh, vec3 *bmin, vec3 *bmax) {
  if (!bmin || !bmax || mesh.numProp < 3 || mesh.NumVert() == 0) return false;
  const size_t n = mesh.NumVert();
  vec3 mn(mesh.vertProperties[0], mesh.vertProperties[1], mesh.vertProperties[2]);
  vec3 mx = mn;
  for (size_t i = 1; i < n; ++i) {
    const size_t base = i * mesh.numProp;
    const vec3 p(mesh.vertProperties[base + 0], mesh.vertProperties[base + 1], mesh.vertProperties[base + 2]);
    mn = manifold::la::min(mn, p);
    mx = manifold::la::max(mx, p);
  }
  *bmin = mn;
  *bmax = mx;
  return true;
}

HullGeometry GenerateHullGeometry(const OffsetTable &table, const LodConfig &lod,
                                  uint64_t run_id, const ColorOverrides &colors) {
  log_event("HULL_BUILD_STARTED", run_id,
            "stations=" + std::to_string(table.stations.size()) +
            " station_multiplier=" + std::to_string(lod.stationMultiplier) +
            " waterline_multiplier=" + std::to_string(lod.waterlineMultiplier));

  std::string lodError;
  if (!ValidateLodConfig(lod, &lodError)) return fail(lodError, run_id);

  std::string warning;
  const OffsetTable dense = InterpolateOffsetTable(table, lod, &warning, run_id);

  const HullVertexSet verts = GenerateHullVertices(dense);
  const std::vector<uint32_t> faces = GenerateHullFaces(dense, verts);
  if (verts.vertices.empty()) return fail("no hull vertices were generated", run_id);
  if (faces.empty()) return fail("no hull faces were generated", run_id);

  size_t badVertex = 0;
  if (first_non_finite(verts.vertices, &badVertex)) {
    return fail("non-finite coordinate at vertex " + std::to_string(badVertex), run_id);
  }

  const double scale = UnitScale(table.metadata.units);

  HullGeometry out;
  out.valid = true;
  out.body = MakeMesh(verts.vertices, faces);
  out.keelVertices = verts.keelVertices;
  out.stationPositions = scaled_station_positions(dense, scale);
  out.waterlineHeights = scaled(SortedWaterlineHeights(dense), scale);

  out.groups = ClassifyFaceGroups(out.body, out.stationPositions, out.waterlineHeights);
  out.colors = ColorizeVertices(verts.vertices.size(), faces, out.groups, ResolveColorMap(colors));
  out.coloredBody = MeshWithVertexColors(out.body, out.colors);

  out.stats.vertexCount = verts.vertices.size();
  out.stats.faceCount = faces.size() / 3;
  out.stats.stationCount = out.stationPositions.size();
  out.stats.waterlineCount = out.waterlineHeights.size();

  const std::vector<vec3> bowPoints = BowPoints(table);
  const std::vector<vec3> transomPoints = TransomPoints(table);
  const std::vector<vec3> deckPoints = DeckPoints(table);
  out.bow = MakeMesh(bowPoints, PairStripIndices(bowPoints));
  out.transom = MakeMesh(transomPoints, PairStripIndices(transomPoints));
  out.deck = MakeMesh(deckPoints, PairStripIndices(deckPoints));
  out.stationSections = StationSections(table);
  out.waterlineCurves = WaterlineCurves(table);
  out.stationCurves = StationCurves(table);

  out.renderLevels = PlanRenderLodLevels(lod, out.stats.vertexCount);

  log_event("HULL_BUILD_DONE", run_id,
            "vertices=" + std::to_string(out.stats.vertexCount) +
            " faces=" + std::to_string(out.stats.faceCount) +
            " stations=" + std::to_string(out.stats.stationCount) +
            " waterlines=" + std::to_string(out.stats.waterlineCount) +
            " deck_faces=" + std::to_string(out.groups.deck.size()) +
            " render_levels=" + std::to_string(out.renderLevels.size()));
  return out;
}

}  // namespace hullforge
