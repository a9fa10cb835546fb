#ifndef HULLFORGE_HULL_GEOMETRY_H_
#define HULLFORGE_HULL_GEOMETRY_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "hull_overlays.h"
#include "lod_policy.h"
#include "manifold/manifold.h"
#include "offset_table.h"
#include "region_groups.h"
#include "vertex_colors.h"

namespace hullforge {

// Classification tag carried by every paintable surface.
enum class SurfaceKind : uint8_t {
  Hull = 0,
  Bow = 1,
  Transom = 2,
  Deck = 3,
  Station = 4,
  Unknown = 5,
};

const char *SurfaceKindName(SurfaceKind kind);

struct HullStats {
  size_t vertexCount = 0;
  size_t faceCount = 0;
  size_t stationCount = 0;
  size_t waterlineCount = 0;
};

// One complete, immutable build of a table at one LOD. Rebuilt wholesale on
// every table or LOD change.
struct HullGeometry {
  bool valid = false;
  std::string error;

  manifold::MeshGL body;
  manifold::MeshGL coloredBody;
  std::vector<Rgb> colors;
  FaceGroups groups;
  HullStats stats;
  std::vector<int> keelVertices;

  // Dense grid after interpolation, unit-scaled.
  std::vector<double> stationPositions;
  std::vector<double> waterlineHeights;

  // Caps and overlays come from the base table, never the dense one.
  manifold::MeshGL bow;
  manifold::MeshGL transom;
  manifold::MeshGL deck;
  std::vector<StationSection> stationSections;
  std::vector<OverlayCurve> waterlineCurves;
  std::vector<OverlayCurve> stationCurves;

  std::vector<RenderLodLevel> renderLevels;
};

// Interpolates, meshes, classifies and colors `table`. On total failure
// (non-finite coordinates, no vertices or no faces) returns the placeholder
// geometry with `valid == false` and the reason in `error`.
HullGeometry GenerateHullGeometry(const OffsetTable &table, const LodConfig &lod,
                                  uint64_t run_id = 0,
                                  const ColorOverrides &colors = ColorOverrides());

// Unit box flagged invalid, shown in place of geometry that failed to build.
HullGeometry MakePlaceholderGeometry(const std::string &reason);

bool MeshBounds(const manifold::MeshGL &mesh, manifold::vec3 *bmin, manifold::vec3 *bmax);

}  // namespace hullforge

#endif  // HULLFORGE_HULL_GEOMETRY_H_
