#ifndef HULLFORGE_HULL_BUILDER_H_
#define HULLFORGE_HULL_BUILDER_H_

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "manifold/manifold.h"
#include "offset_table.h"

namespace hullforge {

// Keel spine sits this far below the lowest waterline, in table units.
extern const double kKeelDrop;
// Chine vertices are inset to this fraction of the local half-breadth.
extern const double kChineInset;

enum class VertexRole : uint8_t {
  Starboard = 0,
  Port = 1,
  ChineStarboard = 2,
  ChinePort = 3,
};

struct VertexKey {
  uint32_t station = 0;
  uint32_t waterline = 0;
  VertexRole role = VertexRole::Starboard;

  bool operator==(const VertexKey &o) const {
    return station == o.station && waterline == o.waterline && role == o.role;
  }
};

struct VertexKeyHash {
  size_t operator()(const VertexKey &k) const {
    return (size_t)(((uint64_t)k.station << 34) ^ ((uint64_t)k.waterline << 2) ^ (uint64_t)k.role);
  }
};

using VertexIndexMap = std::unordered_map<VertexKey, uint32_t, VertexKeyHash>;

struct HullVertexSet {
  std::vector<manifold::vec3> vertices;
  VertexIndexMap indexMap;
  // One entry per sorted station; -1 where the station has no keel vertex.
  std::vector<int> keelVertices;
};

// Emits body vertices in scaled (metre) coordinates: x = starboard-positive
// half-breadth, y = height, z = station position. Samples with non-finite
// values are skipped.
HullVertexSet GenerateHullVertices(const OffsetTable &table);

// Triangulates every station/waterline panel whose corners exist. Returns a
// flat triangle index list (three entries per face).
std::vector<uint32_t> GenerateHullFaces(const OffsetTable &table, const HullVertexSet &verts);

// Cap surfaces are strips of (port, starboard) point pairs.
std::vector<manifold::vec3> BowPoints(const OffsetTable &table);
std::vector<manifold::vec3> TransomPoints(const OffsetTable &table);
std::vector<manifold::vec3> DeckPoints(const OffsetTable &table);

// Two triangles between each consecutive pair; empty below two pairs.
std::vector<uint32_t> PairStripIndices(const std::vector<manifold::vec3> &points);

manifold::MeshGL MakeMesh(const std::vector<manifold::vec3> &points,
                          const std::vector<uint32_t> &indices);

}  // namespace hullforge

#endif  // HULLFORGE_HULL_BUILDER_H_
