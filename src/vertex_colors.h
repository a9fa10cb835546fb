#ifndef HULLFORGE_VERTEX_COLORS_H_
#define HULLFORGE_VERTEX_COLORS_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "manifold/manifold.h"
#include "region_groups.h"

namespace hullforge {

struct Rgb {
  float r = 0.0f;
  float g = 0.0f;
  float b = 0.0f;

  bool operator==(const Rgb &o) const { return r == o.r && g == o.g && b == o.b; }
};

struct ColorMap {
  Rgb base = {0.7f, 0.7f, 0.7f};
  Rgb station = {0.2f, 0.4f, 0.8f};
  Rgb waterline = {0.4f, 0.8f, 0.8f};
  Rgb deck = {0.8f, 0.2f, 0.2f};
};

// Caller overrides; unset entries keep the ColorMap defaults.
struct ColorOverrides {
  std::optional<Rgb> base;
  std::optional<Rgb> station;
  std::optional<Rgb> waterline;
  std::optional<Rgb> deck;
};

ColorMap ResolveColorMap(const ColorOverrides &overrides);

// Base first, then station groups, then waterline groups, then deck.
// Later passes overwrite earlier ones on shared vertices.
std::vector<Rgb> ColorizeVertices(size_t vertexCount,
                                  const std::vector<uint32_t> &triVerts,
                                  const FaceGroups &groups,
                                  const ColorMap &colors);

// Interleaved xyz+rgb copy of a position-only mesh (numProp 6).
manifold::MeshGL MeshWithVertexColors(const manifold::MeshGL &mesh, const std::vector<Rgb> &colors);

}  // namespace hullforge

#endif  // HULLFORGE_VERTEX_COLORS_H_
