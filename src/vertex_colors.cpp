#include "vertex_colors.h"

namespace hullforge {

namespace {

void paint_faces(std::vector<Rgb> *out, const std::vector<uint32_t> &triVerts,
                 const std::vector<uint32_t> &faces, const Rgb &color) {
  const size_t triCount = triVerts.size() / 3;
  for (const uint32_t tri : faces) {
    if (tri >= triCount) continue;
    for (int k = 0; k < 3; ++k) {
      const uint32_t v = triVerts[(size_t)tri * 3 + k];
      if (v < out->size()) (*out)[v] = color;
    }
  }
}

}  // namespace

ColorMap ResolveColorMap(const ColorOverrides &overrides) {
  ColorMap colors;
  if (overrides.base) colors.base = *overrides.base;
  if (overrides.station) colors.station = *overrides.station;
  if (overrides.waterline) colors.waterline = *overrides.waterline;
  if (overrides.deck) colors.deck = *overrides.deck;
  return colors;
}

std::vector<Rgb> ColorizeVertices(size_t vertexCount,
                                  const std::vector<uint32_t> &triVerts,
                                  const FaceGroups &groups,
                                  const ColorMap &colors) {
  std::vector<Rgb> out(vertexCount, colors.base);
  for (const RegionGroup &g : groups.stations) paint_faces(&out, triVerts, g.faces, colors.station);
  for (const RegionGroup &g : groups.waterlines) paint_faces(&out, triVerts, g.faces, colors.waterline);
  paint_faces(&out, triVerts, groups.deck, colors.deck);
  return out;
}

manifold::MeshGL MeshWithVertexColors(const manifold::MeshGL &mesh, const std::vector<Rgb> &colors) {
  manifold::MeshGL out;
  out.numProp = 6;
  const size_t vertCount = mesh.numProp >= 3 ? mesh.NumVert() : 0;
  out.vertProperties.reserve(vertCount * 6);
  for (size_t i = 0; i < vertCount; ++i) {
    const size_t base = i * mesh.numProp;
    out.vertProperties.push_back(mesh.vertProperties[base + 0]);
    out.vertProperties.push_back(mesh.vertProperties[base + 1]);
    out.vertProperties.push_back(mesh.vertProperties[base + 2]);
    const Rgb c = i < colors.size() ? colors[i] : Rgb{};
    out.vertProperties.push_back(c.r);
    out.vertProperties.push_back(c.g);
    out.vertProperties.push_back(c.b);
  }
  out.triVerts = mesh.triVerts;
  return out;
}

}  // namespace hullforge
