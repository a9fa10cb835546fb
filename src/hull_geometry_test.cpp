#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "example_tables.h"
#include "hull_builder.h"
#include "hull_geometry.h"
#include "hull_overlays.h"
#include "offset_table.h"

namespace {

bool require(bool cond, const char *msg) {
  if (cond) return true;
  std::cerr << "[hull_geometry_test] FAIL: " << msg << "\n";
  return false;
}

bool near(double a, double b, double eps = 1e-6) { return std::fabs(a - b) <= eps; }

// stations x heights grid, metres, breadth grows with height.
hullforge::OffsetTable grid_table(int stations, int waterlines, bool keel, bool chine) {
  hullforge::OffsetTable t;
  for (int s = 0; s < stations; ++s) {
    hullforge::Station st;
    st.position = (double)s;
    for (int w = 0; w < waterlines; ++w) {
      hullforge::WaterlineSample wl;
      wl.height = 0.5 * (double)w;
      wl.halfBreadthPort = 0.5 + 0.5 * (double)w;
      st.waterlines.push_back(wl);
    }
    t.stations.push_back(st);
  }
  t.metadata.units = hullforge::LengthUnit::Meter;
  t.metadata.symmetry = hullforge::HullSymmetry::Symmetric;
  t.metadata.hasKeel = keel;
  t.metadata.hasChine = chine;
  return t;
}

size_t count_role(const hullforge::HullVertexSet &verts, hullforge::VertexRole role) {
  size_t n = 0;
  for (const auto &entry : verts.indexMap) {
    if (entry.first.role == role) ++n;
  }
  return n;
}

bool mesh_is_finite(const manifold::MeshGL &mesh) {
  for (const float v : mesh.vertProperties) {
    if (!std::isfinite(v)) return false;
  }
  return true;
}

}  // namespace

int main() {
  bool ok = true;
  const hullforge::LodConfig base_lod{1.0, 1.0, true};

  {
    // 3 x 3 keeled hull: 16 panel triangles plus 8 keel triangles.
    const hullforge::OffsetTable t = grid_table(3, 3, true, false);
    const hullforge::HullVertexSet verts = hullforge::GenerateHullVertices(t);
    const std::vector<uint32_t> faces = hullforge::GenerateHullFaces(t, verts);
    ok = ok && require(faces.size() / 3 == 24, "keel scenario triangle count");
    ok = ok && require(verts.vertices.size() == 21, "keel scenario vertex count");
    ok = ok && require(count_role(verts, hullforge::VertexRole::ChineStarboard) == 0 &&
                       count_role(verts, hullforge::VertexRole::ChinePort) == 0,
                       "no chine vertices without chine");
    ok = ok && require(verts.keelVertices.size() == 3, "one keel slot per station");
    for (const int k : verts.keelVertices) {
      ok = ok && require(k >= 0, "keel vertex present");
      if (k < 0) continue;
      const manifold::vec3 &p = verts.vertices[(size_t)k];
      ok = ok && require(near(p.x, 0.0) && near(p.y, -hullforge::kKeelDrop),
                         "keel vertex sits on the centreline below the bottom");
    }

    const hullforge::HullGeometry g = hullforge::GenerateHullGeometry(t, base_lod);
    ok = ok && require(g.valid, "keel geometry valid");
    ok = ok && require(g.stats.faceCount == 24, "keel geometry face count");
    ok = ok && require(g.stats.vertexCount == 21, "keel geometry vertex count");
    ok = ok && require(g.body.numProp == 3 && g.body.NumTri() == 24, "body mesh layout");
    ok = ok && require(g.coloredBody.numProp == 6 && g.coloredBody.NumVert() == 21, "colored body layout");
  }

  {
    // Chine replaces each bottom panel's 4 triangles with 8.
    const hullforge::OffsetTable t = grid_table(3, 3, false, true);
    const hullforge::HullVertexSet verts = hullforge::GenerateHullVertices(t);
    const std::vector<uint32_t> faces = hullforge::GenerateHullFaces(t, verts);
    ok = ok && require(faces.size() / 3 == 2 * 8 + 2 * 4, "chine triangle count");
    ok = ok && require(count_role(verts, hullforge::VertexRole::ChineStarboard) == 3, "chine starboard per station");
    ok = ok && require(count_role(verts, hullforge::VertexRole::ChinePort) == 3, "chine port per station");
    const auto star = verts.indexMap.find(hullforge::VertexKey{1, 0, hullforge::VertexRole::Starboard});
    const auto chine = verts.indexMap.find(hullforge::VertexKey{1, 0, hullforge::VertexRole::ChineStarboard});
    ok = ok && require(star != verts.indexMap.end() && chine != verts.indexMap.end(), "chine lookup");
    if (ok) {
      ok = ok && require(near(verts.vertices[chine->second].x,
                              verts.vertices[star->second].x * hullforge::kChineInset),
                         "chine inset to 80% of half-breadth");
    }
  }

  {
    // Keel and chine together: 8 chine + 4 keel per bottom panel.
    const hullforge::OffsetTable t = grid_table(3, 3, true, true);
    const hullforge::HullVertexSet verts = hullforge::GenerateHullVertices(t);
    ok = ok && require(hullforge::GenerateHullFaces(t, verts).size() / 3 == 2 * 12 + 2 * 4,
                       "keel and chine triangle count");
  }

  {
    // Symmetric table mirrors exactly; explicit starboard is honoured.
    hullforge::OffsetTable t = grid_table(3, 3, false, false);
    const hullforge::HullVertexSet verts = hullforge::GenerateHullVertices(t);
    for (const auto &entry : verts.indexMap) {
      if (entry.first.role != hullforge::VertexRole::Starboard) continue;
      hullforge::VertexKey portKey = entry.first;
      portKey.role = hullforge::VertexRole::Port;
      const auto port = verts.indexMap.find(portKey);
      ok = ok && require(port != verts.indexMap.end(), "every starboard vertex has a port twin");
      if (port == verts.indexMap.end()) continue;
      const manifold::vec3 &a = verts.vertices[entry.second];
      const manifold::vec3 &b = verts.vertices[port->second];
      ok = ok && require(near(a.x, -b.x) && near(a.y, b.y) && near(a.z, b.z), "mirror about centreline");
    }

    t.stations[1].waterlines[2].halfBreadthStarboard = 3.0;
    const hullforge::HullVertexSet asym = hullforge::GenerateHullVertices(t);
    const auto s = asym.indexMap.find(hullforge::VertexKey{1, 2, hullforge::VertexRole::Starboard});
    const auto p = asym.indexMap.find(hullforge::VertexKey{1, 2, hullforge::VertexRole::Port});
    ok = ok && require(s != asym.indexMap.end() && p != asym.indexMap.end(), "asymmetric lookup");
    if (ok) {
      ok = ok && require(near(asym.vertices[s->second].x, 3.0), "explicit starboard used");
      ok = ok && require(near(asym.vertices[p->second].x, -1.5), "port unaffected by starboard");
    }
  }

  {
    // Dropping one interior sample removes only the four panels around it.
    hullforge::OffsetTable t = grid_table(4, 4, false, false);
    const hullforge::HullVertexSet full = hullforge::GenerateHullVertices(t);
    const size_t fullFaces = hullforge::GenerateHullFaces(t, full).size() / 3;
    ok = ok && require(fullFaces == 9 * 4, "4 x 4 grid face count");

    t.stations[1].waterlines.erase(t.stations[1].waterlines.begin() + 1);
    const hullforge::HullVertexSet sparse = hullforge::GenerateHullVertices(t);
    const size_t sparseFaces = hullforge::GenerateHullFaces(t, sparse).size() / 3;
    ok = ok && require(sparseFaces == 5 * 4, "missing sample skips its panels only");

    const hullforge::HullGeometry g = hullforge::GenerateHullGeometry(t, base_lod);
    ok = ok && require(g.valid && g.stats.faceCount == 20, "sparse table still builds");
  }

  {
    // Nothing finite to mesh: placeholder instead of geometry.
    hullforge::OffsetTable t = grid_table(3, 3, true, false);
    for (hullforge::Station &st : t.stations) {
      for (hullforge::WaterlineSample &wl : st.waterlines) {
        wl.halfBreadthPort = std::numeric_limits<double>::quiet_NaN();
      }
    }
    const hullforge::HullGeometry g = hullforge::GenerateHullGeometry(t, base_lod);
    ok = ok && require(!g.valid, "non-finite table is invalid");
    ok = ok && require(!g.error.empty(), "non-finite table reports why");
    ok = ok && require(g.body.NumTri() == 12 && g.body.NumVert() == 8, "placeholder is a box");

    const hullforge::HullGeometry empty = hullforge::GenerateHullGeometry(hullforge::OffsetTable(), base_lod);
    ok = ok && require(!empty.valid && empty.body.NumTri() == 12, "empty table yields placeholder");
  }

  {
    // One bad sample at the bow: skipped everywhere, the rest still builds.
    hullforge::OffsetTable t = grid_table(3, 3, false, false);
    t.stations[0].waterlines[1].halfBreadthPort = std::numeric_limits<double>::quiet_NaN();
    const hullforge::HullGeometry g = hullforge::GenerateHullGeometry(t, base_lod);
    ok = ok && require(g.valid, "partial table stays valid");
    ok = ok && require(mesh_is_finite(g.body), "body vertices finite");
    ok = ok && require(mesh_is_finite(g.bow) && mesh_is_finite(g.transom) && mesh_is_finite(g.deck),
                       "cap vertices finite");
    ok = ok && require(g.bow.NumVert() == 4 && g.bow.NumTri() == 2, "bad sample dropped from the bow");
    ok = ok && require(g.transom.NumTri() == 4, "transom untouched");
    for (const hullforge::StationSection &section : g.stationSections) {
      ok = ok && require(mesh_is_finite(section.mesh), "section vertices finite");
    }
    for (const hullforge::OverlayCurve &curve : g.waterlineCurves) {
      for (const manifold::vec3 &p : curve.points) {
        ok = ok && require(std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z),
                           "waterline curve points finite");
      }
    }
    for (const hullforge::OverlayCurve &curve : g.stationCurves) {
      for (const manifold::vec3 &p : curve.points) {
        ok = ok && require(std::isfinite(p.x), "station curve points finite");
      }
    }
  }

  {
    // Caps stay at base resolution when the body is densified.
    const hullforge::OffsetTable t = grid_table(3, 3, true, false);
    const hullforge::LodConfig dense{2.0, 2.0, true};
    const hullforge::HullGeometry g = hullforge::GenerateHullGeometry(t, dense);
    ok = ok && require(g.valid, "dense geometry valid");
    ok = ok && require(g.stats.stationCount == 5 && g.stats.waterlineCount == 5, "dense grid size");
    ok = ok && require(g.stats.faceCount == 4 * 4 * 4 + 4 * 4, "dense face count");
    ok = ok && require(g.bow.NumTri() == 4, "bow from base table");
    ok = ok && require(g.transom.NumTri() == 4, "transom from base table");
    ok = ok && require(g.deck.NumTri() == 4, "deck from base table");
    ok = ok && require(g.stationSections.size() == 3, "one section per base station");
    for (const hullforge::StationSection &section : g.stationSections) {
      ok = ok && require(section.mesh.NumTri() == 4, "six-point section gives 4 triangles");
    }
    ok = ok && require(g.waterlineCurves.size() == 3, "one waterline loop per base height");
    for (const hullforge::OverlayCurve &c : g.waterlineCurves) {
      ok = ok && require(c.points.size() == 7, "loop has both sides plus closing point");
      if (c.points.size() == 7) {
        ok = ok && require(near(c.points.front().x, c.points.back().x) &&
                           near(c.points.front().z, c.points.back().z), "loop is closed");
        ok = ok && require(c.points[0].x > 0.0 && c.points[3].x < 0.0, "starboard first, then port");
      }
    }
  }

  {
    // Strips need two pairs.
    std::vector<manifold::vec3> two = {manifold::vec3(-1.0, 0.0, 0.0), manifold::vec3(1.0, 0.0, 0.0)};
    ok = ok && require(hullforge::PairStripIndices(two).empty(), "single pair gives no strip");
    two.push_back(manifold::vec3(-1.0, 1.0, 0.0));
    two.push_back(manifold::vec3(1.0, 1.0, 0.0));
    ok = ok && require(hullforge::PairStripIndices(two).size() == 6, "two pairs give one quad");
  }

  {
    // Coordinates are scaled to metres.
    const hullforge::HullGeometry mm = hullforge::GenerateHullGeometry(hullforge::MillimeterExampleTable(), base_lod);
    manifold::vec3 bmin, bmax;
    ok = ok && require(mm.valid && hullforge::MeshBounds(mm.body, &bmin, &bmax), "mm bounds");
    ok = ok && require(near(bmax.z, 10.0, 1e-4) && near(bmin.z, 0.0, 1e-4), "mm length scaled to metres");
    ok = ok && require(near(bmax.x, 2.5, 1e-4), "mm breadth scaled to metres");

    const hullforge::HullGeometry ft = hullforge::GenerateHullGeometry(hullforge::FootExampleTable(), base_lod);
    ok = ok && require(ft.valid && hullforge::MeshBounds(ft.body, &bmin, &bmax), "ft bounds");
    ok = ok && require(near(bmax.z, 30.0 * 0.3048, 1e-4), "ft length scaled to metres");
  }

  {
    // Deck faces are the faces touching the top waterline.
    const hullforge::HullGeometry g = hullforge::GenerateHullGeometry(hullforge::MeterExampleTable(), base_lod);
    ok = ok && require(g.valid, "metre example valid");
    ok = ok && require(g.groups.stations.size() == g.stats.stationCount, "station group per station");
    ok = ok && require(g.groups.waterlines.size() == g.stats.waterlineCount, "waterline group per height");
    ok = ok && require(g.colors.size() == g.stats.vertexCount, "color per vertex");
  }

  if (!ok) return 1;
  std::cout << "[hull_geometry_test] PASS\n";
  return 0;
}
