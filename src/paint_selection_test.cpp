#include <cmath>
#include <iostream>
#include <vector>

#include "app_state.h"
#include "manifold/manifold.h"
#include "paint_selection.h"
#include "picking.h"

namespace {

using hullforge::PaintSelectionTool;
using hullforge::PaintSurface;
using hullforge::SurfaceKind;
using hullforge_picking::Ray;

bool require(bool cond, const char *msg) {
  if (cond) return true;
  std::cerr << "[paint_selection_test] FAIL: " << msg << "\n";
  return false;
}

// nx x ny cells of size `cell` in the z = 0 plane, two triangles per cell.
manifold::MeshGL make_floor(int nx, int ny, float cell) {
  manifold::MeshGL mesh;
  mesh.numProp = 3;
  for (int j = 0; j <= ny; ++j) {
    for (int i = 0; i <= nx; ++i) {
      mesh.vertProperties.push_back((float)i * cell);
      mesh.vertProperties.push_back((float)j * cell);
      mesh.vertProperties.push_back(0.0f);
    }
  }
  const uint32_t row = (uint32_t)nx + 1;
  for (int j = 0; j < ny; ++j) {
    for (int i = 0; i < nx; ++i) {
      const uint32_t v00 = (uint32_t)j * row + (uint32_t)i;
      const uint32_t v10 = v00 + 1;
      const uint32_t v01 = v00 + row;
      const uint32_t v11 = v01 + 1;
      mesh.triVerts.insert(mesh.triVerts.end(), {v00, v10, v11, v00, v11, v01});
    }
  }
  return mesh;
}

// Vertical quad in the plane x = `x`, spanning y and z in [-1, 1].
void add_wall(manifold::MeshGL *mesh, float x) {
  const uint32_t base = (uint32_t)(mesh->vertProperties.size() / 3);
  const float corners[4][3] = {{x, -1.0f, -1.0f}, {x, 1.0f, -1.0f}, {x, 1.0f, 1.0f}, {x, -1.0f, 1.0f}};
  for (const auto &c : corners) mesh->vertProperties.insert(mesh->vertProperties.end(), c, c + 3);
  mesh->triVerts.insert(mesh->triVerts.end(), {base, base + 1, base + 2, base, base + 2, base + 3});
}

PaintSurface surface(uint32_t id, SurfaceKind kind, const manifold::MeshGL *mesh,
                     const manifold::mat3x4 &transform) {
  PaintSurface s;
  s.id = id;
  s.kind = kind;
  s.mesh = mesh;
  s.transform = transform;
  s.visible = true;
  return s;
}

Ray down_at(double x, double y) {
  Ray ray;
  ray.origin = manifold::vec3(x, y, 5.0);
  ray.direction = manifold::vec3(0.0, 0.0, -1.0);
  return ray;
}

hullforge::ViewerState edit_mode() {
  hullforge::ViewerState vs;
  vs.addWeightActive = true;
  return vs;
}

size_t paint_taps(PaintSelectionTool *tool, const std::vector<PaintSurface> &surfaces,
                  const std::vector<Ray> &rays) {
  for (const Ray &ray : rays) {
    tool->StartPainting();
    tool->PaintAt(ray, surfaces);
    tool->StopPainting();
  }
  return tool->SelectedFaceCount();
}

size_t paint_stroke(PaintSelectionTool *tool, const std::vector<PaintSurface> &surfaces,
                    const std::vector<Ray> &rays) {
  tool->StartPainting();
  for (const Ray &ray : rays) tool->PaintAt(ray, surfaces);
  tool->StopPainting();
  return tool->SelectedFaceCount();
}

}  // namespace

int main() {
  bool ok = true;
  const manifold::MeshGL floor = make_floor(10, 10, 0.1f);

  {
    // Same local geometry under two transforms: same face count per dab.
    hullforge::StateStore store(edit_mode());
    PaintSelectionTool tool(&store);
    tool.SetBrushRadius(0.25);

    manifold::mat3x4 turned = hullforge_picking::IdentityTransform();
    turned[0] = manifold::vec3(0.0, 1.0, 0.0);
    turned[1] = manifold::vec3(-1.0, 0.0, 0.0);
    turned[3] = manifold::vec3(10.0, 0.0, 0.0);
    const std::vector<PaintSurface> surfaces = {
        surface(1, SurfaceKind::Hull, &floor, hullforge_picking::IdentityTransform()),
        surface(2, SurfaceKind::Hull, &floor, turned),
    };

    const size_t onA = paint_taps(&tool, surfaces, {down_at(0.43, 0.46)});
    const std::vector<hullforge::SelectedFace> facesA = tool.SelectedFaces();
    tool.ClearSelection();
    // Local (0.43, 0.46) maps to world (10 - 0.46, 0.43) under `turned`.
    const size_t onB = paint_taps(&tool, surfaces, {down_at(9.54, 0.43)});
    const std::vector<hullforge::SelectedFace> facesB = tool.SelectedFaces();

    ok = ok && require(onA > 0, "brush selects faces");
    ok = ok && require(onA == onB, "brush radius is measured in local space");
    bool allOnB = !facesB.empty();
    for (const hullforge::SelectedFace &f : facesB) allOnB = allOnB && f.surfaceId == 2;
    ok = ok && require(allOnB, "faces belong to the struck surface");
    if (!facesA.empty() && !facesB.empty()) {
      const manifold::vec3 w = facesB.front().worldCenter;
      const manifold::vec3 l = facesB.front().localCenter;
      ok = ok && require(std::fabs(w.x - (10.0 - l.y)) < 1e-5 && std::fabs(w.y - l.x) < 1e-5,
                         "world centre follows the surface transform");
    }
  }

  {
    // Painting the same path in remove mode empties the selection.
    hullforge::StateStore store(edit_mode());
    PaintSelectionTool tool(&store);
    tool.SetBrushRadius(0.15);
    const std::vector<PaintSurface> surfaces = {
        surface(1, SurfaceKind::Hull, &floor, hullforge_picking::IdentityTransform())};
    const std::vector<Ray> path = {down_at(0.23, 0.27), down_at(0.41, 0.33), down_at(0.72, 0.61)};

    ok = ok && require(paint_stroke(&tool, surfaces, path) > 0, "add stroke selects");
    tool.SetRemoveMode(true);
    ok = ok && require(paint_stroke(&tool, surfaces, path) == 0, "remove stroke clears the same faces");
  }

  {
    // Faces on different surfaces never collide, even with equal indices.
    hullforge::StateStore store(edit_mode());
    PaintSelectionTool tool(&store);
    tool.SetBrushRadius(0.2);
    const std::vector<PaintSurface> surfaces = {
        surface(1, SurfaceKind::Hull, &floor, hullforge_picking::IdentityTransform()),
        surface(2, SurfaceKind::Deck, &floor, hullforge_picking::TranslationTransform(manifold::vec3(0.0, 0.0, -1.0))),
    };
    const size_t first = paint_taps(&tool, surfaces, {down_at(0.53, 0.47)});
    tool.SelectFacesAroundPoint(manifold::vec3(0.53, 0.47, -1.0), surfaces[1]);
    ok = ok && require(tool.SelectedFaceCount() == 2 * first, "identity is (surface, triangle)");
    const hullforge::SelectionSummary summary = tool.Summary(10.0);
    ok = ok && require(summary.breakdown.hull == first && summary.breakdown.deck == first,
                       "breakdown by surface kind");
    ok = ok && require(std::fabs(summary.totalWeight - 10.0 * (double)(2 * first)) < 1e-9,
                       "summary weight uses weight per face");
  }

  {
    // Edit mode gates painting; leaving it clears everything.
    hullforge::StateStore store;
    PaintSelectionTool tool(&store);
    const std::vector<PaintSurface> surfaces = {
        surface(1, SurfaceKind::Hull, &floor, hullforge_picking::IdentityTransform())};

    ok = ok && require(!tool.StartPainting(), "start refused outside edit mode");
    ok = ok && require(!tool.PaintAt(down_at(0.53, 0.47), surfaces), "paint refused outside edit mode");
    ok = ok && require(tool.SelectedFaceCount() == 0, "nothing selected outside edit mode");

    store.SetAddWeightActive(true);
    ok = ok && require(tool.StartPainting(), "start accepted in edit mode");
    ok = ok && require(tool.PaintAt(down_at(0.53, 0.47), surfaces), "paint hits in edit mode");
    ok = ok && require(tool.SelectedFaceCount() > 0, "selection made in edit mode");
    ok = ok && require(tool.brush().visible, "brush shown on hit");

    store.SetAddWeightActive(false);
    ok = ok && require(tool.state() == hullforge::PaintState::Idle, "leaving edit mode stops painting");
    ok = ok && require(tool.SelectedFaceCount() == 0, "leaving edit mode clears selection");
    ok = ok && require(!tool.brush().visible, "leaving edit mode hides brush");
  }

  {
    // Gaps between samples are filled by recasting along the stroke; a wall
    // ahead of the stroke (or behind it) supplies the hit.
    manifold::MeshGL ahead = make_floor(20, 4, 0.1f);
    add_wall(&ahead, 2.0f);
    manifold::MeshGL behind = make_floor(20, 4, 0.1f);
    add_wall(&behind, -0.5f);
    const std::vector<Ray> path = {down_at(0.23, 0.17), down_at(1.23, 0.17)};

    for (const manifold::MeshGL *mesh : {&ahead, &behind}) {
      hullforge::StateStore store(edit_mode());
      const std::vector<PaintSurface> surfaces = {
          surface(1, SurfaceKind::Hull, mesh, hullforge_picking::IdentityTransform())};

      PaintSelectionTool taps(&store);
      taps.SetBrushRadius(0.1);
      const size_t tapCount = paint_taps(&taps, surfaces, path);

      PaintSelectionTool stroke(&store);
      stroke.SetBrushRadius(0.1);
      const size_t strokeCount = paint_stroke(&stroke, surfaces, path);

      ok = ok && require(tapCount > 0, "taps select faces");
      ok = ok && require(strokeCount > tapCount, "stroke fills the gap between samples");
      // Cell (7, 1) lies halfway along the stroke.
      ok = ok && require(stroke.IsSelected(hullforge::FaceKey{1, (1 * 20 + 7) * 2}), "mid-stroke face selected");
      ok = ok && require(!taps.IsSelected(hullforge::FaceKey{1, (1 * 20 + 7) * 2}), "taps skip mid-stroke face");
    }
  }

  {
    // A miss resets the stroke: no interpolation across it.
    manifold::MeshGL mesh = make_floor(20, 4, 0.1f);
    add_wall(&mesh, 2.0f);
    hullforge::StateStore store(edit_mode());
    const std::vector<PaintSurface> surfaces = {
        surface(1, SurfaceKind::Hull, &mesh, hullforge_picking::IdentityTransform())};

    PaintSelectionTool taps(&store);
    taps.SetBrushRadius(0.1);
    const size_t tapCount = paint_taps(&taps, surfaces, {down_at(0.23, 0.17), down_at(1.23, 0.17)});

    PaintSelectionTool tool(&store);
    tool.SetBrushRadius(0.1);
    Ray away = down_at(0.73, 0.17);
    away.direction = manifold::vec3(0.0, 0.0, 1.0);
    tool.StartPainting();
    tool.PaintAt(down_at(0.23, 0.17), surfaces);
    ok = ok && require(!tool.PaintAt(away, surfaces), "ray pointing away misses");
    ok = ok && require(!tool.brush().visible, "miss hides the brush");
    tool.PaintAt(down_at(1.23, 0.17), surfaces);
    tool.StopPainting();
    ok = ok && require(tool.SelectedFaceCount() == tapCount, "no interpolation across a miss");
  }

  {
    // Hidden surfaces are neither painted nor highlighted, but stay selected.
    hullforge::StateStore store(edit_mode());
    PaintSelectionTool tool(&store);
    tool.SetBrushRadius(0.2);
    std::vector<PaintSurface> surfaces = {
        surface(1, SurfaceKind::Hull, &floor, hullforge_picking::IdentityTransform()),
        surface(2, SurfaceKind::Station, &floor, hullforge_picking::TranslationTransform(manifold::vec3(5.0, 0.0, 0.0))),
    };

    tool.StartPainting();
    ok = ok && require(!tool.PaintAt(down_at(5.53, 0.47), surfaces), "station hidden by default");
    ok = ok && require(tool.PaintAt(down_at(0.53, 0.47), surfaces), "hull painted");
    tool.StopPainting();
    const size_t selected = tool.SelectedFaceCount();

    std::vector<hullforge::HighlightSegment> segs = tool.BuildHighlightSegments(surfaces);
    ok = ok && require(segs.size() == 3 * selected, "three edges per visible face");
    bool lifted = !segs.empty();
    for (const hullforge::HighlightSegment &s : segs) {
      lifted = lifted && std::fabs(std::fabs(s.a.z) - hullforge::kHighlightOffset) < 1e-6;
    }
    ok = ok && require(lifted, "highlight lifted along the normal");

    store.SetShowHull(false);
    segs = tool.BuildHighlightSegments(surfaces);
    ok = ok && require(segs.empty(), "hidden hull has no highlight");
    ok = ok && require(tool.SelectedFaceCount() == selected, "hiding keeps the selection");

    store.SetShowHull(true);
    surfaces[0].visible = false;
    ok = ok && require(tool.BuildHighlightSegments(surfaces).empty(), "undisplayed surface has no highlight");
  }

  {
    // Preview moves the brush without selecting.
    hullforge::StateStore store(edit_mode());
    PaintSelectionTool tool(&store);
    const std::vector<PaintSurface> surfaces = {
        surface(1, SurfaceKind::Hull, &floor, hullforge_picking::IdentityTransform())};
    ok = ok && require(tool.PreviewAt(down_at(0.33, 0.27), surfaces), "preview hit");
    ok = ok && require(tool.brush().visible && std::fabs(tool.brush().position.x - 0.33) < 1e-6,
                       "preview places brush");
    ok = ok && require(tool.SelectedFaceCount() == 0, "preview selects nothing");
    ok = ok && require(tool.brush().radius == hullforge::kDefaultBrushRadius, "default brush radius");
  }

  {
    // Perspective and orthographic pointer rays through the view centre.
    hullforge_picking::CameraModel cam;
    cam.viewport_width = 200;
    cam.viewport_height = 100;
    cam.eye = manifold::vec3(0.0, 0.0, 10.0);
    const Ray centre = hullforge_picking::PointerRay(100, 50, cam);
    ok = ok && require(std::fabs(centre.direction.z + 1.0) < 1e-9, "perspective centre looks forward");

    const Ray corner = hullforge_picking::PointerRay(0, 0, cam);
    ok = ok && require(corner.direction.x < 0.0 && corner.direction.y > 0.0, "top-left ray leans up-left");

    cam.mode = hullforge_picking::CameraMode::Orthographic;
    cam.ortho_half_height = 5.0;
    const Ray ortho = hullforge_picking::PointerRay(0, 0, cam);
    ok = ok && require(std::fabs(ortho.direction.z + 1.0) < 1e-9, "orthographic rays are parallel");
    ok = ok && require(std::fabs(ortho.origin.x + 10.0) < 1e-9 && std::fabs(ortho.origin.y - 5.0) < 1e-9,
                       "orthographic origin spans the view");
  }

  if (!ok) return 1;
  std::cout << "[paint_selection_test] PASS\n";
  return 0;
}
