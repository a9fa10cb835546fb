#include "paint_selection.h"

#include <cmath>
#include <string>

#include "log.h"

namespace hullforge {

const double kDefaultBrushRadius = 0.5;
const double kBrushStepFactor = 0.3;
const double kHighlightOffset = 0.02;

namespace {

using manifold::vec3;
using hullforge_picking::Ray;
namespace la = manifold::la;

vec3 mesh_pos(const manifold::MeshGL &mesh, uint32_t idx) {
  const size_t base = (size_t)idx * mesh.numProp;
  return vec3(mesh.vertProperties[base + 0], mesh.vertProperties[base + 1], mesh.vertProperties[base + 2]);
}

bool triangle_corners(const manifold::MeshGL &mesh, uint32_t tri, vec3 *v0, vec3 *v1, vec3 *v2) {
  if (mesh.numProp < 3 || (size_t)tri >= mesh.NumTri()) return false;
  const size_t vertCount = mesh.NumVert();
  const uint32_t i0 = mesh.triVerts[(size_t)tri * 3 + 0];
  const uint32_t i1 = mesh.triVerts[(size_t)tri * 3 + 1];
  const uint32_t i2 = mesh.triVerts[(size_t)tri * 3 + 2];
  if (i0 >= vertCount || i1 >= vertCount || i2 >= vertCount) return false;
  *v0 = mesh_pos(mesh, i0);
  *v1 = mesh_pos(mesh, i1);
  *v2 = mesh_pos(mesh, i2);
  return true;
}

const PaintSurface *find_surface(const std::vector<PaintSurface> &surfaces, uint32_t id) {
  for (const PaintSurface &s : surfaces) {
    if (s.id == id) return &s;
  }
  return nullptr;
}

}  // namespace

PaintSelectionTool::PaintSelectionTool(StateStore *store)
    : store_(store), brush_radius_(kDefaultBrushRadius) {
  brush_.radius = brush_radius_;
  if (store_) {
    subscription_ = store_->Subscribe(kFieldAddWeightActive,
                                      [this](const ViewerState &state, uint32_t changed) {
                                        on_state_changed(state, changed);
                                      });
  }
}

PaintSelectionTool::~PaintSelectionTool() {
  if (store_ && subscription_ >= 0) store_->Unsubscribe(subscription_);
}

void PaintSelectionTool::on_state_changed(const ViewerState &state, uint32_t changed) {
  if ((changed & kFieldAddWeightActive) == 0 || state.addWeightActive) return;
  state_ = PaintState::Idle;
  has_last_point_ = false;
  ClearSelection();
}

bool PaintSelectionTool::StartPainting() {
  if (!store_ || !store_->state().addWeightActive) return false;
  state_ = PaintState::Painting;
  has_last_point_ = false;
  log_debug_event(debug(), "PAINT_STROKE_STARTED", 0, remove_mode_ ? "mode=remove" : "mode=add");
  return true;
}

void PaintSelectionTool::StopPainting() {
  const bool was_painting = state_ == PaintState::Painting;
  state_ = PaintState::Idle;
  brush_.visible = false;
  has_last_point_ = false;
  if (was_painting) {
    log_debug_event(debug(), "PAINT_STROKE_STOPPED", 0, "selected=" + std::to_string(selection_.size()));
  }
}

void PaintSelectionTool::SetBrushRadius(double radius) {
  if (!std::isfinite(radius) || radius <= 0.0) return;
  brush_radius_ = radius;
  brush_.radius = radius;
}

bool PaintSelectionTool::IsCandidate(const PaintSurface &surface) const {
  if (!surface.mesh || !surface.visible) return false;
  if (!store_) return false;
  const ViewerState &vs = store_->state();
  switch (surface.kind) {
    case SurfaceKind::Hull:
    case SurfaceKind::Bow:
    case SurfaceKind::Transom:
      return vs.showHull;
    case SurfaceKind::Deck:
      return vs.showDeck;
    case SurfaceKind::Station:
      return vs.showStations;
    case SurfaceKind::Unknown:
    default:
      return true;
  }
}

bool PaintSelectionTool::cast(const Ray &ray, const std::vector<PaintSurface> &surfaces,
                              SurfaceHit *out) const {
  bool found = false;
  for (const PaintSurface &surface : surfaces) {
    if (!IsCandidate(surface)) continue;
    const Ray local = hullforge_picking::TransformRay(hullforge_picking::InverseTransform(surface.transform), ray);
    hullforge_picking::MeshHit hit;
    if (!hullforge_picking::RayMeshHit(*surface.mesh, local, &hit)) continue;

    const vec3 world = hullforge_picking::TransformPoint(surface.transform, hit.point);
    const double distance = la::distance(ray.origin, world);
    if (!found || distance < out->distance) {
      out->surface = &surface;
      out->point = world;
      out->distance = distance;
      found = true;
    }
  }
  return found;
}

bool PaintSelectionTool::PaintAt(const Ray &ray, const std::vector<PaintSurface> &surfaces) {
  if (state_ != PaintState::Painting) return false;
  if (!store_ || !store_->state().addWeightActive) return false;

  SurfaceHit hit;
  if (!cast(ray, surfaces, &hit)) {
    brush_.visible = false;
    has_last_point_ = false;
    return false;
  }

  brush_.visible = true;
  brush_.position = hit.point;

  if (has_last_point_) paint_between(last_point_, hit.point, surfaces);
  SelectFacesAroundPoint(hit.point, *hit.surface);

  last_point_ = hit.point;
  has_last_point_ = true;
  return true;
}

void PaintSelectionTool::paint_between(const vec3 &start, const vec3 &end,
                                       const std::vector<PaintSurface> &surfaces) {
  const double distance = la::distance(start, end);
  const int steps = (int)std::ceil(distance / (brush_radius_ * kBrushStepFactor));
  if (steps <= 1) return;

  const vec3 direction = la::normalize(end - start);
  const double step = distance / (double)steps;

  for (int i = 1; i < steps; ++i) {
    const vec3 point = start + direction * (step * (double)i);

    Ray probe;
    probe.origin = point;
    probe.direction = direction;
    SurfaceHit hit;
    if (!cast(probe, surfaces, &hit)) {
      probe.direction = -direction;
      if (!cast(probe, surfaces, &hit)) continue;
    }
    SelectFacesAroundPoint(point, *hit.surface);
  }
}

bool PaintSelectionTool::PreviewAt(const Ray &ray, const std::vector<PaintSurface> &surfaces) {
  SurfaceHit hit;
  if (!cast(ray, surfaces, &hit)) {
    brush_.visible = false;
    return false;
  }
  brush_.visible = true;
  brush_.position = hit.point;
  return true;
}

size_t PaintSelectionTool::SelectFacesAroundPoint(const vec3 &worldPoint, const PaintSurface &surface) {
  if (!surface.mesh) return 0;
  const manifold::MeshGL &mesh = *surface.mesh;
  const vec3 localPoint =
      hullforge_picking::TransformPoint(hullforge_picking::InverseTransform(surface.transform), worldPoint);

  size_t inside = 0;
  const uint32_t triCount = (uint32_t)mesh.NumTri();
  for (uint32_t tri = 0; tri < triCount; ++tri) {
    vec3 v0, v1, v2;
    if (!triangle_corners(mesh, tri, &v0, &v1, &v2)) continue;
    const vec3 center = (v0 + v1 + v2) / 3.0;
    if (la::distance(center, localPoint) > brush_radius_) continue;

    ++inside;
    const FaceKey key{surface.id, tri};
    if (remove_mode_) {
      selection_.erase(key);
      continue;
    }
    if (selection_.count(key)) continue;

    SelectedFace face;
    face.localCenter = center;
    face.worldCenter = hullforge_picking::TransformPoint(surface.transform, center);
    face.surfaceId = surface.id;
    face.triangle = tri;
    face.kind = surface.kind;
    selection_.emplace(key, face);
  }
  return inside;
}

void PaintSelectionTool::ClearSelection() {
  const size_t cleared = selection_.size();
  selection_.clear();
  brush_.visible = false;
  log_debug_event(debug(), "SELECTION_CLEARED", 0, "faces=" + std::to_string(cleared));
}

SelectionBreakdown PaintSelectionTool::Breakdown() const {
  SelectionBreakdown out;
  for (const auto &entry : selection_) {
    switch (entry.second.kind) {
      case SurfaceKind::Hull: ++out.hull; break;
      case SurfaceKind::Deck: ++out.deck; break;
      case SurfaceKind::Station: ++out.station; break;
      case SurfaceKind::Transom: ++out.transom; break;
      case SurfaceKind::Bow: ++out.bow; break;
      case SurfaceKind::Unknown:
      default: ++out.unknown; break;
    }
  }
  return out;
}

SelectionSummary PaintSelectionTool::Summary(double weightPerFace) const {
  SelectionSummary out;
  out.faceCount = selection_.size();
  out.breakdown = Breakdown();
  out.totalWeight = (double)out.faceCount * weightPerFace;
  return out;
}

std::vector<SelectedFace> PaintSelectionTool::SelectedFaces() const {
  std::vector<SelectedFace> out;
  out.reserve(selection_.size());
  for (const auto &entry : selection_) out.push_back(entry.second);
  return out;
}

std::vector<HighlightSegment> PaintSelectionTool::BuildHighlightSegments(
    const std::vector<PaintSurface> &surfaces) const {
  std::vector<HighlightSegment> out;
  for (const auto &entry : selection_) {
    const PaintSurface *surface = find_surface(surfaces, entry.first.surfaceId);
    if (!surface || !IsCandidate(*surface)) continue;

    vec3 v[3];
    if (!triangle_corners(*surface->mesh, entry.first.triangle, &v[0], &v[1], &v[2])) continue;
    for (vec3 &p : v) p = hullforge_picking::TransformPoint(surface->transform, p);

    const vec3 n = la::cross(v[1] - v[0], v[2] - v[0]);
    const double len = la::length(n);
    const vec3 offset = len > 1e-12 ? n * (kHighlightOffset / len) : vec3(0.0, 0.0, 0.0);
    for (vec3 &p : v) p += offset;

    out.push_back(HighlightSegment{v[0], v[1]});
    out.push_back(HighlightSegment{v[1], v[2]});
    out.push_back(HighlightSegment{v[2], v[0]});
  }
  return out;
}

}  // namespace hullforge
