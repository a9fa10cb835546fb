#ifndef HULLFORGE_PAINT_SELECTION_H_
#define HULLFORGE_PAINT_SELECTION_H_

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "app_state.h"
#include "hull_geometry.h"
#include "manifold/manifold.h"
#include "picking.h"

namespace hullforge {

extern const double kDefaultBrushRadius;
// Stroke interpolation step, as a fraction of the brush radius.
extern const double kBrushStepFactor;
// Highlight wireframe is lifted this far along the face normal.
extern const double kHighlightOffset;

// A mesh the brush can land on. `mesh` is borrowed and must outlive any call
// that receives the surface. `visible` is the display-side visibility of the
// object; the viewer toggles are checked separately.
struct PaintSurface {
  uint32_t id = 0;
  SurfaceKind kind = SurfaceKind::Unknown;
  const manifold::MeshGL *mesh = nullptr;
  manifold::mat3x4 transform = hullforge_picking::IdentityTransform();
  bool visible = true;
};

// Identity of one triangle across every live surface.
struct FaceKey {
  uint32_t surfaceId = 0;
  uint32_t triangle = 0;

  bool operator<(const FaceKey &o) const {
    return surfaceId != o.surfaceId ? surfaceId < o.surfaceId : triangle < o.triangle;
  }
  bool operator==(const FaceKey &o) const {
    return surfaceId == o.surfaceId && triangle == o.triangle;
  }
};

struct SelectedFace {
  manifold::vec3 worldCenter = {0.0, 0.0, 0.0};
  manifold::vec3 localCenter = {0.0, 0.0, 0.0};
  uint32_t surfaceId = 0;
  uint32_t triangle = 0;
  SurfaceKind kind = SurfaceKind::Unknown;
};

struct BrushPreview {
  bool visible = false;
  manifold::vec3 position = {0.0, 0.0, 0.0};
  double radius = 0.0;
};

struct SelectionBreakdown {
  size_t hull = 0;
  size_t deck = 0;
  size_t station = 0;
  size_t transom = 0;
  size_t bow = 0;
  size_t unknown = 0;
};

struct SelectionSummary {
  size_t faceCount = 0;
  SelectionBreakdown breakdown;
  double totalWeight = 0.0;
};

struct HighlightSegment {
  manifold::vec3 a = {0.0, 0.0, 0.0};
  manifold::vec3 b = {0.0, 0.0, 0.0};
};

enum class PaintState {
  Idle,
  Painting,
};

// Brush-driven face selection. Painting is only effectful while the store's
// weight-edit flag is on; turning the flag off ends the stroke and clears the
// selection.
class PaintSelectionTool {
 public:
  explicit PaintSelectionTool(StateStore *store);
  ~PaintSelectionTool();

  PaintSelectionTool(const PaintSelectionTool &) = delete;
  PaintSelectionTool &operator=(const PaintSelectionTool &) = delete;

  // False (and no state change) while weight-edit mode is off.
  bool StartPainting();
  void StopPainting();
  PaintState state() const { return state_; }

  void SetRemoveMode(bool removing) { remove_mode_ = removing; }
  bool removeMode() const { return remove_mode_; }

  void SetBrushRadius(double radius);
  double brushRadius() const { return brush_radius_; }

  // Casts `ray` (world space) at the candidate surfaces and paints around the
  // nearest hit, filling the gap from the previous hit of this stroke. A miss
  // hides the brush and ends the stroke segment. Returns true on a hit.
  bool PaintAt(const hullforge_picking::Ray &ray, const std::vector<PaintSurface> &surfaces);

  // Moves the brush preview without touching the selection.
  bool PreviewAt(const hullforge_picking::Ray &ray, const std::vector<PaintSurface> &surfaces);

  // Adds (or, in remove mode, erases) every face of `surface` whose local
  // centroid lies within the brush radius of `worldPoint`. Returns the number
  // of faces inside the brush.
  size_t SelectFacesAroundPoint(const manifold::vec3 &worldPoint, const PaintSurface &surface);

  // Surface passes the viewer toggle for its kind and is displayed.
  bool IsCandidate(const PaintSurface &surface) const;

  void ClearSelection();
  void HideBrush() { brush_.visible = false; }

  size_t SelectedFaceCount() const { return selection_.size(); }
  bool IsSelected(const FaceKey &key) const { return selection_.count(key) != 0; }
  SelectionBreakdown Breakdown() const;
  SelectionSummary Summary(double weightPerFace) const;
  std::vector<SelectedFace> SelectedFaces() const;
  const BrushPreview &brush() const { return brush_; }

  // Three world-space edges per selected face, for faces on visible surfaces
  // only. Hidden faces stay selected.
  std::vector<HighlightSegment> BuildHighlightSegments(const std::vector<PaintSurface> &surfaces) const;

 private:
  struct SurfaceHit {
    const PaintSurface *surface = nullptr;
    manifold::vec3 point = {0.0, 0.0, 0.0};
    double distance = 0.0;
  };

  bool cast(const hullforge_picking::Ray &ray, const std::vector<PaintSurface> &surfaces,
            SurfaceHit *out) const;
  void paint_between(const manifold::vec3 &start, const manifold::vec3 &end,
                     const std::vector<PaintSurface> &surfaces);
  void on_state_changed(const ViewerState &state, uint32_t changed);
  bool debug() const { return store_ && store_->state().debug; }

  StateStore *store_ = nullptr;
  int subscription_ = -1;
  PaintState state_ = PaintState::Idle;
  bool remove_mode_ = false;
  double brush_radius_ = 0.0;
  BrushPreview brush_;
  bool has_last_point_ = false;
  manifold::vec3 last_point_ = {0.0, 0.0, 0.0};
  std::map<FaceKey, SelectedFace> selection_;
};

}  // namespace hullforge

#endif  // HULLFORGE_PAINT_SELECTION_H_
