#ifndef HULLFORGE_WEIGHT_LEDGER_H_
#define HULLFORGE_WEIGHT_LEDGER_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "manifold/manifold.h"
#include "paint_selection.h"

namespace hullforge {

extern const double kDefaultWeightPerFace;

struct PointLoad {
  manifold::vec3 position = {0.0, 0.0, 0.0};
  double magnitude = 0.0;
};

// Parallel sequences, painted loads first, then custom loads.
struct WeightDistribution {
  std::vector<manifold::vec3> positions;
  std::vector<double> magnitudes;
};

// Base hull weight plus two lists of point loads. Every accessor hands out
// copies; nothing returned aliases the ledger's storage.
class WeightLedger {
 public:
  WeightLedger() = default;
  explicit WeightLedger(double baseWeight) : base_weight_(baseWeight) {}

  double baseWeight() const { return base_weight_; }
  void SetBaseWeight(double weight) { base_weight_ = weight; }

  // Rejects non-finite positions and non-finite or negative magnitudes.
  // Identical loads are separate masses and all count.
  bool AddCustomWeight(const PointLoad &load, std::string *error = nullptr);
  std::vector<PointLoad> CustomWeights() const { return custom_; }
  void ClearCustomWeights() { custom_.clear(); }

  void SetPaintedWeights(const std::vector<PointLoad> &loads) { painted_ = loads; }
  void AppendPaintedWeights(const std::vector<PointLoad> &loads);
  std::vector<PointLoad> PaintedWeights() const { return painted_; }
  void ClearPaintedWeights() { painted_.clear(); }

  double PaintedWeight() const;
  double TotalWeight() const;
  WeightDistribution Distribution() const;

 private:
  double base_weight_ = 0.0;
  std::vector<PointLoad> custom_;
  std::vector<PointLoad> painted_;
};

// Commits brush selections into the ledger as one load per selected face.
class WeightPainter {
 public:
  WeightPainter(PaintSelectionTool *tool, WeightLedger *ledger);

  WeightPainter(const WeightPainter &) = delete;
  WeightPainter &operator=(const WeightPainter &) = delete;

  bool SetWeightPerFace(double weight, std::string *error = nullptr);
  double weightPerFace() const { return weight_per_face_; }
  void SetBrushRadius(double radius);

  // Appends one load per selected face at its world centroid, records the
  // markers and clears the selection. False when nothing is selected.
  bool ApplyWeightToSelection(uint64_t run_id = 0);

  // Drops painted loads, markers and the current selection. Custom loads stay.
  void ClearAllWeights(uint64_t run_id = 0);

  double AppliedWeight() const;
  size_t AppliedWeightCount() const { return markers_.size(); }
  std::vector<PointLoad> Markers() const { return markers_; }

  size_t SelectedFaceCount() const;
  double SelectionWeight() const;
  SelectionSummary Summary() const;

 private:
  PaintSelectionTool *tool_ = nullptr;
  WeightLedger *ledger_ = nullptr;
  double weight_per_face_ = 0.0;
  std::vector<PointLoad> markers_;
};

}  // namespace hullforge

#endif  // HULLFORGE_WEIGHT_LEDGER_H_
