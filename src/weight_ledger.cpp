#include "weight_ledger.h"

#include <cmath>

#include "log.h"

namespace hullforge {

const double kDefaultWeightPerFace = 10.0;

bool WeightLedger::AddCustomWeight(const PointLoad &load, std::string *error) {
  if (error) error->clear();
  if (!std::isfinite(load.magnitude) || load.magnitude < 0.0) {
    if (error) *error = "Custom weight magnitude must be a finite value >= 0.";
    return false;
  }
  if (!std::isfinite(load.position.x) || !std::isfinite(load.position.y) ||
      !std::isfinite(load.position.z)) {
    if (error) *error = "Custom weight position must be finite.";
    return false;
  }
  custom_.push_back(load);
  return true;
}

void WeightLedger::AppendPaintedWeights(const std::vector<PointLoad> &loads) {
  painted_.insert(painted_.end(), loads.begin(), loads.end());
}

double WeightLedger::PaintedWeight() const {
  double total = 0.0;
  for (const PointLoad &load : painted_) total += load.magnitude;
  return total;
}

double WeightLedger::TotalWeight() const {
  double total = base_weight_ + PaintedWeight();
  for (const PointLoad &load : custom_) total += load.magnitude;
  return total;
}

WeightDistribution WeightLedger::Distribution() const {
  WeightDistribution out;
  out.positions.reserve(painted_.size() + custom_.size());
  out.magnitudes.reserve(painted_.size() + custom_.size());
  for (const PointLoad &load : painted_) {
    out.positions.push_back(load.position);
    out.magnitudes.push_back(load.magnitude);
  }
  for (const PointLoad &load : custom_) {
    out.positions.push_back(load.position);
    out.magnitudes.push_back(load.magnitude);
  }
  return out;
}

WeightPainter::WeightPainter(PaintSelectionTool *tool, WeightLedger *ledger)
    : tool_(tool), ledger_(ledger), weight_per_face_(kDefaultWeightPerFace) {}

bool WeightPainter::SetWeightPerFace(double weight, std::string *error) {
  if (error) error->clear();
  if (!std::isfinite(weight) || weight < 0.0) {
    if (error) *error = "Weight per face must be a finite value >= 0.";
    return false;
  }
  weight_per_face_ = weight;
  return true;
}

void WeightPainter::SetBrushRadius(double radius) {
  if (tool_) tool_->SetBrushRadius(radius);
}

bool WeightPainter::ApplyWeightToSelection(uint64_t run_id) {
  if (!tool_ || !ledger_) return false;
  const std::vector<SelectedFace> faces = tool_->SelectedFaces();
  if (faces.empty()) return false;

  std::vector<PointLoad> loads;
  loads.reserve(faces.size());
  for (const SelectedFace &face : faces) {
    PointLoad load;
    load.position = face.worldCenter;
    load.magnitude = weight_per_face_;
    loads.push_back(load);
  }

  ledger_->AppendPaintedWeights(loads);
  markers_.insert(markers_.end(), loads.begin(), loads.end());
  tool_->ClearSelection();

  log_event("WEIGHTS_APPLIED", run_id,
            "faces=" + std::to_string(loads.size()) +
            " weight_per_face=" + std::to_string(weight_per_face_) +
            " applied_total=" + std::to_string(ledger_->PaintedWeight()));
  return true;
}

void WeightPainter::ClearAllWeights(uint64_t run_id) {
  if (ledger_) ledger_->ClearPaintedWeights();
  markers_.clear();
  if (tool_) tool_->ClearSelection();
  log_event("WEIGHTS_CLEARED", run_id);
}

double WeightPainter::AppliedWeight() const {
  return ledger_ ? ledger_->PaintedWeight() : 0.0;
}

size_t WeightPainter::SelectedFaceCount() const {
  return tool_ ? tool_->SelectedFaceCount() : 0;
}

double WeightPainter::SelectionWeight() const {
  return (double)SelectedFaceCount() * weight_per_face_;
}

SelectionSummary WeightPainter::Summary() const {
  return tool_ ? tool_->Summary(weight_per_face_) : SelectionSummary();
}

}  // namespace hullforge
