#include "lod_policy.h"

#include <algorithm>
#include <cmath>

namespace hullforge {

const int kMinLodLevel = 1;
const int kMaxLodLevel = 4;

namespace {

constexpr double kSimplifyFromWaterlineMultiplier = 3.0;
constexpr size_t kMediumLevelMinVertices = 1000;
constexpr size_t kLowLevelMinVertices = 500;
constexpr double kMediumLevelDistance = 20.0;
constexpr double kLowLevelDistance = 50.0;
constexpr double kMediumLevelRatio = 0.6;
constexpr double kLowLevelRatio = 0.3;

RenderLodLevel make_level(double distance, double ratio, size_t vertexCount) {
  RenderLodLevel level;
  level.distance = distance;
  level.vertexRatio = ratio;
  level.targetVertexCount = (size_t)std::floor((double)vertexCount * ratio);
  return level;
}

}  // namespace

bool LodConfigForLevel(int level, LodConfig *out, std::string *error) {
  if (error) error->clear();
  if (!out) {
    if (error) *error = "LodConfigForLevel received null output.";
    return false;
  }
  if (level < kMinLodLevel || level > kMaxLodLevel) {
    if (error) {
      *error = "LOD level must be between " + std::to_string(kMinLodLevel) + " and " +
               std::to_string(kMaxLodLevel) + ", got " + std::to_string(level) + ".";
    }
    return false;
  }
  out->stationMultiplier = (double)level;
  out->waterlineMultiplier = (double)level;
  out->enableSmoothing = true;
  return true;
}

bool ValidateLodConfig(const LodConfig &lod, std::string *error) {
  if (error) error->clear();
  const double maxMultiplier = (double)kMaxLodLevel;
  const auto in_range = [maxMultiplier](double m) {
    return std::isfinite(m) && m >= 1.0 && m <= maxMultiplier;
  };
  if (!in_range(lod.stationMultiplier) || !in_range(lod.waterlineMultiplier)) {
    if (error) {
      *error = "LOD multipliers must be finite and between 1 and " + std::to_string(kMaxLodLevel) +
               ", got station=" + std::to_string(lod.stationMultiplier) +
               " waterline=" + std::to_string(lod.waterlineMultiplier) + ".";
    }
    return false;
  }
  return true;
}

bool LodRequiresInterpolation(const LodConfig &lod) {
  return lod.stationMultiplier > 1.0 || lod.waterlineMultiplier > 1.0;
}

size_t DenseSampleCount(size_t originalCount, double multiplier) {
  if (originalCount == 0 || !std::isfinite(multiplier)) return 2;
  const double span = (double)(originalCount - 1) * multiplier;
  const long long n = std::llround(span) + 1;
  return (size_t)std::max(2LL, n);
}

std::vector<RenderLodLevel> PlanRenderLodLevels(const LodConfig &lod, size_t vertexCount) {
  std::vector<RenderLodLevel> levels;
  levels.push_back(make_level(0.0, 1.0, vertexCount));
  if (!lod.enableSmoothing) return levels;
  if (lod.waterlineMultiplier < kSimplifyFromWaterlineMultiplier) return levels;

  if (vertexCount > kMediumLevelMinVertices) {
    levels.push_back(make_level(kMediumLevelDistance, kMediumLevelRatio, vertexCount));
  }
  if (vertexCount > kLowLevelMinVertices) {
    levels.push_back(make_level(kLowLevelDistance, kLowLevelRatio, vertexCount));
  }
  return levels;
}

}  // namespace hullforge
