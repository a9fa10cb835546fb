#ifndef HULLFORGE_LOD_POLICY_H_
#define HULLFORGE_LOD_POLICY_H_

#include <cstddef>
#include <string>
#include <vector>

namespace hullforge {

// Densification applied to the offset grid before meshing.
// A multiplier of 1 (or less) leaves that axis at table resolution.
struct LodConfig {
  double stationMultiplier = 2.0;
  double waterlineMultiplier = 2.0;
  // Gates the render-side simplification plan only.
  bool enableSmoothing = true;
};

// Preset levels exposed to callers: 1 optimized .. 4 very high.
extern const int kMinLodLevel;
extern const int kMaxLodLevel;

bool LodConfigForLevel(int level, LodConfig *out, std::string *error);

// Multipliers must be finite and within [1, kMaxLodLevel].
bool ValidateLodConfig(const LodConfig &lod, std::string *error);

bool LodRequiresInterpolation(const LodConfig &lod);

// Dense sample count along one axis: round((n - 1) * m) + 1, at least 2.
size_t DenseSampleCount(size_t originalCount, double multiplier);

struct RenderLodLevel {
  double distance = 0.0;
  double vertexRatio = 1.0;
  size_t targetVertexCount = 0;
};

// Distance-switched simplification levels a renderer should build for the
// hull body. Level 0 (full detail) is always present.
std::vector<RenderLodLevel> PlanRenderLodLevels(const LodConfig &lod, size_t vertexCount);

}  // namespace hullforge

#endif  // HULLFORGE_LOD_POLICY_H_
