#pragma once

#include <cstdint>
#include <vector>

#include "manifold/manifold.h"

namespace hullforge {

// Faces whose centroid lies this close to the top waterline (scaled units)
// also join the deck group.
extern const double kDeckTolerance;

struct RegionGroup {
    double key = 0.0;
    std::vector<uint32_t> faces;
};

struct FaceGroups {
    std::vector<RegionGroup> stations;
    std::vector<RegionGroup> waterlines;
    std::vector<uint32_t> deck;
    // Per triangle: index into stations / waterlines, -1 when unassigned.
    std::vector<int> faceStation;
    std::vector<int> faceWaterline;
};

// Nearest-centroid assignment of every triangle to one station (by z) and one
// waterline (by y). Positions and heights must already be unit-scaled. Equal
// distances keep the first candidate in the given order.
FaceGroups ClassifyFaceGroups(const manifold::MeshGL &mesh,
                              const std::vector<double> &stationPositions,
                              const std::vector<double> &waterlineHeights);

}  // namespace hullforge
