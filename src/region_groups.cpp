#include "region_groups.h"

#include <algorithm>
#include <cmath>

namespace hullforge {

const double kDeckTolerance = 0.01;

namespace {

manifold::vec3 mesh_pos(const manifold::MeshGL &mesh, uint32_t idx) {
    const size_t base = (size_t)idx * mesh.numProp;
    return manifold::vec3(mesh.vertProperties[base + 0],
                          mesh.vertProperties[base + 1],
                          mesh.vertProperties[base + 2]);
}

int nearest(const std::vector<double> &keys, double value) {
    int best = -1;
    double bestDist = 0.0;
    for (size_t i = 0; i < keys.size(); ++i) {
        const double d = std::fabs(keys[i] - value);
        if (best < 0 || d < bestDist) {
            best = (int)i;
            bestDist = d;
        }
    }
    return best;
}

}  // namespace

FaceGroups ClassifyFaceGroups(const manifold::MeshGL &mesh,
                              const std::vector<double> &stationPositions,
                              const std::vector<double> &waterlineHeights) {
    FaceGroups out;
    const uint32_t triCount = (uint32_t)mesh.NumTri();
    const size_t vertCount = mesh.NumVert();
    if (triCount == 0 || vertCount == 0 || mesh.numProp < 3) return out;
    if (stationPositions.empty() || waterlineHeights.empty()) return out;

    out.stations.resize(stationPositions.size());
    for (size_t i = 0; i < stationPositions.size(); ++i) out.stations[i].key = stationPositions[i];
    out.waterlines.resize(waterlineHeights.size());
    for (size_t i = 0; i < waterlineHeights.size(); ++i) out.waterlines[i].key = waterlineHeights[i];
    out.faceStation.assign(triCount, -1);
    out.faceWaterline.assign(triCount, -1);

    const double top = *std::max_element(waterlineHeights.begin(), waterlineHeights.end());

    for (uint32_t tri = 0; tri < triCount; ++tri) {
        const uint32_t i0 = mesh.triVerts[tri * 3 + 0];
        const uint32_t i1 = mesh.triVerts[tri * 3 + 1];
        const uint32_t i2 = mesh.triVerts[tri * 3 + 2];
        if (i0 >= vertCount || i1 >= vertCount || i2 >= vertCount) continue;

        const manifold::vec3 c = (mesh_pos(mesh, i0) + mesh_pos(mesh, i1) + mesh_pos(mesh, i2)) / 3.0;

        const int s = nearest(stationPositions, c.z);
        const int w = nearest(waterlineHeights, c.y);
        out.faceStation[tri] = s;
        out.faceWaterline[tri] = w;
        out.stations[(size_t)s].faces.push_back(tri);
        out.waterlines[(size_t)w].faces.push_back(tri);

        if (std::fabs(c.y - top) < kDeckTolerance) out.deck.push_back(tri);
    }
    return out;
}

}  // namespace hullforge
