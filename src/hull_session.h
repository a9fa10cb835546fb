#ifndef HULLFORGE_HULL_SESSION_H_
#define HULLFORGE_HULL_SESSION_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "hull_geometry.h"
#include "lod_policy.h"
#include "offset_table.h"
#include "paint_selection.h"

namespace hullforge_session {

struct HullSessionState {
    hullforge::OffsetTable table;
    hullforge::LodConfig lod;
    int lod_level = hullforge::kMinLodLevel;
    // Replaced wholesale by each build; never mutated after publication.
    std::shared_ptr<const hullforge::HullGeometry> geometry;
    uint64_t generation = 0;
    // Shared placement of every surface: body bounds centred on the origin.
    manifold::mat3x4 placement = hullforge_picking::IdentityTransform();
    manifold::vec3 bounds_min = {0.0, 0.0, 0.0};
    manifold::vec3 bounds_max = {0.0, 0.0, 0.0};
    // First paint-surface id of the current generation.
    uint32_t surface_id_base = 0;
    uint32_t next_surface_id = 1;
    std::string error_text;
};

bool HullSessionLoadTable(HullSessionState *state,
                          const hullforge::OffsetTable &table,
                          const hullforge::LodConfig &lod,
                          std::string *err);

// Builds a fresh geometry for the current table and LOD, then swaps it in.
// Returns false (with the placeholder installed) when the build fails.
bool HullSessionRegenerate(HullSessionState *state, std::string *err);

// Levels outside [kMinLodLevel, kMaxLodLevel] are rejected with no change.
bool HullSessionSetLodLevel(HullSessionState *state, int level, std::string *err);

// Body, caps and station sections of the current geometry, each with an id
// unique across generations.
std::vector<hullforge::PaintSurface> HullSessionPaintSurfaces(const HullSessionState &state);

}  // namespace hullforge_session

#endif  // HULLFORGE_HULL_SESSION_H_
