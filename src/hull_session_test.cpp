#include <cmath>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "example_tables.h"
#include "hull_geometry.h"
#include "hull_session.h"
#include "picking.h"

namespace {

bool require(bool cond, const char *msg) {
    if (cond) return true;
    std::cerr << "[hull_session_test] FAIL: " << msg << "\n";
    return false;
}

}  // namespace

int main() {
    bool ok = true;

    hullforge_session::HullSessionState state;
    std::string err;
    hullforge::LodConfig base;
    base.stationMultiplier = 1.0;
    base.waterlineMultiplier = 1.0;

    ok = ok && require(hullforge_session::HullSessionLoadTable(&state, hullforge::MeterExampleTable(), base, &err),
                       "load example table");
    ok = ok && require(err.empty() && state.geometry && state.geometry->valid, "first build valid");
    ok = ok && require(state.generation == 1, "first generation");

    {
        // Body bounds are centred on the origin by the shared placement.
        const manifold::vec3 mid = (state.bounds_min + state.bounds_max) * 0.5;
        const manifold::vec3 placed = hullforge_picking::TransformPoint(state.placement, mid);
        ok = ok && require(std::fabs(placed.x) < 1e-9 && std::fabs(placed.y) < 1e-9 && std::fabs(placed.z) < 1e-9,
                           "placement centres the body");
    }

    std::vector<hullforge::PaintSurface> first = hullforge_session::HullSessionPaintSurfaces(state);
    ok = ok && require(!first.empty() && first[0].kind == hullforge::SurfaceKind::Hull, "body surface first");
    std::set<uint32_t> ids;
    for (const hullforge::PaintSurface &s : first) ids.insert(s.id);
    ok = ok && require(ids.size() == first.size(), "ids unique within a generation");

    const std::shared_ptr<const hullforge::HullGeometry> held = state.geometry;
    const size_t held_faces = held->body.NumTri();

    {
        // Out-of-range level changes nothing.
        ok = ok && require(!hullforge_session::HullSessionSetLodLevel(&state, 0, &err) && !err.empty(),
                           "level 0 rejected");
        ok = ok && require(!hullforge_session::HullSessionSetLodLevel(&state, 5, &err), "level 5 rejected");
        ok = ok && require(state.generation == 1 && state.geometry == held, "rejected level keeps geometry");
    }

    ok = ok && require(hullforge_session::HullSessionSetLodLevel(&state, 3, &err), "level 3 accepted");
    ok = ok && require(state.generation == 2 && state.lod_level == 3, "generation advances");
    ok = ok && require(state.geometry != held, "new geometry published");
    ok = ok && require(state.geometry->body.NumTri() > held_faces, "denser body at higher level");
    ok = ok && require(held->valid && held->body.NumTri() == held_faces, "previous geometry stays intact");

    std::vector<hullforge::PaintSurface> second = hullforge_session::HullSessionPaintSurfaces(state);
    for (const hullforge::PaintSurface &s : second) {
        ok = ok && require(ids.count(s.id) == 0, "ids unique across generations");
    }

    {
        // A raw config outside the preset range is refused before anything changes.
        const std::shared_ptr<const hullforge::HullGeometry> before = state.geometry;
        const size_t stations_before = state.table.stations.size();
        hullforge::LodConfig huge = base;
        huge.stationMultiplier = 1e9;
        ok = ok && require(!hullforge_session::HullSessionLoadTable(&state, hullforge::MillimeterExampleTable(),
                                                                    huge, &err) && !err.empty(),
                           "oversized multiplier rejected");
        ok = ok && require(state.generation == 2 && state.geometry == before, "rejected config keeps geometry");
        ok = ok && require(state.table.stations.size() == stations_before &&
                           state.table.metadata.units == hullforge::LengthUnit::Meter,
                           "rejected config keeps table");
        ok = ok && require(state.lod.stationMultiplier == 3.0 && state.lod_level == 3, "rejected config keeps lod");

        hullforge::LodConfig nan_lod = base;
        nan_lod.waterlineMultiplier = std::nan("");
        ok = ok && require(!hullforge_session::HullSessionLoadTable(&state, hullforge::MeterExampleTable(),
                                                                    nan_lod, &err),
                           "NaN multiplier rejected");
        ok = ok && require(state.generation == 2, "NaN config leaves generation");
    }

    {
        // A table that cannot be meshed installs the placeholder.
        hullforge::OffsetTable empty;
        ok = ok && require(!hullforge_session::HullSessionLoadTable(&state, empty, base, &err) && !err.empty(),
                           "empty table fails");
        ok = ok && require(state.geometry && !state.geometry->valid, "placeholder installed");
        ok = ok && require(state.error_text == err, "error text recorded");
        ok = ok && require(hullforge_session::HullSessionPaintSurfaces(state).empty(), "placeholder is not paintable");
    }

    ok = ok && require(!hullforge_session::HullSessionRegenerate(nullptr, &err), "null state rejected");

    if (!ok) return 1;
    std::cout << "[hull_session_test] PASS\n";
    return 0;
}
