#include "hull_session.h"

#include <utility>

#include "log.h"

namespace hullforge_session {

namespace {

using hullforge::HullGeometry;
using hullforge::PaintSurface;
using hullforge::SurfaceKind;

// body, bow, transom, deck
constexpr uint32_t kFixedSurfaceCount = 4;

uint32_t surface_count(const HullGeometry &geometry) {
    return kFixedSurfaceCount + (uint32_t)geometry.stationSections.size();
}

void push_surface(std::vector<PaintSurface> *out, uint32_t id, SurfaceKind kind,
                  const manifold::MeshGL &mesh, const manifold::mat3x4 &placement) {
    if (mesh.NumTri() == 0) return;
    PaintSurface surface;
    surface.id = id;
    surface.kind = kind;
    surface.mesh = &mesh;
    surface.transform = placement;
    surface.visible = true;
    out->push_back(surface);
}

}  // namespace

bool HullSessionLoadTable(HullSessionState *state,
                          const hullforge::OffsetTable &table,
                          const hullforge::LodConfig &lod,
                          std::string *err) {
    if (err) err->clear();
    if (!state) {
        if (err) *err = "HullSessionLoadTable received null state.";
        return false;
    }
    std::string lod_err;
    if (!hullforge::ValidateLodConfig(lod, &lod_err)) {
        hullforge::log_event("LOD_REJECTED", state->generation, lod_err);
        if (err) *err = lod_err;
        return false;
    }
    state->table = table;
    state->lod = lod;
    return HullSessionRegenerate(state, err);
}

bool HullSessionRegenerate(HullSessionState *state, std::string *err) {
    if (err) err->clear();
    if (!state) {
        if (err) *err = "HullSessionRegenerate received null state.";
        return false;
    }

    const uint64_t generation = state->generation + 1;
    std::shared_ptr<const HullGeometry> next =
        std::make_shared<const HullGeometry>(hullforge::GenerateHullGeometry(state->table, state->lod, generation));

    manifold::vec3 bmin(0.0, 0.0, 0.0);
    manifold::vec3 bmax(0.0, 0.0, 0.0);
    hullforge::MeshBounds(next->body, &bmin, &bmax);

    state->generation = generation;
    state->surface_id_base = state->next_surface_id;
    state->next_surface_id += surface_count(*next);
    state->bounds_min = bmin;
    state->bounds_max = bmax;
    state->placement = hullforge_picking::TranslationTransform(-(bmin + bmax) * 0.5);
    state->geometry = std::move(next);

    if (!state->geometry->valid) {
        state->error_text = state->geometry->error;
        if (err) *err = state->error_text;
        return false;
    }
    state->error_text.clear();
    return true;
}

bool HullSessionSetLodLevel(HullSessionState *state, int level, std::string *err) {
    if (err) err->clear();
    if (!state) {
        if (err) *err = "HullSessionSetLodLevel received null state.";
        return false;
    }

    hullforge::LodConfig next;
    std::string lod_err;
    if (!hullforge::LodConfigForLevel(level, &next, &lod_err)) {
        hullforge::log_event("LOD_REJECTED", state->generation, lod_err);
        if (err) *err = lod_err;
        return false;
    }
    state->lod = next;
    state->lod_level = level;
    return HullSessionRegenerate(state, err);
}

std::vector<PaintSurface> HullSessionPaintSurfaces(const HullSessionState &state) {
    std::vector<PaintSurface> out;
    if (!state.geometry || !state.geometry->valid) return out;
    const HullGeometry &g = *state.geometry;

    const uint32_t base = state.surface_id_base;
    push_surface(&out, base + 0, SurfaceKind::Hull, g.body, state.placement);
    push_surface(&out, base + 1, SurfaceKind::Bow, g.bow, state.placement);
    push_surface(&out, base + 2, SurfaceKind::Transom, g.transom, state.placement);
    push_surface(&out, base + 3, SurfaceKind::Deck, g.deck, state.placement);
    for (size_t i = 0; i < g.stationSections.size(); ++i) {
        push_surface(&out, base + kFixedSurfaceCount + (uint32_t)i, SurfaceKind::Station,
                     g.stationSections[i].mesh, state.placement);
    }
    return out;
}

}  // namespace hullforge_session
