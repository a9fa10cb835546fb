// main.cpp
//
// Builds one of the example offset tables, paints a short stroke along the
// starboard side, commits it as point loads and reports the result as a JSON
// line on stdout. Build and paint events go to stderr as JSON records.
//
// Usage:  build/hullforge_demo [mm|ft|m] [lod-level]
//
// Exit codes:
//   0  geometry built and weights applied; stdout holds a "pass" line
//   1  usage error, failed build or empty stroke; stdout holds a "fail" line

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "app_state.h"
#include "example_tables.h"
#include "hull_session.h"
#include "paint_selection.h"
#include "picking.h"
#include "weight_ledger.h"

namespace {

void json_str(const char *s) {
  for (const char *p = s; *p != '\0'; ++p) {
    const unsigned char c = (unsigned char)*p;
    if      (c == '"')  std::fputs("\\\"", stdout);
    else if (c == '\\') std::fputs("\\\\", stdout);
    else if (c == '\n') std::fputs("\\n",  stdout);
    else if (c == '\r') std::fputs("\\r",  stdout);
    else if (c == '\t') std::fputs("\\t",  stdout);
    else if (c < 0x20)  std::fprintf(stdout, "\\u%04x", c);
    else                std::fputc(c, stdout);
  }
}

int fail(const std::string &error) {
  std::fprintf(stdout, "{\"result\":\"fail\",\"error\":\"");
  json_str(error.c_str());
  std::fprintf(stdout, "\"}\n");
  return 1;
}

bool parse_units(const char *arg, hullforge::OffsetTable *table) {
  if (std::strcmp(arg, "mm") == 0) *table = hullforge::MillimeterExampleTable();
  else if (std::strcmp(arg, "ft") == 0) *table = hullforge::FootExampleTable();
  else if (std::strcmp(arg, "m") == 0) *table = hullforge::MeterExampleTable();
  else return false;
  return true;
}

}  // namespace

int main(int argc, char **argv) {
  hullforge::OffsetTable table = hullforge::MeterExampleTable();
  if (argc > 1 && !parse_units(argv[1], &table)) {
    std::fprintf(stderr, "usage: hullforge_demo [mm|ft|m] [lod-level]\n");
    return fail(std::string("unknown units: ") + argv[1]);
  }

  int level = 2;
  if (argc > 2) {
    char *end = nullptr;
    const long parsed = std::strtol(argv[2], &end, 10);
    if (!end || *end != '\0') {
      std::fprintf(stderr, "usage: hullforge_demo [mm|ft|m] [lod-level]\n");
      return fail(std::string("LOD level is not an integer: ") + argv[2]);
    }
    level = (int)parsed;
  }

  hullforge_session::HullSessionState session;
  std::string error;
  if (!hullforge_session::HullSessionLoadTable(&session, table, hullforge::LodConfig{1.0, 1.0, true}, &error)) {
    return fail(error);
  }
  if (!hullforge_session::HullSessionSetLodLevel(&session, level, &error)) {
    return fail(error);
  }

  hullforge::ViewerState initial;
  initial.units = table.metadata.units;
  initial.lod = session.lod;
  hullforge::StateStore store(initial);
  hullforge::PaintSelectionTool tool(&store);
  hullforge::WeightLedger ledger(table.metadata.weight);
  hullforge::WeightPainter painter(&tool, &ledger);

  store.SetAddWeightActive(true);
  const std::vector<hullforge::PaintSurface> surfaces = hullforge_session::HullSessionPaintSurfaces(session);

  // Stroke along the starboard side at mid height, rays pointing to port.
  const manifold::vec3 extent = session.bounds_max - session.bounds_min;
  const double start_x = extent.x;
  const double half_length = extent.z * 0.5;
  tool.StartPainting();
  const int kStrokeSamples = 5;
  for (int i = 0; i < kStrokeSamples; ++i) {
    const double f = (double)i / (double)(kStrokeSamples - 1);
    hullforge_picking::Ray ray;
    ray.origin = manifold::vec3(start_x, 0.0, -half_length * 0.5 + f * half_length);
    ray.direction = manifold::vec3(-1.0, 0.0, 0.0);
    tool.PaintAt(ray, surfaces);
  }
  tool.StopPainting();

  const hullforge::SelectionSummary summary = painter.Summary();
  if (!painter.ApplyWeightToSelection(session.generation)) {
    return fail("stroke selected no faces");
  }

  const hullforge::HullGeometry &g = *session.geometry;
  std::fprintf(stdout,
               "{\"result\":\"pass\",\"units\":\"%s\",\"lod_level\":%d,"
               "\"vertices\":%zu,\"faces\":%zu,\"stations\":%zu,\"waterlines\":%zu,"
               "\"painted_hull_faces\":%zu,\"applied_count\":%zu,"
               "\"applied_weight\":%.3f,\"total_weight\":%.3f}\n",
               hullforge::LengthUnitName(table.metadata.units), session.lod_level,
               g.stats.vertexCount, g.stats.faceCount, g.stats.stationCount, g.stats.waterlineCount,
               summary.breakdown.hull, painter.AppliedWeightCount(),
               painter.AppliedWeight(), ledger.TotalWeight());
  return 0;
}
