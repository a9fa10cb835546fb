#include "interpolator.h"

#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "log.h"

namespace hullforge {

namespace {

struct StationBracket {
  const Station *lower = nullptr;
  const Station *upper = nullptr;
  double ratio = 0.0;
};

std::vector<double> linear_samples(double first, double last, size_t count) {
  std::vector<double> out;
  out.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    const double t = (double)i / (double)(count - 1);
    out.push_back(t * (last - first) + first);
  }
  return out;
}

StationBracket bracket_station(const std::vector<const Station *> &sorted, double position) {
  StationBracket b;
  for (size_t i = 0; i + 1 < sorted.size(); ++i) {
    const double p0 = sorted[i]->position;
    const double p1 = sorted[i + 1]->position;
    if (position >= p0 && position <= p1) {
      b.lower = sorted[i];
      b.upper = sorted[i + 1];
      b.ratio = (p1 > p0) ? (position - p0) / (p1 - p0) : 0.0;
      return b;
    }
  }

  // Outside the table (or a single station): clamp to the nearest one.
  const Station *nearest = sorted[0];
  double best = std::fabs(position - nearest->position);
  for (const Station *station : sorted) {
    const double d = std::fabs(position - station->position);
    if (d < best) {
      best = d;
      nearest = station;
    }
  }
  b.lower = nearest;
  b.upper = nearest;
  b.ratio = 0.0;
  return b;
}

double lerp(double a, double b, double t) { return a + (b - a) * t; }

// Four-corner blend for a height absent from both bracketing stations.
bool blend_four_corners(const StationBracket &b, const std::vector<double> &heights,
                        double height, WaterlineSample *out) {
  double lowerH = 0.0;
  double upperH = 0.0;
  double wlRatio = 0.0;
  bool bracketed = false;
  for (size_t i = 0; i + 1 < heights.size(); ++i) {
    if (height >= heights[i] && height <= heights[i + 1]) {
      lowerH = heights[i];
      upperH = heights[i + 1];
      wlRatio = (upperH > lowerH) ? (height - lowerH) / (upperH - lowerH) : 0.0;
      bracketed = true;
      break;
    }
  }
  if (!bracketed) return false;

  const WaterlineSample *ll = FindSampleNear(*b.lower, lowerH);
  const WaterlineSample *lu = FindSampleNear(*b.lower, upperH);
  const WaterlineSample *ul = FindSampleNear(*b.upper, lowerH);
  const WaterlineSample *uu = FindSampleNear(*b.upper, upperH);
  if (!ll || !lu || !ul || !uu) return false;

  const double lowerPort = lerp(ll->halfBreadthPort, lu->halfBreadthPort, wlRatio);
  const double upperPort = lerp(ul->halfBreadthPort, uu->halfBreadthPort, wlRatio);
  out->halfBreadthPort = lerp(lowerPort, upperPort, b.ratio);

  if (ll->halfBreadthStarboard && lu->halfBreadthStarboard &&
      ul->halfBreadthStarboard && uu->halfBreadthStarboard) {
    const double lowerStar = lerp(*ll->halfBreadthStarboard, *lu->halfBreadthStarboard, wlRatio);
    const double upperStar = lerp(*ul->halfBreadthStarboard, *uu->halfBreadthStarboard, wlRatio);
    out->halfBreadthStarboard = lerp(lowerStar, upperStar, b.ratio);
  }
  return true;
}

bool interpolate_sample(const StationBracket &b, const std::vector<double> &heights,
                        double height, WaterlineSample *out) {
  out->height = height;
  out->halfBreadthStarboard.reset();

  const WaterlineSample *lower = FindSampleNear(*b.lower, height);
  const WaterlineSample *upper = FindSampleNear(*b.upper, height);

  if (lower && upper) {
    out->halfBreadthPort = lerp(lower->halfBreadthPort, upper->halfBreadthPort, b.ratio);
    if (lower->halfBreadthStarboard && upper->halfBreadthStarboard) {
      out->halfBreadthStarboard =
          lerp(*lower->halfBreadthStarboard, *upper->halfBreadthStarboard, b.ratio);
    }
    return true;
  }
  if (lower || upper) {
    const WaterlineSample *only = lower ? lower : upper;
    out->halfBreadthPort = only->halfBreadthPort;
    out->halfBreadthStarboard = only->halfBreadthStarboard;
    return true;
  }
  return blend_four_corners(b, heights, height, out);
}

}  // namespace

OffsetTable InterpolateOffsetTable(const OffsetTable &table, const LodConfig &lod,
                                   std::string *warning, uint64_t run_id) {
  if (warning) warning->clear();
  std::string lodError;
  if (!ValidateLodConfig(lod, &lodError)) {
    if (warning) *warning = lodError;
    log_event("LOD_INTERPOLATE_SKIPPED", run_id, lodError);
    return table;
  }
  if (!LodRequiresInterpolation(lod)) return table;

  const std::vector<const Station *> stations = SortedStations(table);
  const std::vector<double> heights = SortedWaterlineHeights(table);
  if (stations.empty() || heights.empty()) {
    const char *msg = "No valid stations or waterlines found for interpolation.";
    if (warning) *warning = msg;
    log_event("LOD_INTERPOLATE_SKIPPED", run_id, msg);
    return table;
  }

  const size_t stationCount = DenseSampleCount(stations.size(), lod.stationMultiplier);
  const size_t waterlineCount = DenseSampleCount(heights.size(), lod.waterlineMultiplier);
  const std::vector<double> densePositions =
      linear_samples(stations.front()->position, stations.back()->position, stationCount);
  const std::vector<double> denseHeights =
      linear_samples(heights.front(), heights.back(), waterlineCount);

  OffsetTable out;
  out.metadata = table.metadata;
  out.stations.reserve(densePositions.size());

  size_t dropped = 0;
  for (const double position : densePositions) {
    const StationBracket bracket = bracket_station(stations, position);
    Station station;
    station.position = position;
    station.waterlines.reserve(denseHeights.size());
    for (const double height : denseHeights) {
      WaterlineSample sample;
      if (interpolate_sample(bracket, heights, height, &sample)) {
        station.waterlines.push_back(sample);
      } else {
        ++dropped;
      }
    }
    out.stations.push_back(std::move(station));
  }

  std::string details = "stations=" + std::to_string(stations.size()) + "->" +
                        std::to_string(stationCount) + " waterlines=" +
                        std::to_string(heights.size()) + "->" + std::to_string(waterlineCount);
  if (dropped > 0) details += " unresolved=" + std::to_string(dropped);
  log_event("LOD_INTERPOLATE", run_id, details);
  return out;
}

}  // namespace hullforge
