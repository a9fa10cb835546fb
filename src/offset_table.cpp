#include "offset_table.h"

#include <algorithm>
#include <cmath>

namespace hullforge {

const double kWaterlineMatchTolerance = 0.001;

double UnitScale(LengthUnit unit) {
  switch (unit) {
    case LengthUnit::Millimeter:
      return 0.001;
    case LengthUnit::Foot:
      return 0.3048;
    case LengthUnit::Meter:
    default:
      return 1.0;
  }
}

const char *LengthUnitName(LengthUnit unit) {
  switch (unit) {
    case LengthUnit::Millimeter: return "mm";
    case LengthUnit::Foot: return "ft";
    case LengthUnit::Meter: return "m";
    default: return "unknown";
  }
}

std::vector<const Station *> SortedStations(const OffsetTable &table) {
  std::vector<const Station *> out;
  out.reserve(table.stations.size());
  for (const Station &station : table.stations) out.push_back(&station);
  std::stable_sort(out.begin(), out.end(), [](const Station *a, const Station *b) {
    return a->position < b->position;
  });
  return out;
}

std::vector<double> SortedWaterlineHeights(const OffsetTable &table) {
  std::vector<double> heights;
  for (const Station &station : table.stations) {
    for (const WaterlineSample &wl : station.waterlines) heights.push_back(wl.height);
  }
  std::sort(heights.begin(), heights.end());
  heights.erase(std::unique(heights.begin(), heights.end()), heights.end());
  return heights;
}

const WaterlineSample *FindSampleExact(const Station &station, double height) {
  for (const WaterlineSample &wl : station.waterlines) {
    if (wl.height == height) return &wl;
  }
  return nullptr;
}

const WaterlineSample *FindSampleNear(const Station &station, double height, double tolerance) {
  for (const WaterlineSample &wl : station.waterlines) {
    if (std::fabs(wl.height - height) < tolerance) return &wl;
  }
  return nullptr;
}

double StarboardHalfBreadth(const WaterlineSample &sample) {
  return sample.halfBreadthStarboard ? *sample.halfBreadthStarboard : sample.halfBreadthPort;
}

bool IsFiniteSample(const Station &station, const WaterlineSample &sample) {
  return std::isfinite(station.position) && std::isfinite(sample.height) &&
         std::isfinite(sample.halfBreadthPort) && std::isfinite(StarboardHalfBreadth(sample));
}

double HalfBreadth(const WaterlineSample &sample, HullSide side) {
  return side == HullSide::Starboard ? StarboardHalfBreadth(sample) : sample.halfBreadthPort;
}

double HalfBreadthAt(const OffsetTable &table, double stationPosition,
                     double height, HullSide side) {
  for (const Station &station : table.stations) {
    if (station.position != stationPosition) continue;
    const WaterlineSample *wl = FindSampleExact(station, height);
    return wl ? HalfBreadth(*wl, side) : 0.0;
  }
  return 0.0;
}

}  // namespace hullforge
