#include "example_tables.h"

#include <cstddef>

namespace hullforge {

namespace {

Station make_station(double position, const double *heights, const double *breadths, size_t count) {
  Station station;
  station.position = position;
  station.waterlines.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    WaterlineSample wl;
    wl.height = heights[i];
    wl.halfBreadthPort = breadths[i];
    station.waterlines.push_back(wl);
  }
  return station;
}

}  // namespace

OffsetTable MillimeterExampleTable() {
  static const double kHeights[] = {0.0, 500.0, 1000.0};
  static const double kEnds[] = {0.0, 1200.0, 1500.0};
  static const double kMid[] = {0.0, 2000.0, 2500.0};

  OffsetTable table;
  table.stations.push_back(make_station(0.0, kHeights, kEnds, 3));
  table.stations.push_back(make_station(5000.0, kHeights, kMid, 3));
  table.stations.push_back(make_station(10000.0, kHeights, kEnds, 3));
  table.metadata.weight = 2000.0;
  table.metadata.units = LengthUnit::Millimeter;
  table.metadata.symmetry = HullSymmetry::Symmetric;
  table.metadata.hasKeel = true;
  table.metadata.hasChine = false;
  table.metadata.thickness = 0.1;
  return table;
}

OffsetTable FootExampleTable() {
  static const double kHeights[] = {0.0, 1.0, 2.0};
  static const double kBow[] = {0.0, 3.5, 4.2};
  static const double kMid[] = {0.0, 6.5, 7.0};
  static const double kStern[] = {0.0, 3.0, 4.0};

  OffsetTable table;
  table.stations.push_back(make_station(0.0, kHeights, kBow, 3));
  table.stations.push_back(make_station(15.0, kHeights, kMid, 3));
  table.stations.push_back(make_station(30.0, kHeights, kStern, 3));
  table.metadata.weight = 3000.0;
  table.metadata.units = LengthUnit::Foot;
  table.metadata.symmetry = HullSymmetry::Asymmetric;
  table.metadata.hasKeel = true;
  table.metadata.hasChine = true;
  table.metadata.thickness = 0.1;
  return table;
}

OffsetTable MeterExampleTable() {
  static const double kHeights[] = {0.0, 0.15, 0.30, 0.45, 0.60, 0.75, 0.90};
  static const double kBreadths[7][7] = {
      {0.00, 0.00, 0.00, 0.00, 0.00, 0.00, 0.00},
      {0.00, 0.25, 0.45, 0.65, 0.80, 0.85, 0.75},
      {0.00, 0.50, 0.75, 0.95, 1.10, 1.15, 1.05},
      {0.00, 0.65, 0.90, 1.10, 1.25, 1.30, 1.20},
      {0.00, 0.60, 0.85, 1.05, 1.20, 1.25, 1.15},
      {0.00, 0.40, 0.60, 0.75, 0.85, 0.90, 0.80},
      {0.30, 0.35, 0.40, 0.45, 0.50, 0.55, 0.50},
  };

  OffsetTable table;
  for (int s = 0; s < 7; ++s) {
    table.stations.push_back(make_station((double)s, kHeights, kBreadths[s], 7));
  }
  table.metadata.weight = 1500.0;
  table.metadata.units = LengthUnit::Meter;
  table.metadata.symmetry = HullSymmetry::Symmetric;
  table.metadata.hasKeel = true;
  table.metadata.hasChine = true;
  table.metadata.thickness = 0.1;
  return table;
}

}  // namespace hullforge
