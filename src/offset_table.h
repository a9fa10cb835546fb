#ifndef HULLFORGE_OFFSET_TABLE_H_
#define HULLFORGE_OFFSET_TABLE_H_

#include <cstdint>
#include <optional>
#include <vector>

namespace hullforge {

enum class LengthUnit : uint8_t {
  Millimeter = 0,
  Foot = 1,
  Meter = 2,
};

// Advisory only. Starboard fallback is decided per sample, never from this.
enum class HullSymmetry : uint8_t {
  Unspecified = 0,
  Symmetric = 1,
  Asymmetric = 2,
};

enum class HullSide : uint8_t {
  Port = 0,
  Starboard = 1,
};

// Heights are matched with this tolerance, in table units.
extern const double kWaterlineMatchTolerance;

struct WaterlineSample {
  double height = 0.0;
  double halfBreadthPort = 0.0;
  // Absent means symmetric at this sample: starboard mirrors port.
  std::optional<double> halfBreadthStarboard;
};

struct Station {
  double position = 0.0;
  std::vector<WaterlineSample> waterlines;
};

struct TableMetadata {
  double weight = 0.0;
  LengthUnit units = LengthUnit::Meter;
  HullSymmetry symmetry = HullSymmetry::Unspecified;
  bool hasKeel = false;
  bool hasChine = false;
  double thickness = 0.0;
};

struct OffsetTable {
  std::vector<Station> stations;
  TableMetadata metadata;
};

double UnitScale(LengthUnit unit);
const char *LengthUnitName(LengthUnit unit);

// Stations ordered bow to stern. Equal positions keep their input order.
std::vector<const Station *> SortedStations(const OffsetTable &table);

// Every distinct sample height in the table, bottom to top.
std::vector<double> SortedWaterlineHeights(const OffsetTable &table);

const WaterlineSample *FindSampleExact(const Station &station, double height);
const WaterlineSample *FindSampleNear(const Station &station, double height,
                                      double tolerance = kWaterlineMatchTolerance);

double StarboardHalfBreadth(const WaterlineSample &sample);

// True when the station position, the sample height and both half-breadths
// are all finite. Surfaces built from the table skip samples that are not.
bool IsFiniteSample(const Station &station, const WaterlineSample &sample);
double HalfBreadth(const WaterlineSample &sample, HullSide side);

// Half-breadth at an exact (station position, height) pair; 0 when absent.
double HalfBreadthAt(const OffsetTable &table, double stationPosition,
                     double height, HullSide side);

}  // namespace hullforge

#endif  // HULLFORGE_OFFSET_TABLE_H_
