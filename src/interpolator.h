#ifndef HULLFORGE_INTERPOLATOR_H_
#define HULLFORGE_INTERPOLATOR_H_

#include <cstdint>
#include <string>

#include "lod_policy.h"
#include "offset_table.h"

namespace hullforge {

// Resamples the offset grid to the density requested by `lod`.
//
// Station positions and waterline heights are spaced linearly between the
// table extremes. Breadths are blended from the two bracketing stations at a
// matching height, or from the four surrounding samples when neither
// bracketing station carries that height. Positions outside the table clamp
// to the nearest station; nothing is extrapolated.
//
// Returns `table` unchanged when no densification is requested. It is also
// returned unchanged, with `warning` set, when the multipliers fail
// ValidateLodConfig or the table has no stations or heights.
OffsetTable InterpolateOffsetTable(const OffsetTable &table, const LodConfig &lod,
                                   std::string *warning = nullptr,
                                   uint64_t run_id = 0);

}  // namespace hullforge

#endif  // HULLFORGE_INTERPOLATOR_H_
