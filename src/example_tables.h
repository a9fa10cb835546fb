#ifndef HULLFORGE_EXAMPLE_TABLES_H_
#define HULLFORGE_EXAMPLE_TABLES_H_

#include "offset_table.h"

namespace hullforge {

// Three-station keeled hull, millimetres.
OffsetTable MillimeterExampleTable();

// Three-station hull with keel and chine, feet.
OffsetTable FootExampleTable();

// Seven-station hull with keel and chine, metres.
OffsetTable MeterExampleTable();

}  // namespace hullforge

#endif  // HULLFORGE_EXAMPLE_TABLES_H_
