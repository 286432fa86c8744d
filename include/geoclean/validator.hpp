#pragma once

#include "geoclean/types.hpp"

namespace geoclean {

    // Applies the range and hemisphere rules to a grammar match.
    //
    // A single group is bound to `axis`: a missing hemisphere is inferred from the sign,
    // latitude must resolve to N/S with magnitude <= 90 and longitude to E/W with
    // magnitude <= 180. A pair is always latitude then longitude and ignores `axis`.
    // Returns the Fault of the first rule that fails.
    Resolution resolve(const GrammarMatch &match, HorizontalAxis axis);

    Resolution resolve(const ParsedCoordinate &coord, HorizontalAxis axis);

    Resolution resolve(const ParsedCoordinatePair &pair);

} // namespace geoclean
