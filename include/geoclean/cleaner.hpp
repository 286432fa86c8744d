#pragma once

#include "geoclean/config.hpp"
#include "geoclean/null_values.hpp"
#include "geoclean/stats.hpp"
#include "geoclean/types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace geoclean {

    // Text the grammar sees for a cell: numbers in shortest form ("40.0"), pairs as "(lat, lon)"
    std::string cellText(const Cell &cell);

    // Cleans one value. Never throws for bad input; failures come back as Null or Unparseable.
    CleaningOutcome cleanValue(const Cell &cell, const CleanerOptions &options = {});

    // Whether cleaning `cell` rewrote it, as counted in CleaningStats::cleaned
    bool changesInput(const Cell &cell, const CleaningOutcome &outcome);

    // Cleans every row, in order. `stats` is reset first. With options.workers > 1 the rows are
    // split into contiguous ranges, one per thread, and per-thread counts are merged at the end.
    std::vector<CleaningOutcome> cleanCoordinates(const std::vector<Cell> &rows, const CleanerOptions &options,
                                                  CleaningStats &stats);

    std::vector<CleaningOutcome> cleanCoordinates(const std::vector<Cell> &rows, const CleanerOptions &options = {});

    bool validateCoordinate(const Cell &cell, HorizontalAxis axis = HorizontalAxis::Latitude,
                            const NullValueSet &nullValues = NullValueSet::defaults());

    std::vector<bool> validateCoordinates(const std::vector<Cell> &cells, HorizontalAxis axis = HorizontalAxis::Latitude,
                                          const NullValueSet &nullValues = NullValueSet::defaults());

    std::ostream &operator<<(std::ostream &os, CleaningOutcome const &outcome);

} // namespace geoclean
