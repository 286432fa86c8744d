#pragma once

#include "geoclean/types.hpp"

#include <cstddef>
#include <string>

namespace geoclean {

    // Per-batch outcome counters. Not thread safe: give each worker its own instance and merge.
    struct CleaningStats {
        std::size_t cleaned = 0; // rendered text differs from the input
        std::size_t null = 0;
        std::size_t unknown = 0;

        void reset() { cleaned = null = unknown = 0; }

        void merge(const CleaningStats &other) {
            cleaned += other.cleaned;
            null += other.null;
            unknown += other.unknown;
        }

        void record(const CleaningOutcome &outcome, bool changed);
    };

    // Human readable summary, one line per statement
    std::string report(const CleaningStats &stats, std::size_t rowCount);

    void logReport(const CleaningStats &stats, std::size_t rowCount);

} // namespace geoclean
