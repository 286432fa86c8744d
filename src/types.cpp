#include "geoclean/types.hpp"

namespace geoclean {

    char hemisphereLetter(Hemisphere h) {
        switch (h) {
        case Hemisphere::North:
            return 'N';
        case Hemisphere::South:
            return 'S';
        case Hemisphere::East:
            return 'E';
        case Hemisphere::West:
            return 'W';
        }
        return 'N';
    }

    std::optional<Hemisphere> hemisphereFromLetter(char c) {
        switch (c) {
        case 'N':
            return Hemisphere::North;
        case 'S':
            return Hemisphere::South;
        case 'E':
            return Hemisphere::East;
        case 'W':
            return Hemisphere::West;
        default:
            return std::nullopt;
        }
    }

    const char *faultName(Fault f) {
        switch (f) {
        case Fault::NullValue:
            return "null value";
        case Fault::GrammarMismatch:
            return "grammar mismatch";
        case Fault::RangeViolation:
            return "range violation";
        case Fault::HemisphereConflict:
            return "hemisphere conflict";
        }
        return "unknown";
    }

} // namespace geoclean
