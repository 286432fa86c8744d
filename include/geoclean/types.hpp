#pragma once

#include <datapod/datapod.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace dp = ::datapod;

namespace geoclean {

    enum class Hemisphere { North, South, East, West };

    // Axis of an unpaired coordinate; pairs are always latitude then longitude
    enum class HorizontalAxis { Latitude, Longitude };

    enum class OutputFormat { DecimalDegrees, DecimalDegreesWithHemisphere, DegreesMinutes, DegreesMinutesSeconds };

    // Coerce replaces unusable values with a missing marker, Ignore passes the original text through
    enum class ErrorPolicy { Coerce, Ignore };

    enum class Fault { NullValue, GrammarMismatch, RangeViolation, HemisphereConflict };

    char hemisphereLetter(Hemisphere h);
    std::optional<Hemisphere> hemisphereFromLetter(char c);
    const char *faultName(Fault f);

    // One captured coordinate group. Minutes and seconds default to zero when absent.
    struct ParsedCoordinate {
        double degrees = 0.0;
        bool negative = false; // degree text carried a minus sign (kept separately so "-0" is not lost)
        double minutes = 0.0;
        double seconds = 0.0;
        std::optional<Hemisphere> hemisphere_leading;
        std::optional<Hemisphere> hemisphere_trailing;
    };

    struct ParsedCoordinatePair {
        ParsedCoordinate latitude;
        ParsedCoordinate longitude;
    };

    using GrammarMatch = std::variant<ParsedCoordinate, ParsedCoordinatePair>;

    // A validated coordinate: unsigned magnitude in decimal degrees plus its hemisphere
    struct ResolvedCoordinate {
        double magnitude = 0.0;
        Hemisphere hemisphere = Hemisphere::North;

        double signedDegrees() const {
            return (hemisphere == Hemisphere::South || hemisphere == Hemisphere::West) ? -magnitude : magnitude;
        }
    };

    struct ResolvedPair {
        ResolvedCoordinate latitude;
        ResolvedCoordinate longitude;
    };

    using Resolution = std::variant<ResolvedCoordinate, ResolvedPair, Fault>;

    // A table cell: missing, numeric, textual, or a decimal-degree pair produced by an earlier run
    using Cell = std::variant<std::monostate, double, std::string, dp::Geo>;

    // One rendered coordinate: a number for decimal degrees, text for the other formats
    using Rendered = std::variant<double, std::string>;

    struct SplitCoordinate {
        std::optional<Rendered> latitude;
        std::optional<Rendered> longitude;
    };

    using CleanedValue = std::variant<double, std::string, dp::Geo, SplitCoordinate>;

    struct Cleaned {
        CleanedValue value;
    };

    struct Null {
        std::optional<std::string> passthrough;
    };

    struct Unparseable {
        Fault fault = Fault::GrammarMismatch;
        std::optional<std::string> passthrough;
    };

    using CleaningOutcome = std::variant<Cleaned, Null, Unparseable>;

    inline bool isCleaned(const CleaningOutcome &o) { return std::holds_alternative<Cleaned>(o); }
    inline bool isNull(const CleaningOutcome &o) { return std::holds_alternative<Null>(o); }
    inline bool isUnparseable(const CleaningOutcome &o) { return std::holds_alternative<Unparseable>(o); }

} // namespace geoclean
