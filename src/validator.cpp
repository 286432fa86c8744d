#include "geoclean/validator.hpp"

#include <cmath>

namespace geoclean {

    namespace {
        bool inMinuteRange(double v) { return v >= 0.0 && v < 60.0; }

        std::optional<Hemisphere> givenHemisphere(const ParsedCoordinate &c) {
            return c.hemisphere_trailing ? c.hemisphere_trailing : c.hemisphere_leading;
        }

        // Rules shared by every group: minute/second range, one hemisphere letter at most,
        // and no minus sign next to a letter.
        std::optional<Fault> checkGroup(const ParsedCoordinate &c) {
            if (!inMinuteRange(c.minutes) || !inMinuteRange(c.seconds))
                return Fault::RangeViolation;
            if (c.hemisphere_leading && c.hemisphere_trailing)
                return Fault::HemisphereConflict;
            if (givenHemisphere(c) && c.negative)
                return Fault::HemisphereConflict;
            return std::nullopt;
        }

        double magnitude(const ParsedCoordinate &c) {
            return std::fabs(c.degrees) + c.minutes / 60.0 + c.seconds / 3600.0;
        }

        double signedValue(const ParsedCoordinate &c) { return c.negative ? -magnitude(c) : magnitude(c); }

        Hemisphere inferred(HorizontalAxis axis, double value) {
            if (axis == HorizontalAxis::Latitude)
                return value >= 0.0 ? Hemisphere::North : Hemisphere::South;
            return value >= 0.0 ? Hemisphere::East : Hemisphere::West;
        }

        bool onAxis(HorizontalAxis axis, Hemisphere h) {
            if (axis == HorizontalAxis::Latitude)
                return h == Hemisphere::North || h == Hemisphere::South;
            return h == Hemisphere::East || h == Hemisphere::West;
        }

        double bound(HorizontalAxis axis) { return axis == HorizontalAxis::Latitude ? 90.0 : 180.0; }
    } // namespace

    Resolution resolve(const ParsedCoordinate &coord, HorizontalAxis axis) {
        if (auto fault = checkGroup(coord))
            return *fault;

        double value = signedValue(coord);
        Hemisphere hem = givenHemisphere(coord).value_or(inferred(axis, value));
        double mag = std::fabs(value);

        if (!onAxis(axis, hem))
            return Fault::HemisphereConflict;
        if (mag > bound(axis))
            return Fault::RangeViolation;
        return ResolvedCoordinate{mag, hem};
    }

    Resolution resolve(const ParsedCoordinatePair &pair) {
        for (const auto *c : {&pair.latitude, &pair.longitude}) {
            if (auto fault = checkGroup(*c))
                return *fault;
        }

        auto latHem = givenHemisphere(pair.latitude);
        auto lonHem = givenHemisphere(pair.longitude);
        if (latHem && !onAxis(HorizontalAxis::Latitude, *latHem))
            return Fault::HemisphereConflict;
        if (lonHem && !onAxis(HorizontalAxis::Longitude, *lonHem))
            return Fault::HemisphereConflict;

        double lat = signedValue(pair.latitude);
        double lon = signedValue(pair.longitude);
        if (lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0)
            return Fault::RangeViolation;

        ResolvedPair out;
        out.latitude = ResolvedCoordinate{std::fabs(lat), latHem.value_or(inferred(HorizontalAxis::Latitude, lat))};
        out.longitude =
            ResolvedCoordinate{std::fabs(lon), lonHem.value_or(inferred(HorizontalAxis::Longitude, lon))};
        if (out.latitude.magnitude > 90.0 || out.longitude.magnitude > 180.0)
            return Fault::RangeViolation;
        return out;
    }

    Resolution resolve(const GrammarMatch &match, HorizontalAxis axis) {
        if (const auto *single = std::get_if<ParsedCoordinate>(&match))
            return resolve(*single, axis);
        return resolve(std::get<ParsedCoordinatePair>(match));
    }

} // namespace geoclean
