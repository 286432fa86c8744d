#pragma once

#include "geoclean/types.hpp"

#include <string>

namespace geoclean {

    inline constexpr const char *DEGREE_SIGN = "\xC2\xB0";       // U+00B0
    inline constexpr const char *PRIME_SIGN = "\xE2\x80\xB2";    // U+2032
    inline constexpr const char *DOUBLE_PRIME_SIGN = "\xE2\x80\xB3"; // U+2033

    double roundTo(double value, int places);

    // Shortest round-trip decimal text. With keepPointZero a whole value prints as "90.0".
    std::string formatNumber(double value, bool keepPointZero = false);

    double renderDecimal(const ResolvedCoordinate &c);                      // -74.006
    std::string renderWithHemisphere(const ResolvedCoordinate &c);          // 74.006° W
    std::string renderDegreesMinutes(const ResolvedCoordinate &c);          // 74° 0.36′ W
    std::string renderDegreesMinutesSeconds(const ResolvedCoordinate &c);   // 74° 0′ 21.6″ W

    Rendered render(const ResolvedCoordinate &c, OutputFormat format);

    std::string toText(const Rendered &r);

} // namespace geoclean
