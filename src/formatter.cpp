#include "geoclean/formatter.hpp"

#include <fmt/format.h>

#include <cmath>
#include <string>

namespace geoclean {

    double roundTo(double value, int places) {
        const double scale = std::pow(10.0, places);
        return std::round(value * scale) / scale;
    }

    namespace {
        // Rewrites "<mantissa>e<exponent>" digits in plain positional notation
        std::string withoutExponent(const std::string &mantissa, int exponent) {
            std::string sign;
            std::string digits;
            int point = 0;
            bool fraction = false;
            for (char ch : mantissa) {
                if (ch == '-') {
                    sign = "-";
                } else if (ch == '.') {
                    fraction = true;
                } else {
                    digits += ch;
                    if (!fraction)
                        ++point;
                }
            }
            point += exponent;
            if (point <= 0)
                return sign + "0." + std::string(static_cast<std::size_t>(-point), '0') + digits;
            const auto whole = static_cast<std::size_t>(point);
            if (whole >= digits.size())
                return sign + digits + std::string(whole - digits.size(), '0');
            return sign + digits.substr(0, whole) + "." + digits.substr(whole);
        }
    } // namespace

    std::string formatNumber(double value, bool keepPointZero) {
        if (value == 0.0)
            value = 0.0; // drop the sign of -0.0
        std::string s = fmt::format("{}", value);
        if (const auto e = s.find('e'); e != std::string::npos)
            s = withoutExponent(s.substr(0, e), std::stoi(s.substr(e + 1)));
        if (keepPointZero && std::isfinite(value) && s.find('.') == std::string::npos)
            s += ".0";
        return s;
    }

    namespace {
        // Rounded minutes or seconds: whole values print as integers
        std::string formatPart(double rounded) {
            if (rounded == std::trunc(rounded))
                return fmt::format("{}", static_cast<long long>(rounded));
            return formatNumber(rounded);
        }

        long long wholeDegrees(double magnitude) { return static_cast<long long>(magnitude); }
    } // namespace

    double renderDecimal(const ResolvedCoordinate &c) {
        double v = roundTo(c.signedDegrees(), 4);
        return v == 0.0 ? 0.0 : v;
    }

    std::string renderWithHemisphere(const ResolvedCoordinate &c) {
        return fmt::format("{}{} {}", formatNumber(roundTo(c.magnitude, 4), true), DEGREE_SIGN,
                           hemisphereLetter(c.hemisphere));
    }

    std::string renderDegreesMinutes(const ResolvedCoordinate &c) {
        auto deg = wholeDegrees(c.magnitude);
        double minutes = roundTo(60.0 * (c.magnitude - static_cast<double>(deg)), 4);
        if (minutes >= 60.0) {
            minutes = 0.0;
            ++deg;
        }
        return fmt::format("{}{} {}{} {}", deg, DEGREE_SIGN, formatPart(minutes), PRIME_SIGN,
                           hemisphereLetter(c.hemisphere));
    }

    std::string renderDegreesMinutesSeconds(const ResolvedCoordinate &c) {
        auto deg = wholeDegrees(c.magnitude);
        const double fraction = c.magnitude - static_cast<double>(deg);
        auto minutes = static_cast<long long>(60.0 * fraction);
        double seconds = roundTo(3600.0 * fraction - 60.0 * static_cast<double>(minutes), 4);
        // rounding can land on a full unit; carry it so every part stays below 60
        if (seconds >= 60.0) {
            seconds = 0.0;
            ++minutes;
        }
        if (minutes >= 60) {
            minutes = 0;
            ++deg;
        }
        return fmt::format("{}{} {}{} {}{} {}", deg, DEGREE_SIGN, minutes, PRIME_SIGN, formatPart(seconds),
                           DOUBLE_PRIME_SIGN, hemisphereLetter(c.hemisphere));
    }

    Rendered render(const ResolvedCoordinate &c, OutputFormat format) {
        switch (format) {
        case OutputFormat::DecimalDegrees:
            return renderDecimal(c);
        case OutputFormat::DecimalDegreesWithHemisphere:
            return renderWithHemisphere(c);
        case OutputFormat::DegreesMinutes:
            return renderDegreesMinutes(c);
        case OutputFormat::DegreesMinutesSeconds:
            return renderDegreesMinutesSeconds(c);
        }
        return renderDecimal(c);
    }

    std::string toText(const Rendered &r) {
        if (const auto *d = std::get_if<double>(&r))
            return formatNumber(*d, true);
        return std::get<std::string>(r);
    }

} // namespace geoclean
