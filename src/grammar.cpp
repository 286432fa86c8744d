#include "geoclean/grammar.hpp"

#include <boost/regex.hpp>

#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace geoclean {

    namespace detail {
        const std::string FLOAT = R"(\d+(?:\.\d+)?)";
        // U+00B0, U+2032 and U+2033 as UTF-8 byte sequences
        const std::string DEGREE_MARK = "(?:\xC2\xB0|[D*\\s])";
        const std::string PRIME_MARK = "(?:\xE2\x80\xB2|['m])";
        const std::string DOUBLE_PRIME_MARK = "(?:\xE2\x80\xB3|[\"s])";

        std::string group(const std::string &n) {
            return "(?<dir_front" + n + ">[NSEW])?[ ]*"
                   "(?<deg" + n + ">-?" + FLOAT + ")"
                   "(?:" + DEGREE_MARK + "[ ]*"
                   "(?:(?<min" + n + ">" + FLOAT + ")" + PRIME_MARK + "?[ ]*)?"
                   "(?:(?<sec" + n + ">" + FLOAT + ")" + DOUBLE_PRIME_MARK + "[ ]*)?"
                   ")?(?<dir_back" + n + ">[NSEW])?";
        }

        const boost::regex &pattern() {
            static const boost::regex re(".*?[(]?" + group("") + "(?:\\s*[,;/\\s]\\s*" + group("2") + ")?[)]?\\s*",
                                         boost::regex::perl | boost::regex::no_mod_s);
            return re;
        }

        // Locale independent. The pattern allows no exponent, so a value out of double range
        // overflows when its integer part is nonzero and underflows to zero otherwise.
        std::optional<double> number(const std::string &text) {
            double value = 0.0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec == std::errc::result_out_of_range) {
                const bool negative = text.front() == '-';
                const auto integer = text.substr(negative ? 1 : 0, text.find('.') - (negative ? 1 : 0));
                value = integer.find_first_not_of('0') == std::string::npos ? 0.0 : HUGE_VAL;
                return negative ? -value : value;
            }
            if (ec != std::errc() || ptr != text.data() + text.size())
                return std::nullopt;
            return value;
        }

        std::optional<double> optionalNumber(const boost::ssub_match &m) {
            if (!m.matched || m.length() == 0)
                return 0.0;
            return number(m.str());
        }

        std::optional<Hemisphere> letter(const boost::ssub_match &m) {
            if (!m.matched || m.length() == 0)
                return std::nullopt;
            return hemisphereFromLetter(m.str().front());
        }

        std::optional<ParsedCoordinate> capture(const boost::smatch &m, const std::string &n) {
            const auto deg = m["deg" + n].str();
            auto degrees = number(deg);
            auto minutes = optionalNumber(m["min" + n]);
            auto seconds = optionalNumber(m["sec" + n]);
            if (!degrees || !minutes || !seconds)
                return std::nullopt;

            ParsedCoordinate c;
            c.negative = deg.front() == '-';
            c.degrees = *degrees;
            c.minutes = *minutes;
            c.seconds = *seconds;
            c.hemisphere_leading = letter(m["dir_front" + n]);
            c.hemisphere_trailing = letter(m["dir_back" + n]);
            return c;
        }
    } // namespace detail

    std::string normalize(const std::string &text) {
        std::string out;
        out.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\'' && i + 1 < text.size() && text[i + 1] == '\'') {
                out += '"';
                ++i;
            } else {
                out += text[i];
            }
        }
        return out;
    }

    std::optional<GrammarMatch> match(const std::string &text) {
        const std::string input = normalize(text);
        boost::smatch m;
        if (!boost::regex_match(input, m, detail::pattern()))
            return std::nullopt;
        if (!m["deg"].matched || m["deg"].length() == 0)
            return std::nullopt;

        auto first = detail::capture(m, "");
        if (!first)
            return std::nullopt;
        if (!m["deg2"].matched)
            return GrammarMatch{*first};
        auto second = detail::capture(m, "2");
        if (!second)
            return std::nullopt;
        return GrammarMatch{ParsedCoordinatePair{*first, *second}};
    }

} // namespace geoclean
