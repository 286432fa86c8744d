#pragma once

#include "geoclean/types.hpp"

#include <optional>
#include <string>

namespace geoclean {

    // Replaces each doubled apostrophe with a double quote so "30''" reads as 30 seconds
    std::string normalize(const std::string &text);

    // Decomposes text into one coordinate group or a latitude/longitude pair.
    //
    // Accepted per group: optional leading hemisphere letter, signed decimal degrees,
    // optional minutes after a degree mark (U+00B0, 'D', '*' or whitespace) with an
    // optional prime (U+2032, '\'' or 'm'), optional seconds closed by a double prime
    // (U+2033, '"' or 's'), optional trailing hemisphere letter. A second group may
    // follow after one of ",;/" or whitespace. Surrounding parentheses are skipped.
    //
    // The text is normalized first. Returns std::nullopt when nothing matches.
    std::optional<GrammarMatch> match(const std::string &text);

} // namespace geoclean
