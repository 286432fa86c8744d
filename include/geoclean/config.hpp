#pragma once

#include "geoclean/null_values.hpp"
#include "geoclean/types.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace geoclean {

    struct CleanerOptions {
        OutputFormat format = OutputFormat::DecimalDegrees;
        bool split = false;
        HorizontalAxis axis = HorizontalAxis::Latitude;
        ErrorPolicy errors = ErrorPolicy::Coerce;
        bool inplace = false;     // drop the source column after cleaning a Table
        std::size_t workers = 1;  // threads used by cleanCoordinates
        NullValueSet null_values;
    };

    OutputFormat parseOutputFormat(const std::string &s);     // "dd", "ddh", "dm", "dms"
    HorizontalAxis parseHorizontalAxis(const std::string &s); // "lat", "long"
    ErrorPolicy parseErrorPolicy(const std::string &s);       // "coerce", "ignore"

    const char *toString(OutputFormat f);
    const char *toString(HorizontalAxis a);
    const char *toString(ErrorPolicy p);

    // Reads options from a JSON object; every key is optional:
    //   {"output_format": "dms", "split": true, "hor_coord": "long", "errors": "ignore",
    //    "inplace": false, "workers": 4, "null_values": [...], "extra_null_values": [...]}
    // "null_values" replaces the default set, "extra_null_values" adds to it.
    CleanerOptions ReadCleanerOptions(const std::filesystem::path &file);

    CleanerOptions ParseCleanerOptions(const std::string &json);

} // namespace geoclean
