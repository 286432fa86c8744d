#pragma once

#include "cleaner.hpp"
#include "config.hpp"
#include "formatter.hpp"
#include "grammar.hpp"
#include "null_values.hpp"
#include "stats.hpp"
#include "table.hpp"
#include "types.hpp"
#include "validator.hpp"

namespace geoclean {

    inline CleanerOptions loadOptions(const std::filesystem::path &file) { return ReadCleanerOptions(file); }

    inline CleaningStats clean(Table &table, const std::string &column, const CleanerOptions &opts = {}) {
        return cleanLatLong(table, column, opts);
    }

} // namespace geoclean

namespace gc = geoclean;
