#include "geoclean/null_values.hpp"

#include <cmath>

namespace geoclean {

    NullValueSet::NullValueSet()
        : spellings_{"#N/A", "#N/A N/A", "#NA", "-1.#IND", "-1.#QNAN", "-NaN", "-nan", "1.#IND", "1.#QNAN",
                     "<NA>", "N/A",  "NA",       "NULL", "NaN",     "n/a",      "nan",  "null", ""} {}

    NullValueSet::NullValueSet(std::initializer_list<std::string> spellings) : spellings_(spellings) {}

    NullValueSet NullValueSet::defaults() { return NullValueSet(); }

    bool NullValueSet::contains(const Cell &cell) const {
        if (std::holds_alternative<std::monostate>(cell))
            return true;
        if (const auto *d = std::get_if<double>(&cell))
            return std::isnan(*d);
        if (const auto *s = std::get_if<std::string>(&cell))
            return contains(*s);
        return false;
    }

} // namespace geoclean
