#pragma once

#include "geoclean/config.hpp"
#include "geoclean/stats.hpp"
#include "geoclean/types.hpp"

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace geoclean {

    // Named columns of equal length, kept in insertion order
    class Table {
      private:
        std::vector<std::pair<std::string, std::vector<Cell>>> columns_;
        size_t rows_ = 0;

        std::vector<std::pair<std::string, std::vector<Cell>>>::iterator find(const std::string &name);
        std::vector<std::pair<std::string, std::vector<Cell>>>::const_iterator find(const std::string &name) const;

      public:
        Table() = default;

        // Adds or replaces a column. Throws std::invalid_argument when the length differs from the table.
        void setColumn(const std::string &name, std::vector<Cell> cells);

        void dropColumn(const std::string &name);

        bool hasColumn(const std::string &name) const;

        const std::vector<Cell> &column(const std::string &name) const;

        const Cell &at(const std::string &name, size_t row) const;

        std::vector<std::string> columnNames() const;

        size_t rowCount() const { return rows_; }
        size_t columnCount() const { return columns_.size(); }
    };

    // Cleans `column` and adds the result as "latitude"/"longitude" (split) or "<column>_clean".
    // Rows that cannot be cleaned become missing cells, or keep their text under ErrorPolicy::Ignore.
    // With options.inplace the source column is removed. The report is logged before returning.
    CleaningStats cleanLatLong(Table &table, const std::string &column, const CleanerOptions &options = {});

    std::ostream &operator<<(std::ostream &os, Table const &table);

} // namespace geoclean
