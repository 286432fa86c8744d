#include "geoclean/table.hpp"
#include "geoclean/cleaner.hpp"

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <type_traits>

namespace geoclean {

    std::vector<std::pair<std::string, std::vector<Cell>>>::iterator Table::find(const std::string &name) {
        return std::find_if(columns_.begin(), columns_.end(), [&](auto const &c) { return c.first == name; });
    }

    std::vector<std::pair<std::string, std::vector<Cell>>>::const_iterator Table::find(const std::string &name) const {
        return std::find_if(columns_.begin(), columns_.end(), [&](auto const &c) { return c.first == name; });
    }

    void Table::setColumn(const std::string &name, std::vector<Cell> cells) {
        auto it = find(name);
        bool onlyColumn = columns_.empty() || (columns_.size() == 1 && it != columns_.end());
        if (!onlyColumn && cells.size() != rows_) {
            throw std::invalid_argument("Table::setColumn: column '" + name + "' has " + std::to_string(cells.size()) +
                                        " rows, table has " + std::to_string(rows_));
        }
        rows_ = cells.size();
        if (it != columns_.end())
            it->second = std::move(cells);
        else
            columns_.emplace_back(name, std::move(cells));
    }

    void Table::dropColumn(const std::string &name) {
        auto it = find(name);
        if (it == columns_.end())
            throw std::out_of_range("Table::dropColumn: no column '" + name + "'");
        columns_.erase(it);
        if (columns_.empty())
            rows_ = 0;
    }

    bool Table::hasColumn(const std::string &name) const { return find(name) != columns_.end(); }

    const std::vector<Cell> &Table::column(const std::string &name) const {
        auto it = find(name);
        if (it == columns_.end())
            throw std::out_of_range("Table::column: no column '" + name + "'");
        return it->second;
    }

    const Cell &Table::at(const std::string &name, size_t row) const {
        const auto &cells = column(name);
        if (row >= cells.size())
            throw std::out_of_range("Table::at: row index out of range");
        return cells[row];
    }

    std::vector<std::string> Table::columnNames() const {
        std::vector<std::string> names;
        names.reserve(columns_.size());
        for (auto const &c : columns_)
            names.push_back(c.first);
        return names;
    }

    namespace {
        Cell toCell(const Rendered &r) {
            if (const auto *d = std::get_if<double>(&r))
                return *d;
            return std::get<std::string>(r);
        }

        Cell failedCell(const CleaningOutcome &o) {
            std::optional<std::string> text;
            if (const auto *n = std::get_if<Null>(&o))
                text = n->passthrough;
            else if (const auto *u = std::get_if<Unparseable>(&o))
                text = u->passthrough;
            if (text)
                return *text;
            return std::monostate{};
        }
    } // namespace

    CleaningStats cleanLatLong(Table &table, const std::string &column, const CleanerOptions &options) {
        const auto &input = table.column(column);

        CleaningStats stats;
        auto outcomes = cleanCoordinates(input, options, stats);

        if (options.split) {
            std::vector<Cell> latitude, longitude;
            latitude.reserve(outcomes.size());
            longitude.reserve(outcomes.size());
            for (auto const &o : outcomes) {
                const auto *c = std::get_if<Cleaned>(&o);
                if (!c) {
                    latitude.push_back(failedCell(o));
                    longitude.push_back(failedCell(o));
                    continue;
                }
                // split mode always yields a SplitCoordinate
                const auto &s = std::get<SplitCoordinate>(c->value);
                latitude.push_back(s.latitude ? toCell(*s.latitude) : Cell{});
                longitude.push_back(s.longitude ? toCell(*s.longitude) : Cell{});
            }
            table.setColumn("latitude", std::move(latitude));
            table.setColumn("longitude", std::move(longitude));
        } else {
            std::vector<Cell> cleaned;
            cleaned.reserve(outcomes.size());
            for (auto const &o : outcomes) {
                const auto *c = std::get_if<Cleaned>(&o);
                if (!c) {
                    cleaned.push_back(failedCell(o));
                    continue;
                }
                cleaned.push_back(std::visit(
                    [](auto const &v) -> Cell {
                        using T = std::decay_t<decltype(v)>;
                        if constexpr (std::is_same_v<T, SplitCoordinate>) {
                            return std::monostate{};
                        } else {
                            return v;
                        }
                    },
                    c->value));
            }
            table.setColumn(column + "_clean", std::move(cleaned));
        }

        const size_t rows = table.rowCount();
        if (options.inplace)
            table.dropColumn(column);

        logReport(stats, rows);
        return stats;
    }

    std::ostream &operator<<(std::ostream &os, Table const &table) {
        os << "ROWS: " << table.rowCount() << "\n";
        os << "COLUMNS:";
        for (auto const &name : table.columnNames())
            os << " " << name;
        os << "\n";
        for (size_t r = 0; r < table.rowCount(); ++r) {
            bool first = true;
            for (auto const &name : table.columnNames()) {
                const auto &cell = table.at(name, r);
                os << (first ? "  " : " | ")
                   << (std::holds_alternative<std::monostate>(cell) ? std::string("NaN") : cellText(cell));
                first = false;
            }
            os << "\n";
        }
        return os;
    }

} // namespace geoclean
