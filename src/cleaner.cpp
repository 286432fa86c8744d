#include "geoclean/cleaner.hpp"
#include "geoclean/formatter.hpp"
#include "geoclean/grammar.hpp"
#include "geoclean/validator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <ostream>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace geoclean {

    namespace {
        CleanedValue toValue(const Rendered &r) {
            return std::visit([](auto const &v) -> CleanedValue { return v; }, r);
        }

        CleanedValue shapeSingle(const ResolvedCoordinate &c, const CleanerOptions &options) {
            Rendered r = render(c, options.format);
            if (!options.split)
                return toValue(r);
            SplitCoordinate split;
            if (options.axis == HorizontalAxis::Latitude)
                split.latitude = std::move(r);
            else
                split.longitude = std::move(r);
            return split;
        }

        CleanedValue shapePair(const ResolvedPair &p, const CleanerOptions &options) {
            Rendered lat = render(p.latitude, options.format);
            Rendered lon = render(p.longitude, options.format);
            if (options.split)
                return SplitCoordinate{std::move(lat), std::move(lon)};
            if (options.format == OutputFormat::DecimalDegrees)
                return dp::Geo{std::get<double>(lat), std::get<double>(lon), 0.0};
            return toText(lat) + ", " + toText(lon);
        }

        std::optional<std::string> passthrough(const Cell &cell, const CleanerOptions &options) {
            if (options.errors == ErrorPolicy::Coerce || std::holds_alternative<std::monostate>(cell))
                return std::nullopt;
            return cellText(cell);
        }

        bool differs(const Cell &cell, const Rendered &r) {
            if (const auto *d = std::get_if<double>(&r)) {
                const auto *in = std::get_if<double>(&cell);
                return !in || *in != *d;
            }
            const auto *in = std::get_if<std::string>(&cell);
            return !in || *in != std::get<std::string>(r);
        }

        struct JoinGuard {
            std::vector<std::thread> &threads;

            ~JoinGuard() {
                for (auto &t : threads) {
                    if (t.joinable())
                        t.join();
                }
            }
        };
    } // namespace

    std::string cellText(const Cell &cell) {
        return std::visit(
            [](auto const &v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return "";
                } else if constexpr (std::is_same_v<T, double>) {
                    return formatNumber(v, true);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return v;
                } else {
                    return "(" + formatNumber(v.latitude, true) + ", " + formatNumber(v.longitude, true) + ")";
                }
            },
            cell);
    }

    CleaningOutcome cleanValue(const Cell &cell, const CleanerOptions &options) {
        if (options.null_values.contains(cell))
            return Null{passthrough(cell, options)};

        const std::string text = cellText(cell);
        std::optional<GrammarMatch> m;
        try {
            m = match(text);
        } catch (const std::runtime_error &e) {
            // boost::regex gives up on pathological input instead of backtracking forever
            spdlog::warn("geoclean: matching '{}' aborted: {}", text, e.what());
        }
        if (!m) {
            spdlog::debug("geoclean: '{}' rejected: {}", text, faultName(Fault::GrammarMismatch));
            return Unparseable{Fault::GrammarMismatch, passthrough(cell, options)};
        }

        Resolution res = resolve(*m, options.axis);
        if (const auto *fault = std::get_if<Fault>(&res)) {
            spdlog::debug("geoclean: '{}' rejected: {}", text, faultName(*fault));
            return Unparseable{*fault, passthrough(cell, options)};
        }
        if (const auto *single = std::get_if<ResolvedCoordinate>(&res))
            return Cleaned{shapeSingle(*single, options)};
        return Cleaned{shapePair(std::get<ResolvedPair>(res), options)};
    }

    bool changesInput(const Cell &cell, const CleaningOutcome &outcome) {
        const auto *c = std::get_if<Cleaned>(&outcome);
        if (!c)
            return false;
        return std::visit(
            [&](auto const &v) -> bool {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, double>) {
                    return differs(cell, Rendered{v});
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return differs(cell, Rendered{v});
                } else if constexpr (std::is_same_v<T, dp::Geo>) {
                    const auto *in = std::get_if<dp::Geo>(&cell);
                    return !in || in->latitude != v.latitude || in->longitude != v.longitude;
                } else {
                    if (v.latitude && v.longitude)
                        return true;
                    return differs(cell, v.latitude ? *v.latitude : *v.longitude);
                }
            },
            c->value);
    }

    std::vector<CleaningOutcome> cleanCoordinates(const std::vector<Cell> &rows, const CleanerOptions &options,
                                                  CleaningStats &stats) {
        stats.reset();
        std::vector<CleaningOutcome> out(rows.size());

        auto work = [&](std::size_t begin, std::size_t end, CleaningStats &partial) {
            for (std::size_t i = begin; i < end; ++i) {
                out[i] = cleanValue(rows[i], options);
                partial.record(out[i], changesInput(rows[i], out[i]));
            }
        };

        const std::size_t workers = std::max<std::size_t>(1, std::min(options.workers, rows.size()));
        if (workers == 1) {
            work(0, rows.size(), stats);
            return out;
        }

        const std::size_t chunk = (rows.size() + workers - 1) / workers;
        std::vector<CleaningStats> partials(workers);
        std::vector<std::exception_ptr> errors(workers);
        {
            std::vector<std::thread> threads;
            // joins whatever was started, also when a later thread fails to launch
            JoinGuard guard{threads};
            threads.reserve(workers);
            for (std::size_t w = 0; w < workers; ++w) {
                const std::size_t begin = w * chunk;
                const std::size_t end = std::min(rows.size(), begin + chunk);
                threads.emplace_back([&, w, begin, end] {
                    try {
                        work(begin, end, partials[w]);
                    } catch (...) {
                        errors[w] = std::current_exception();
                    }
                });
            }
        }
        for (auto &e : errors) {
            if (e)
                std::rethrow_exception(e);
        }
        for (auto const &p : partials)
            stats.merge(p);
        return out;
    }

    std::vector<CleaningOutcome> cleanCoordinates(const std::vector<Cell> &rows, const CleanerOptions &options) {
        CleaningStats stats;
        return cleanCoordinates(rows, options, stats);
    }

    bool validateCoordinate(const Cell &cell, HorizontalAxis axis, const NullValueSet &nullValues) {
        CleanerOptions options;
        options.axis = axis;
        options.null_values = nullValues;
        return isCleaned(cleanValue(cell, options));
    }

    std::vector<bool> validateCoordinates(const std::vector<Cell> &cells, HorizontalAxis axis,
                                          const NullValueSet &nullValues) {
        std::vector<bool> out;
        out.reserve(cells.size());
        for (auto const &c : cells)
            out.push_back(validateCoordinate(c, axis, nullValues));
        return out;
    }

    std::ostream &operator<<(std::ostream &os, CleaningOutcome const &outcome) {
        if (const auto *n = std::get_if<Null>(&outcome))
            return os << (n->passthrough ? *n->passthrough : "NULL");
        if (const auto *u = std::get_if<Unparseable>(&outcome))
            return os << (u->passthrough ? *u->passthrough : "NaN");

        const auto &value = std::get<Cleaned>(outcome).value;
        if (const auto *d = std::get_if<double>(&value))
            return os << formatNumber(*d, true);
        if (const auto *s = std::get_if<std::string>(&value))
            return os << *s;
        if (const auto *g = std::get_if<dp::Geo>(&value))
            return os << cellText(*g);
        const auto &split = std::get<SplitCoordinate>(value);
        os << "latitude=" << (split.latitude ? toText(*split.latitude) : "NaN");
        os << " longitude=" << (split.longitude ? toText(*split.longitude) : "NaN");
        return os;
    }

} // namespace geoclean
