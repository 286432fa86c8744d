#include "geoclean/stats.hpp"
#include "geoclean/formatter.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <sstream>

namespace geoclean {

    void CleaningStats::record(const CleaningOutcome &outcome, bool changed) {
        if (isNull(outcome))
            ++null;
        else if (isUnparseable(outcome))
            ++unknown;
        else if (changed)
            ++cleaned;
    }

    namespace {
        double percent(std::size_t n, std::size_t total) {
            if (total == 0)
                return 0.0;
            return roundTo(static_cast<double>(n) / static_cast<double>(total) * 100.0, 2);
        }
    } // namespace

    std::string report(const CleaningStats &stats, std::size_t rowCount) {
        std::string out = "Latitude and Longitude Cleaning Report:\n";
        if (stats.cleaned > 0) {
            out += fmt::format("\t{} values cleaned ({}%)\n", stats.cleaned,
                               formatNumber(percent(stats.cleaned, rowCount), true));
        }
        if (stats.unknown > 0) {
            out += fmt::format("\t{} values unable to be parsed ({}%), set to NaN\n", stats.unknown,
                               formatNumber(percent(stats.unknown, rowCount), true));
        }
        const std::size_t nnull = stats.null + stats.unknown;
        const double pnull = percent(nnull, rowCount);
        const std::size_t ncorrect = rowCount > nnull ? rowCount - nnull : 0;
        const double pcorrect = rowCount == 0 ? 0.0 : roundTo(100.0 - pnull, 2);
        out += fmt::format("Result contains {} ({}%) values in the correct format and {} null values ({}%)\n",
                           ncorrect, formatNumber(pcorrect, true), nnull, formatNumber(pnull, true));
        return out;
    }

    void logReport(const CleaningStats &stats, std::size_t rowCount) {
        std::istringstream lines(report(stats, rowCount));
        std::string line;
        while (std::getline(lines, line))
            spdlog::info("{}", line);
    }

} // namespace geoclean
