#include "geoclean/geoclean.hpp"
#include <iostream>

int main() {
    try {
        // 1) A column of hand-written coordinates
        gc::Table table;
        table.setColumn("location", {gc::Cell{std::string("40.7128 N, 74.0060 W")},
                                     gc::Cell{std::string("(-33.8688, 151.2093)")},
                                     gc::Cell{std::string("51°30'26''N 0°7'39''W")},
                                     gc::Cell{std::string("N/A")}, gc::Cell{std::string("somewhere nice")}});

        // 2) Split into latitude/longitude columns as degrees, minutes and seconds
        gc::CleanerOptions opts;
        opts.format = gc::OutputFormat::DegreesMinutesSeconds;
        opts.split = true;
        auto stats = gc::clean(table, "location", opts);

        std::cout << table << "\n";
        std::cout << gc::report(stats, table.rowCount());

        // 3) Single values only need to know their axis
        std::cout << "\"-40.7128\" as latitude: " << gc::cleanValue(gc::Cell{std::string("-40.7128")}) << "\n";
        std::cout << "\"190 E\" valid longitude: " << std::boolalpha
                  << gc::validateCoordinate(gc::Cell{std::string("190 E")}, gc::HorizontalAxis::Longitude) << "\n";
    } catch (std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
