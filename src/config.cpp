#include "geoclean/config.hpp"

#include <boost/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace geoclean {

    OutputFormat parseOutputFormat(const std::string &s) {
        if (s == "dd")
            return OutputFormat::DecimalDegrees;
        else if (s == "ddh")
            return OutputFormat::DecimalDegreesWithHemisphere;
        else if (s == "dm")
            return OutputFormat::DegreesMinutes;
        else if (s == "dms")
            return OutputFormat::DegreesMinutesSeconds;
        throw std::runtime_error("Unknown output format string: " + s);
    }

    HorizontalAxis parseHorizontalAxis(const std::string &s) {
        if (s == "lat" || s == "latitude")
            return HorizontalAxis::Latitude;
        else if (s == "long" || s == "longitude")
            return HorizontalAxis::Longitude;
        throw std::runtime_error("Unknown horizontal axis string: " + s);
    }

    ErrorPolicy parseErrorPolicy(const std::string &s) {
        if (s == "coerce")
            return ErrorPolicy::Coerce;
        else if (s == "ignore")
            return ErrorPolicy::Ignore;
        throw std::runtime_error("Unknown error policy string: " + s);
    }

    const char *toString(OutputFormat f) {
        switch (f) {
        case OutputFormat::DecimalDegrees:
            return "dd";
        case OutputFormat::DecimalDegreesWithHemisphere:
            return "ddh";
        case OutputFormat::DegreesMinutes:
            return "dm";
        case OutputFormat::DegreesMinutesSeconds:
            return "dms";
        }
        return "dd";
    }

    const char *toString(HorizontalAxis a) { return a == HorizontalAxis::Latitude ? "lat" : "long"; }

    const char *toString(ErrorPolicy p) { return p == ErrorPolicy::Coerce ? "coerce" : "ignore"; }

    namespace {
        using json = boost::json::value;

        std::string stringField(const boost::json::object &obj, const char *key) {
            auto const &v = obj.at(key);
            if (!v.is_string())
                throw std::runtime_error(std::string("cleaner options: '") + key + "' must be a string");
            return std::string(v.as_string());
        }

        bool boolField(const boost::json::object &obj, const char *key) {
            auto const &v = obj.at(key);
            if (!v.is_bool())
                throw std::runtime_error(std::string("cleaner options: '") + key + "' must be a boolean");
            return v.as_bool();
        }

        std::vector<std::string> stringList(const boost::json::object &obj, const char *key) {
            auto const &v = obj.at(key);
            if (!v.is_array())
                throw std::runtime_error(std::string("cleaner options: '") + key + "' must be an array of strings");
            std::vector<std::string> out;
            for (auto const &item : v.as_array()) {
                if (!item.is_string())
                    throw std::runtime_error(std::string("cleaner options: '") + key +
                                             "' must be an array of strings");
                out.emplace_back(item.as_string());
            }
            return out;
        }

        CleanerOptions fromJson(const json &j) {
            if (!j.is_object())
                throw std::runtime_error("cleaner options: top-level value must be an object");
            auto const &obj = j.as_object();

            CleanerOptions opts;
            if (obj.contains("output_format"))
                opts.format = parseOutputFormat(stringField(obj, "output_format"));
            if (obj.contains("split"))
                opts.split = boolField(obj, "split");
            if (obj.contains("hor_coord"))
                opts.axis = parseHorizontalAxis(stringField(obj, "hor_coord"));
            if (obj.contains("errors"))
                opts.errors = parseErrorPolicy(stringField(obj, "errors"));
            if (obj.contains("inplace"))
                opts.inplace = boolField(obj, "inplace");
            if (obj.contains("workers")) {
                auto const &w = obj.at("workers");
                if (!w.is_int64() || w.as_int64() < 1)
                    throw std::runtime_error("cleaner options: 'workers' must be a positive integer");
                opts.workers = static_cast<std::size_t>(w.as_int64());
            }
            if (obj.contains("null_values")) {
                opts.null_values.clear();
                for (auto const &s : stringList(obj, "null_values"))
                    opts.null_values.add(s);
            }
            if (obj.contains("extra_null_values")) {
                for (auto const &s : stringList(obj, "extra_null_values"))
                    opts.null_values.add(s);
            }
            return opts;
        }
    } // namespace

    CleanerOptions ParseCleanerOptions(const std::string &text) {
        boost::json::error_code ec;
        json j = boost::json::parse(text, ec);
        if (ec)
            throw std::runtime_error("cleaner options: failed to parse JSON: " + ec.message());
        return fromJson(j);
    }

    CleanerOptions ReadCleanerOptions(const std::filesystem::path &file) {
        std::ifstream ifs(file);
        if (!ifs) {
            throw std::runtime_error("geoclean::ReadCleanerOptions(): cannot open \"" + file.string() + '\"');
        }
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return ParseCleanerOptions(buffer.str());
    }

} // namespace geoclean
