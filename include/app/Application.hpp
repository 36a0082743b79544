#pragma once

#include <glib.h>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include "core/Observation.hpp"
#include "services/ForecastService.hpp"

namespace WeatherTerm {

class Config;
class LocationSource;

enum class ExitCode {
    Success = 0,
    Usage = 1,
    LocationNotFound = 2,
    Transport = 3,
    Decode = 4
};

struct Options {
    bool hasCoordinates = false;
    double latitude = 0.0;
    double longitude = 0.0;
    std::string configPath;
    bool verbose = false;
    std::vector<std::string> words;
};

class Application {
public:
    Application();
    Application(std::istream& in, std::ostream& out, std::ostream& err);
    ~Application();

    int run(int argc, char* argv[]);

    // Fails on unknown options, a lone --lat or --lon, or coordinates
    // outside [-90, 90] / [-180, 180]. argv is left untouched.
    static bool parseOptions(int argc, char* argv[], Options& options, std::string& error);

    // --lat/--lon, then positional words, then configured coordinates,
    // then one line read from `in` after writing "City: " to `prompt`.
    static std::unique_ptr<LocationSource> selectLocationSource(const Options& options, const Config& config,
                                                                std::istream& in, std::ostream& prompt);

    // Today's date at `now` and the request window [now, now + days],
    // both ends truncated to the hour. False if the end is not representable.
    static bool forecastWindow(GDateTime* now, int days, CivilDate& today, std::string& from, std::string& to);

    static ExitCode exitCodeFor(ForecastFailure failure);
    static std::string diagnosticFor(const ForecastResult& result);

private:
    static std::string readPlace(std::istream& in, std::ostream& prompt);

    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace WeatherTerm
