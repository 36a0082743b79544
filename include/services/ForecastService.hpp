#pragma once
#include <string>
#include <vector>
#include "core/Observation.hpp"
#include "services/LocationSource.hpp"

namespace WeatherTerm {

enum class ForecastFailure {
    None,
    Transport,
    Decode
};

struct ForecastResult {
    bool success = false;
    ForecastFailure failure = ForecastFailure::None;
    std::string error;
    std::vector<HourlyObservation> observations;
};

// Hourly forecast from the Bright Sky API.
class ForecastService {
public:
    ForecastService();

    // `from` and `to` are local times formatted as YYYY-MM-DDTHH:00.
    ForecastResult fetch(const Location& location, const std::string& from, const std::string& to);

    static std::string buildUrl(const Location& location, const std::string& from, const std::string& to);
    static ForecastResult parseResponse(const std::string& body);
};

}
