#pragma once
#include <string>
#include <vector>

namespace WeatherTerm {

enum class Style {
    Bold,
    Dim,
    Cyan,
    Blue,
    Green,
    Yellow,
    Red,
    Reset
};

enum class TemperatureBand {
    Freezing,   // below 0
    Cool,       // [0, 10)
    Mild,       // [10, 20)
    Warm,       // [20, 30)
    Hot         // 30 and above
};

enum class PrecipitationBand {
    Low,        // below 40
    Caution,    // [40, 70)
    High        // 70 and above
};

const char* escape(Style style);

TemperatureBand temperatureBand(double celsius);
PrecipitationBand precipitationBand(double percent);
Style temperatureStyle(double celsius);
Style precipitationStyle(double percent);

// "dry" is the fallback category: never recorded as a distinct condition.
bool isDefaultCondition(const std::string& condition);

// Exact label to glyph mapping; anything unknown is clear sky.
const char* conditionIcon(const std::string& condition);

// First category of thunderstorm, rain, snow, sleet, hail, fog, cloudy
// present in `conditions` wins.
const char* dayIcon(const std::vector<std::string>& conditions);

}
