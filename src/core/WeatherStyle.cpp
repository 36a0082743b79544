#include "core/WeatherStyle.hpp"
#include <algorithm>

namespace WeatherTerm {

static const char* const kDefaultCondition = "dry";

static const char* const kIconPriority[] = {
    "thunderstorm", "rain", "snow", "sleet", "hail", "fog", "cloudy"
};

const char* escape(Style style) {
    switch (style) {
        case Style::Bold:   return "\x1b[1m";
        case Style::Dim:    return "\x1b[2m";
        case Style::Cyan:   return "\x1b[36m";
        case Style::Blue:   return "\x1b[34m";
        case Style::Green:  return "\x1b[32m";
        case Style::Yellow: return "\x1b[33m";
        case Style::Red:    return "\x1b[31m";
        case Style::Reset:  return "\x1b[0m";
    }
    return "\x1b[0m";
}

TemperatureBand temperatureBand(double celsius) {
    if (celsius < 0.0) return TemperatureBand::Freezing;
    if (celsius < 10.0) return TemperatureBand::Cool;
    if (celsius < 20.0) return TemperatureBand::Mild;
    if (celsius < 30.0) return TemperatureBand::Warm;
    return TemperatureBand::Hot;
}

PrecipitationBand precipitationBand(double percent) {
    if (percent >= 70.0) return PrecipitationBand::High;
    if (percent >= 40.0) return PrecipitationBand::Caution;
    return PrecipitationBand::Low;
}

Style temperatureStyle(double celsius) {
    switch (temperatureBand(celsius)) {
        case TemperatureBand::Freezing: return Style::Blue;
        case TemperatureBand::Cool:     return Style::Cyan;
        case TemperatureBand::Mild:     return Style::Green;
        case TemperatureBand::Warm:     return Style::Yellow;
        case TemperatureBand::Hot:      return Style::Red;
    }
    return Style::Red;
}

Style precipitationStyle(double percent) {
    switch (precipitationBand(percent)) {
        case PrecipitationBand::High:    return Style::Red;
        case PrecipitationBand::Caution: return Style::Yellow;
        case PrecipitationBand::Low:     return Style::Dim;
    }
    return Style::Dim;
}

bool isDefaultCondition(const std::string& condition) {
    return condition == kDefaultCondition;
}

const char* conditionIcon(const std::string& condition) {
    if (condition == "thunderstorm") return "⛈️";
    if (condition == "rain") return "🌧️";
    if (condition == "snow") return "❄️";
    if (condition == "sleet") return "🌨️";
    if (condition == "hail") return "🧊";
    if (condition == "fog") return "🌫️";
    if (condition == "cloudy") return "☁️";
    return "☀️";
}

const char* dayIcon(const std::vector<std::string>& conditions) {
    for (const char* category : kIconPriority) {
        if (std::find(conditions.begin(), conditions.end(), category) != conditions.end()) {
            return conditionIcon(category);
        }
    }
    return conditionIcon(kDefaultCondition);
}

}
