#pragma once
#include <string>

namespace WeatherTerm {

struct Settings {
    std::string geocoderUrl = "https://nominatim.openstreetmap.org/search";
    std::string forecastUrl = "https://api.brightsky.dev/weather";
    std::string userAgent = "weather-cli";
    long timeoutSeconds = 0;    // 0 leaves the transport default, at most 3600
    int forecastDays = 3;       // 1 to 16

    // Fixed coordinates, when present, replace geocoding.
    bool hasFixedLocation = false;
    double latitude = 0.0;
    double longitude = 0.0;
};

class Config {
public:
    static Config& getInstance();

    std::string getGeocoderUrl() const { return settings_.geocoderUrl; }
    std::string getForecastUrl() const { return settings_.forecastUrl; }
    std::string getUserAgent() const { return settings_.userAgent; }
    long getTimeoutSeconds() const { return settings_.timeoutSeconds; }
    int getForecastDays() const { return settings_.forecastDays; }

    bool hasFixedLocation() const { return settings_.hasFixedLocation; }
    double getLatitude() const { return settings_.latitude; }
    double getLongitude() const { return settings_.longitude; }

    // Reads overrides from a JSON file. Returns false and fills `error`
    // if the file is unreadable, not a JSON object or holds invalid
    // values; settings are then left as they were.
    bool load(const std::string& path, std::string& error);
    bool loadFromData(const std::string& data, std::string& error);
    void reset();

private:
    Config() = default;
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    Settings settings_;
};

}
