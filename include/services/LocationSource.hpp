#pragma once
#include <string>

namespace WeatherTerm {

struct Location {
    double latitude = 0.0;
    double longitude = 0.0;
    std::string title;
};

// Shortest decimal text that reads back as the same double, e.g. "52.52".
std::string formatCoordinate(double value);

// Latitude in [-90, 90], longitude in [-180, 180].
bool validCoordinates(double latitude, double longitude);

struct LocationResult {
    bool success = false;
    Location location;
    std::string error;
};

// Where the forecast coordinates come from. Chosen once at startup.
class LocationSource {
public:
    virtual ~LocationSource() = default;
    virtual LocationResult resolve() = 0;
    virtual std::string describe() const = 0;
};

// Looks a free-text place name up with the Nominatim search API.
class GeocodedLocationSource : public LocationSource {
public:
    explicit GeocodedLocationSource(const std::string& query);

    LocationResult resolve() override;
    std::string describe() const override { return query_; }

    std::string buildUrl() const;

    // Picks the first candidate of a search response. Any problem with
    // the body counts as "no match".
    static LocationResult parseSearchResponse(const std::string& body);

private:
    std::string query_;
};

// Fixed coordinates, no network access. Titled "Overview".
class FixedLocationSource : public LocationSource {
public:
    FixedLocationSource(double latitude, double longitude);

    LocationResult resolve() override;
    std::string describe() const override;

private:
    double latitude_;
    double longitude_;
};

}
