#pragma once
#include <string>
#include <vector>

namespace WeatherTerm {

struct CivilDate {
    int year = 0;
    int month = 0;
    int day = 0;

    bool operator==(const CivilDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CivilDate& other) const { return !(*this == other); }
    bool operator<(const CivilDate& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }

    std::string toString() const;       // 2026-10-19
    std::string weekdayName() const;    // Mon
};

struct Timestamp {
    CivilDate date;
    int hour = 0;
    int minute = 0;

    std::string hourLabel() const;      // 14:00
};

// Parses "YYYY-MM-DDTHH:MM" followed by anything (seconds, offset).
// Fields are taken as written, no timezone conversion.
bool parseTimestamp(const std::string& text, Timestamp& out);
bool parseDate(const std::string& text, CivilDate& out);

struct HourlyObservation {
    Timestamp timestamp;
    double temperature = 0.0;
    double precipitationProbability = 0.0;
    std::string condition;
};

struct HourlyEntry {
    std::string hour;
    double temperature = 0.0;
    double precipitationProbability = 0.0;
    std::string condition;
};

struct DaySummary {
    CivilDate day;
    double high = 0.0;
    double low = 0.0;
    double maxPrecipitationProbability = 0.0;
    std::vector<std::string> distinctConditions;
    std::vector<HourlyEntry> hourly;
};

}
