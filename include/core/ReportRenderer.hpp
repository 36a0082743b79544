#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "core/Observation.hpp"

namespace WeatherTerm {

class ReportRenderer {
public:
    explicit ReportRenderer(std::ostream& out);

    // Writes the title, one card per day and, when today has hourly
    // entries, the hourly block. Ends with a blank line.
    void render(const std::string& title, const std::vector<DaySummary>& days, const CivilDate& today);

    static std::string formatTemperature(double celsius);
    static std::string formatPercent(double percent);
    static std::string dayLabel(const CivilDate& day, const CivilDate& today);

private:
    void renderHeader(const std::string& title);
    void renderCard(const DaySummary& day, const CivilDate& today);
    void renderHourly(const std::vector<HourlyEntry>& hourly);
    void renderRule();

    std::ostream& out_;
};

}
