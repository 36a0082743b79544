#pragma once
#include <map>
#include <vector>
#include "core/Observation.hpp"

namespace WeatherTerm {

// Rolls hourly observations up into one summary per calendar day.
// Days come out in the order they are first seen in the input; hourly
// entries are only collected for `today`.
class ForecastAggregator {
public:
    explicit ForecastAggregator(const CivilDate& today);

    void add(const HourlyObservation& observation);
    const std::vector<DaySummary>& days() const { return days_; }

    static std::vector<DaySummary> aggregate(const std::vector<HourlyObservation>& observations,
                                             const CivilDate& today);

private:
    DaySummary& summaryFor(const CivilDate& day);

    CivilDate today_;
    std::vector<DaySummary> days_;
    std::map<CivilDate, size_t> index_;
};

}
