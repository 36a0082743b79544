#include "core/ForecastAggregator.hpp"
#include "core/WeatherStyle.hpp"
#include <algorithm>
#include <limits>

namespace WeatherTerm {

ForecastAggregator::ForecastAggregator(const CivilDate& today) : today_(today) {}

DaySummary& ForecastAggregator::summaryFor(const CivilDate& day) {
    auto it = index_.find(day);
    if (it != index_.end()) return days_[it->second];

    DaySummary summary;
    summary.day = day;
    summary.high = -std::numeric_limits<double>::infinity();
    summary.low = std::numeric_limits<double>::infinity();
    index_[day] = days_.size();
    days_.push_back(summary);
    return days_.back();
}

void ForecastAggregator::add(const HourlyObservation& observation) {
    const CivilDate& day = observation.timestamp.date;
    DaySummary& summary = summaryFor(day);

    double t = observation.temperature;
    double rp = observation.precipitationProbability;

    if (t > summary.high) summary.high = t;
    if (t < summary.low) summary.low = t;
    if (rp > summary.maxPrecipitationProbability) summary.maxPrecipitationProbability = rp;

    auto& conds = summary.distinctConditions;
    if (!isDefaultCondition(observation.condition) &&
        std::find(conds.begin(), conds.end(), observation.condition) == conds.end()) {
        conds.push_back(observation.condition);
    }

    if (day == today_) {
        summary.hourly.push_back({observation.timestamp.hourLabel(), t, rp, observation.condition});
    }
}

std::vector<DaySummary> ForecastAggregator::aggregate(const std::vector<HourlyObservation>& observations,
                                                      const CivilDate& today) {
    ForecastAggregator aggregator(today);
    for (const auto& observation : observations) {
        aggregator.add(observation);
    }
    return aggregator.days_;
}

}
