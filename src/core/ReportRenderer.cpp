#include "core/ReportRenderer.hpp"
#include "core/WeatherStyle.hpp"
#include <cstdio>

namespace WeatherTerm {

static const char* const kCardColumns = "                 Temp             Rain";
static const char* const kHourlyColumns = "Time         Temp   Rain";
static const int kRuleWidth = 38;

ReportRenderer::ReportRenderer(std::ostream& out) : out_(out) {}

std::string ReportRenderer::formatTemperature(double celsius) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%s%5.1f°%s", escape(temperatureStyle(celsius)), celsius, escape(Style::Reset));
    return buf;
}

// %.0f rounds exact halves to even (2.5 -> 2, 3.5 -> 4).
std::string ReportRenderer::formatPercent(double percent) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%s%3.0f%%%s", escape(precipitationStyle(percent)), percent, escape(Style::Reset));
    return buf;
}

std::string ReportRenderer::dayLabel(const CivilDate& day, const CivilDate& today) {
    if (day == today) {
        return std::string(escape(Style::Bold)) + "Today" + escape(Style::Reset) + "     ";
    }
    char date[32];
    snprintf(date, sizeof(date), "%s %02d.%02d.", day.weekdayName().c_str(), day.day, day.month);
    char buf[32];
    snprintf(buf, sizeof(buf), "%-10s", date);
    return buf;
}

void ReportRenderer::renderRule() {
    out_ << "  " << escape(Style::Dim);
    for (int i = 0; i < kRuleWidth; i++) out_ << "─";
    out_ << escape(Style::Reset) << "\n";
}

void ReportRenderer::renderHeader(const std::string& title) {
    out_ << "\n";
    out_ << "  " << escape(Style::Bold) << escape(Style::Cyan) << title << escape(Style::Reset) << "\n";
    out_ << "  " << escape(Style::Dim) << kCardColumns << escape(Style::Reset) << "\n";
    renderRule();
}

void ReportRenderer::renderCard(const DaySummary& day, const CivilDate& today) {
    out_ << "  " << dayLabel(day.day, today) << " " << dayIcon(day.distinctConditions) << "  "
         << formatTemperature(day.low) << "  …  " << formatTemperature(day.high) << "  "
         << formatPercent(day.maxPrecipitationProbability) << "\n";
}

void ReportRenderer::renderHourly(const std::vector<HourlyEntry>& hourly) {
    out_ << "\n";
    out_ << "  " << escape(Style::Dim) << kHourlyColumns << escape(Style::Reset) << "\n";
    renderRule();
    for (const auto& entry : hourly) {
        out_ << "  " << entry.hour << "  " << conditionIcon(entry.condition) << "  "
             << formatTemperature(entry.temperature) << "  "
             << formatPercent(entry.precipitationProbability) << "\n";
    }
}

void ReportRenderer::render(const std::string& title, const std::vector<DaySummary>& days, const CivilDate& today) {
    renderHeader(title);
    for (const auto& day : days) {
        renderCard(day, today);
    }

    for (const auto& day : days) {
        if (day.day == today) {
            if (!day.hourly.empty()) renderHourly(day.hourly);
            break;
        }
    }
    out_ << "\n";
    out_.flush();
}

}
