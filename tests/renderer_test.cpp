#include <glib.h>
#include <sstream>
#include <string>
#include <vector>
#include "core/ForecastAggregator.hpp"
#include "core/ReportRenderer.hpp"
#include "core/WeatherStyle.hpp"

using namespace WeatherTerm;

static const CivilDate kToday{2026, 10, 19};

static std::string rule() {
    std::string line = "  \x1b[2m";
    for (int i = 0; i < 38; i++) line += "─";
    return line + "\x1b[0m\n";
}

static HourlyObservation makeObservation(const char* timestamp, double temperature,
                                         double precipitation, const char* condition) {
    HourlyObservation observation;
    g_assert_true(parseTimestamp(timestamp, observation.timestamp));
    observation.temperature = temperature;
    observation.precipitationProbability = precipitation;
    observation.condition = condition;
    return observation;
}

static void testTemperatureBands() {
    g_assert_true(temperatureBand(-0.1) == TemperatureBand::Freezing);
    g_assert_true(temperatureBand(0.0) == TemperatureBand::Cool);
    g_assert_true(temperatureBand(9.99) == TemperatureBand::Cool);
    g_assert_true(temperatureBand(10.0) == TemperatureBand::Mild);
    g_assert_true(temperatureBand(20.0) == TemperatureBand::Warm);
    g_assert_true(temperatureBand(29.9) == TemperatureBand::Warm);
    g_assert_true(temperatureBand(30.0) == TemperatureBand::Hot);

    g_assert_cmpstr(escape(temperatureStyle(-5.0)), ==, "\x1b[34m");
    g_assert_cmpstr(escape(temperatureStyle(0.0)), ==, "\x1b[36m");
    g_assert_cmpstr(escape(temperatureStyle(15.0)), ==, "\x1b[32m");
    g_assert_cmpstr(escape(temperatureStyle(25.0)), ==, "\x1b[33m");
    g_assert_cmpstr(escape(temperatureStyle(30.0)), ==, "\x1b[31m");
}

static void testPrecipitationBands() {
    g_assert_true(precipitationBand(39.9) == PrecipitationBand::Low);
    g_assert_true(precipitationBand(40.0) == PrecipitationBand::Caution);
    g_assert_true(precipitationBand(69.9) == PrecipitationBand::Caution);
    g_assert_true(precipitationBand(70.0) == PrecipitationBand::High);

    g_assert_cmpstr(escape(precipitationStyle(0.0)), ==, "\x1b[2m");
    g_assert_cmpstr(escape(precipitationStyle(40.0)), ==, "\x1b[33m");
    g_assert_cmpstr(escape(precipitationStyle(70.0)), ==, "\x1b[31m");
}

static void testConditionIcons() {
    g_assert_cmpstr(conditionIcon("thunderstorm"), ==, "⛈️");
    g_assert_cmpstr(conditionIcon("rain"), ==, "🌧️");
    g_assert_cmpstr(conditionIcon("snow"), ==, "❄️");
    g_assert_cmpstr(conditionIcon("sleet"), ==, "🌨️");
    g_assert_cmpstr(conditionIcon("hail"), ==, "🧊");
    g_assert_cmpstr(conditionIcon("fog"), ==, "🌫️");
    g_assert_cmpstr(conditionIcon("cloudy"), ==, "☁️");
    g_assert_cmpstr(conditionIcon("dry"), ==, "☀️");
    g_assert_cmpstr(conditionIcon("partly-cloudy"), ==, "☀️");
    g_assert_cmpstr(conditionIcon(""), ==, "☀️");
}

static void testDayIconPriority() {
    g_assert_cmpstr(dayIcon({"cloudy", "rain"}), ==, conditionIcon("rain"));
    g_assert_cmpstr(dayIcon({"rain", "thunderstorm", "cloudy"}), ==, conditionIcon("thunderstorm"));
    g_assert_cmpstr(dayIcon({"fog", "hail"}), ==, conditionIcon("hail"));
    g_assert_cmpstr(dayIcon({"cloudy", "fog"}), ==, conditionIcon("fog"));
    g_assert_cmpstr(dayIcon({"unknown-thing"}), ==, conditionIcon("dry"));
    g_assert_cmpstr(dayIcon({}), ==, conditionIcon("dry"));
}

static void testNumberFormats() {
    g_assert_cmpstr(ReportRenderer::formatTemperature(-2.0).c_str(), ==, "\x1b[34m -2.0°\x1b[0m");
    g_assert_cmpstr(ReportRenderer::formatTemperature(31.27).c_str(), ==, "\x1b[31m 31.3°\x1b[0m");
    g_assert_cmpstr(ReportRenderer::formatPercent(80.0).c_str(), ==, "\x1b[31m 80%\x1b[0m");
    g_assert_cmpstr(ReportRenderer::formatPercent(100.0).c_str(), ==, "\x1b[31m100%\x1b[0m");
    // Exact halves round to even.
    g_assert_cmpstr(ReportRenderer::formatPercent(2.5).c_str(), ==, "\x1b[2m  2%\x1b[0m");
    g_assert_cmpstr(ReportRenderer::formatPercent(3.5).c_str(), ==, "\x1b[2m  4%\x1b[0m");
}

static void testDayLabels() {
    g_assert_cmpstr(ReportRenderer::dayLabel(kToday, kToday).c_str(), ==, "\x1b[1mToday\x1b[0m     ");
    g_assert_cmpstr(ReportRenderer::dayLabel(CivilDate({2026, 10, 20}), kToday).c_str(), ==, "Tue 20.10.");
    g_assert_cmpstr(ReportRenderer::dayLabel(CivilDate({2026, 11, 1}), kToday).c_str(), ==, "Sun 01.11.");
}

static void testFullReport() {
    std::vector<HourlyObservation> input = {
        makeObservation("2026-10-19T00:00", -2.0, 10, "clear"),
        makeObservation("2026-10-19T12:00", 5.0, 80, "rain"),
    };
    auto days = ForecastAggregator::aggregate(input, kToday);

    std::ostringstream out;
    ReportRenderer renderer(out);
    renderer.render("Berlin", days, kToday);

    std::string expected =
        "\n"
        "  \x1b[1m\x1b[36mBerlin\x1b[0m\n"
        "  \x1b[2m                 Temp             Rain\x1b[0m\n" + rule() +
        "  \x1b[1mToday\x1b[0m      🌧️  \x1b[34m -2.0°\x1b[0m  …  \x1b[36m  5.0°\x1b[0m  \x1b[31m 80%\x1b[0m\n"
        "\n"
        "  \x1b[2mTime         Temp   Rain\x1b[0m\n" + rule() +
        "  00:00  ☀️  \x1b[34m -2.0°\x1b[0m  \x1b[2m 10%\x1b[0m\n"
        "  12:00  🌧️  \x1b[36m  5.0°\x1b[0m  \x1b[31m 80%\x1b[0m\n"
        "\n";
    g_assert_cmpstr(out.str().c_str(), ==, expected.c_str());
}

static void testReportWithoutToday() {
    std::vector<HourlyObservation> input = {
        makeObservation("2026-10-20T06:00", 12.0, 40, "cloudy"),
        makeObservation("2026-10-20T07:00", 21.0, 0, "rain"),
    };
    auto days = ForecastAggregator::aggregate(input, kToday);

    std::ostringstream out;
    ReportRenderer renderer(out);
    renderer.render("Overview", days, kToday);

    std::string expected =
        "\n"
        "  \x1b[1m\x1b[36mOverview\x1b[0m\n"
        "  \x1b[2m                 Temp             Rain\x1b[0m\n" + rule() +
        "  Tue 20.10. 🌧️  \x1b[32m 12.0°\x1b[0m  …  \x1b[33m 21.0°\x1b[0m  \x1b[33m 40%\x1b[0m\n"
        "\n";
    g_assert_cmpstr(out.str().c_str(), ==, expected.c_str());
    g_assert_true(out.str().find("Time") == std::string::npos);
}

static void testEmptyReport() {
    std::ostringstream out;
    ReportRenderer renderer(out);
    renderer.render("Nowhere", {}, kToday);

    std::string expected =
        "\n"
        "  \x1b[1m\x1b[36mNowhere\x1b[0m\n"
        "  \x1b[2m                 Temp             Rain\x1b[0m\n" + rule() +
        "\n";
    g_assert_cmpstr(out.str().c_str(), ==, expected.c_str());
}

int main(int argc, char* argv[]) {
    g_test_init(&argc, &argv, nullptr);
    g_test_add_func("/style/temperature-bands", testTemperatureBands);
    g_test_add_func("/style/precipitation-bands", testPrecipitationBands);
    g_test_add_func("/style/condition-icons", testConditionIcons);
    g_test_add_func("/style/day-icon-priority", testDayIconPriority);
    g_test_add_func("/renderer/number-formats", testNumberFormats);
    g_test_add_func("/renderer/day-labels", testDayLabels);
    g_test_add_func("/renderer/full-report", testFullReport);
    g_test_add_func("/renderer/report-without-today", testReportWithoutToday);
    g_test_add_func("/renderer/empty-report", testEmptyReport);
    return g_test_run();
}
