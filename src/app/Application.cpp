#include "app/Application.hpp"
#include "core/ForecastAggregator.hpp"
#include "core/ReportRenderer.hpp"
#include "services/LocationSource.hpp"
#include "utils/Config.hpp"
#include <cmath>
#include <iostream>

namespace WeatherTerm {

static const char* const kWindowFormat = "%Y-%m-%dT%H:00";

Application::Application() : Application(std::cin, std::cout, std::cerr) {}

Application::Application(std::istream& in, std::ostream& out, std::ostream& err)
    : in_(in), out_(out), err_(err) {}

Application::~Application() = default;

bool Application::parseOptions(int argc, char* argv[], Options& options, std::string& error) {
    double latitude = NAN;
    double longitude = NAN;
    gchar* configPath = nullptr;
    gboolean verbose = FALSE;

    GOptionEntry entries[] = {
        {"lat", 0, 0, G_OPTION_ARG_DOUBLE, &latitude, "Latitude of a fixed location", "DEG"},
        {"lon", 0, 0, G_OPTION_ARG_DOUBLE, &longitude, "Longitude of a fixed location", "DEG"},
        {"config", 'c', 0, G_OPTION_ARG_FILENAME, &configPath, "Read settings from a JSON file", "FILE"},
        {"verbose", 'v', 0, G_OPTION_ARG_NONE, &verbose, "Print debug messages", nullptr},
        {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr}
    };

    GOptionContext* context = g_option_context_new("[PLACE...]");
    g_option_context_set_summary(context, "Shows a three day hourly forecast for a place.");
    g_option_context_add_main_entries(context, entries, nullptr);

    // Parse a copy: GOption removes the options it consumed.
    gchar** args = g_new0(gchar*, argc + 1);
    for (int i = 0; i < argc; i++) args[i] = g_strdup(argv[i]);

    GError* gerror = nullptr;
    bool ok = g_option_context_parse_strv(context, &args, &gerror);
    if (!ok) {
        error = gerror ? gerror->message : "invalid arguments";
        if (gerror) g_error_free(gerror);
    }
    g_option_context_free(context);

    Options parsed;
    if (ok) {
        for (int i = 1; args[i]; i++) parsed.words.push_back(args[i]);
    }
    g_strfreev(args);
    if (configPath) {
        parsed.configPath = configPath;
        g_free(configPath);
    }
    parsed.verbose = verbose;
    if (!ok) return false;

    if (std::isnan(latitude) != std::isnan(longitude)) {
        error = "--lat and --lon must be given together";
        return false;
    }
    if (!std::isnan(latitude)) {
        if (!validCoordinates(latitude, longitude)) {
            error = "--lat must be within [-90, 90] and --lon within [-180, 180]";
            return false;
        }
        parsed.hasCoordinates = true;
        parsed.latitude = latitude;
        parsed.longitude = longitude;
    }

    options = parsed;
    return true;
}

std::string Application::readPlace(std::istream& in, std::ostream& prompt) {
    prompt << "City: " << std::flush;
    std::string input;
    std::getline(in, input);

    size_t start = input.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = input.find_last_not_of(" \t\r\n");
    return input.substr(start, end - start + 1);
}

std::unique_ptr<LocationSource> Application::selectLocationSource(const Options& options, const Config& config,
                                                                  std::istream& in, std::ostream& prompt) {
    if (options.hasCoordinates) {
        return std::make_unique<FixedLocationSource>(options.latitude, options.longitude);
    }

    if (options.words.empty() && config.hasFixedLocation()) {
        return std::make_unique<FixedLocationSource>(config.getLatitude(), config.getLongitude());
    }

    std::string query;
    for (const auto& word : options.words) {
        if (!query.empty()) query += " ";
        query += word;
    }
    if (query.empty()) query = readPlace(in, prompt);
    return std::make_unique<GeocodedLocationSource>(query);
}

bool Application::forecastWindow(GDateTime* now, int days, CivilDate& today, std::string& from, std::string& to) {
    GDateTime* until = g_date_time_add_days(now, days);
    if (!until) return false;

    gchar* start = g_date_time_format(now, kWindowFormat);
    gchar* end = g_date_time_format(until, kWindowFormat);
    g_date_time_unref(until);

    bool ok = start && end;
    if (ok) {
        g_date_time_get_ymd(now, &today.year, &today.month, &today.day);
        from = start;
        to = end;
    }
    g_free(start);
    g_free(end);
    return ok;
}

ExitCode Application::exitCodeFor(ForecastFailure failure) {
    switch (failure) {
        case ForecastFailure::None:      return ExitCode::Success;
        case ForecastFailure::Transport: return ExitCode::Transport;
        case ForecastFailure::Decode:    return ExitCode::Decode;
    }
    return ExitCode::Transport;
}

std::string Application::diagnosticFor(const ForecastResult& result) {
    if (result.failure == ForecastFailure::Decode) return "JSON error: " + result.error;
    return "Error: " + result.error;
}

int Application::run(int argc, char* argv[]) {
    Options options;
    std::string error;
    if (!parseOptions(argc, argv, options, error)) {
        err_ << error << std::endl;
        return static_cast<int>(ExitCode::Usage);
    }
    if (options.verbose) g_log_set_debug_enabled(TRUE);

    Config& config = Config::getInstance();
    if (!options.configPath.empty() && !config.load(options.configPath, error)) {
        err_ << "Config error: " << error << " (using defaults)" << std::endl;
    }

    auto source = selectLocationSource(options, config, in_, err_);
    LocationResult located = source->resolve();
    if (!located.success) {
        g_debug("location lookup failed: %s", located.error.c_str());
        err_ << "Could not find city: " << source->describe() << std::endl;
        return static_cast<int>(ExitCode::LocationNotFound);
    }

    CivilDate today;
    std::string dateFrom;
    std::string dateTo;
    GDateTime* now = g_date_time_new_now_local();
    bool windowOk = forecastWindow(now, config.getForecastDays(), today, dateFrom, dateTo);
    g_date_time_unref(now);
    if (!windowOk) {
        err_ << "Error: forecast window of " << config.getForecastDays() << " days is out of range" << std::endl;
        return static_cast<int>(ExitCode::Usage);
    }

    ForecastService forecast;
    ForecastResult fetched = forecast.fetch(located.location, dateFrom, dateTo);
    if (!fetched.success) {
        err_ << diagnosticFor(fetched) << std::endl;
        return static_cast<int>(exitCodeFor(fetched.failure));
    }

    auto days = ForecastAggregator::aggregate(fetched.observations, today);

    ReportRenderer renderer(out_);
    renderer.render(located.location.title, days, today);
    return static_cast<int>(ExitCode::Success);
}

} // namespace WeatherTerm
