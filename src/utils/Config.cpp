#include "utils/Config.hpp"
#include "services/LocationSource.hpp"
#include <json-glib/json-glib.h>

namespace WeatherTerm {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    settings_ = Settings();
}

static const long kMaxTimeoutSeconds = 3600;
static const int kMaxForecastDays = 16;

static bool readString(JsonObject* obj, const char* member, std::string& out) {
    if (!json_object_has_member(obj, member)) return false;
    JsonNode* node = json_object_get_member(obj, member);
    if (!JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_STRING) return false;
    out = json_node_get_string(node);
    return true;
}

static bool readNumber(JsonObject* obj, const char* member, double& out) {
    if (!json_object_has_member(obj, member)) return false;
    JsonNode* node = json_object_get_member(obj, member);
    if (!JSON_NODE_HOLDS_VALUE(node)) return false;
    GType type = json_node_get_value_type(node);
    if (type != G_TYPE_DOUBLE && type != G_TYPE_INT64) return false;
    out = json_node_get_double(node);
    return true;
}

static bool applyObject(JsonObject* obj, Settings& settings, std::string& error) {
    readString(obj, "geocoderUrl", settings.geocoderUrl);
    readString(obj, "forecastUrl", settings.forecastUrl);
    readString(obj, "userAgent", settings.userAgent);

    double number = 0.0;
    if (readNumber(obj, "timeoutSeconds", number)) {
        if (!(number >= 0 && number <= kMaxTimeoutSeconds)) {
            error = "timeoutSeconds must be between 0 and " + std::to_string(kMaxTimeoutSeconds);
            return false;
        }
        settings.timeoutSeconds = static_cast<long>(number);
    }
    if (readNumber(obj, "forecastDays", number)) {
        if (!(number >= 1 && number <= kMaxForecastDays)) {
            error = "forecastDays must be between 1 and " + std::to_string(kMaxForecastDays);
            return false;
        }
        settings.forecastDays = static_cast<int>(number);
    }

    double lat = 0.0, lon = 0.0;
    bool hasLat = readNumber(obj, "latitude", lat);
    bool hasLon = readNumber(obj, "longitude", lon);
    if (hasLat != hasLon) {
        error = "latitude and longitude must be given together";
        return false;
    }
    if (hasLat) {
        if (!validCoordinates(lat, lon)) {
            error = "coordinates out of range";
            return false;
        }
        settings.hasFixedLocation = true;
        settings.latitude = lat;
        settings.longitude = lon;
    }
    return true;
}

bool Config::loadFromData(const std::string& data, std::string& error) {
    JsonParser* parser = json_parser_new();
    GError* gerror = nullptr;

    if (!json_parser_load_from_data(parser, data.c_str(), static_cast<gssize>(data.size()), &gerror)) {
        error = gerror ? gerror->message : "invalid JSON";
        if (gerror) g_error_free(gerror);
        g_object_unref(parser);
        return false;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        error = "config root is not an object";
        g_object_unref(parser);
        return false;
    }

    Settings updated = settings_;
    bool ok = applyObject(json_node_get_object(root), updated, error);
    g_object_unref(parser);
    if (ok) settings_ = updated;
    return ok;
}

bool Config::load(const std::string& path, std::string& error) {
    gchar* contents = nullptr;
    gsize length = 0;
    GError* gerror = nullptr;

    if (!g_file_get_contents(path.c_str(), &contents, &length, &gerror)) {
        error = gerror ? gerror->message : "cannot read " + path;
        if (gerror) g_error_free(gerror);
        return false;
    }

    std::string data(contents, length);
    g_free(contents);
    g_debug("loading config from %s", path.c_str());
    return loadFromData(data, error);
}

}
