#include "services/LocationSource.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Config.hpp"
#include <json-glib/json-glib.h>

namespace WeatherTerm {

static const char* const kFixedTitle = "Overview";

// Nominatim returns coordinates as strings, e.g. "lat": "52.5170365"
static bool parseCoordinate(JsonObject* obj, const char* member, double& out) {
    if (!json_object_has_member(obj, member)) return false;
    JsonNode* node = json_object_get_member(obj, member);
    if (!JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_STRING) return false;

    const char* text = json_node_get_string(node);
    if (!text || !*text) return false;
    char* end = nullptr;
    double value = g_ascii_strtod(text, &end);
    if (end == text || *end != '\0') return false;
    out = value;
    return true;
}

static std::string firstSegment(const std::string& displayName) {
    std::string name = displayName.substr(0, displayName.find(','));
    size_t start = name.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = name.find_last_not_of(" \t\n\r");
    return name.substr(start, end - start + 1);
}

std::string formatCoordinate(double value) {
    char buf[G_ASCII_DTOSTR_BUF_SIZE];
    for (int decimals = 0; decimals <= 17; decimals++) {
        char format[8];
        g_snprintf(format, sizeof(format), "%%.%df", decimals);
        g_ascii_formatd(buf, sizeof(buf), format, value);
        if (g_ascii_strtod(buf, nullptr) == value) break;
    }
    return buf;
}

bool validCoordinates(double latitude, double longitude) {
    return latitude >= -90.0 && latitude <= 90.0 && longitude >= -180.0 && longitude <= 180.0;
}

GeocodedLocationSource::GeocodedLocationSource(const std::string& query) : query_(query) {}

std::string GeocodedLocationSource::buildUrl() const {
    return Config::getInstance().getGeocoderUrl() + "?q=" + HttpClient::escape(query_) +
           "&format=json&limit=1";
}

LocationResult GeocodedLocationSource::parseSearchResponse(const std::string& body) {
    LocationResult result;
    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_data(parser, body.c_str(), static_cast<gssize>(body.size()), &error)) {
        result.error = error ? error->message : "invalid JSON";
        if (error) g_error_free(error);
        g_object_unref(parser);
        return result;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_ARRAY(root)) {
        result.error = "search response is not an array";
        g_object_unref(parser);
        return result;
    }

    JsonArray* candidates = json_node_get_array(root);
    if (json_array_get_length(candidates) == 0) {
        result.error = "no candidates";
        g_object_unref(parser);
        return result;
    }

    JsonNode* firstNode = json_array_get_element(candidates, 0);
    if (!JSON_NODE_HOLDS_OBJECT(firstNode)) {
        result.error = "candidate is not an object";
        g_object_unref(parser);
        return result;
    }
    JsonObject* first = json_node_get_object(firstNode);

    Location location;
    if (!parseCoordinate(first, "lat", location.latitude) ||
        !parseCoordinate(first, "lon", location.longitude)) {
        result.error = "candidate has no usable coordinates";
        g_object_unref(parser);
        return result;
    }

    JsonNode* nameNode = json_object_has_member(first, "display_name")
                             ? json_object_get_member(first, "display_name") : nullptr;
    if (!nameNode || !JSON_NODE_HOLDS_VALUE(nameNode) || json_node_get_value_type(nameNode) != G_TYPE_STRING) {
        result.error = "candidate has no display_name";
        g_object_unref(parser);
        return result;
    }
    location.title = firstSegment(json_node_get_string(nameNode));

    g_object_unref(parser);
    result.success = true;
    result.location = location;
    return result;
}

LocationResult GeocodedLocationSource::resolve() {
    if (query_.empty()) {
        LocationResult result;
        result.error = "empty query";
        return result;
    }

    const Config& config = Config::getInstance();
    HttpClient client(config.getUserAgent(), config.getTimeoutSeconds());

    auto response = client.get(buildUrl());
    if (!response.success) {
        LocationResult result;
        result.error = response.error;
        return result;
    }

    LocationResult result = parseSearchResponse(response.body);
    if (result.success) {
        g_debug("resolved '%s' to %s (%f, %f)", query_.c_str(), result.location.title.c_str(),
                result.location.latitude, result.location.longitude);
    }
    return result;
}

FixedLocationSource::FixedLocationSource(double latitude, double longitude)
    : latitude_(latitude), longitude_(longitude) {}

LocationResult FixedLocationSource::resolve() {
    LocationResult result;
    result.success = true;
    result.location.latitude = latitude_;
    result.location.longitude = longitude_;
    result.location.title = kFixedTitle;
    return result;
}

std::string FixedLocationSource::describe() const {
    return formatCoordinate(latitude_) + ", " + formatCoordinate(longitude_);
}

}
