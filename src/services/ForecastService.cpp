#include "services/ForecastService.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Config.hpp"
#include <json-glib/json-glib.h>

namespace WeatherTerm {

static const char* const kDefaultCondition = "dry";

static bool holdsNumber(JsonNode* node) {
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) return false;
    GType type = json_node_get_value_type(node);
    return type == G_TYPE_DOUBLE || type == G_TYPE_INT64;
}

static bool holdsString(JsonNode* node) {
    return node && JSON_NODE_HOLDS_VALUE(node) && json_node_get_value_type(node) == G_TYPE_STRING;
}

static JsonNode* member(JsonObject* obj, const char* name) {
    return json_object_has_member(obj, name) ? json_object_get_member(obj, name) : nullptr;
}

static ForecastResult decodeFailure(const std::string& message) {
    ForecastResult result;
    result.failure = ForecastFailure::Decode;
    result.error = message;
    return result;
}

ForecastService::ForecastService() {}

std::string ForecastService::buildUrl(const Location& location, const std::string& from, const std::string& to) {
    return Config::getInstance().getForecastUrl() +
           "?lat=" + formatCoordinate(location.latitude) +
           "&lon=" + formatCoordinate(location.longitude) +
           "&date=" + HttpClient::escape(from) +
           "&last_date=" + HttpClient::escape(to);
}

ForecastResult ForecastService::parseResponse(const std::string& body) {
    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_data(parser, body.c_str(), static_cast<gssize>(body.size()), &error)) {
        std::string message = error ? error->message : "invalid JSON";
        if (error) g_error_free(error);
        g_object_unref(parser);
        return decodeFailure(message);
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_object_unref(parser);
        return decodeFailure("response is not an object");
    }

    JsonNode* weatherNode = member(json_node_get_object(root), "weather");
    if (!weatherNode || !JSON_NODE_HOLDS_ARRAY(weatherNode)) {
        g_object_unref(parser);
        return decodeFailure("missing field `weather`");
    }

    ForecastResult result;
    JsonArray* weather = json_node_get_array(weatherNode);
    guint count = json_array_get_length(weather);

    for (guint i = 0; i < count; i++) {
        std::string where = "weather[" + std::to_string(i) + "]";
        JsonNode* entryNode = json_array_get_element(weather, i);
        if (!JSON_NODE_HOLDS_OBJECT(entryNode)) {
            g_object_unref(parser);
            return decodeFailure(where + " is not an object");
        }
        JsonObject* entry = json_node_get_object(entryNode);

        HourlyObservation observation;

        JsonNode* timestamp = member(entry, "timestamp");
        if (!holdsString(timestamp)) {
            g_object_unref(parser);
            return decodeFailure(where + ": missing field `timestamp`");
        }
        if (!parseTimestamp(json_node_get_string(timestamp), observation.timestamp)) {
            std::string text = json_node_get_string(timestamp);
            g_object_unref(parser);
            return decodeFailure(where + ": malformed timestamp \"" + text + "\"");
        }

        JsonNode* temperature = member(entry, "temperature");
        if (!holdsNumber(temperature)) {
            g_object_unref(parser);
            return decodeFailure(where + ": missing field `temperature`");
        }
        observation.temperature = json_node_get_double(temperature);

        JsonNode* precipitation = member(entry, "precipitation_probability");
        if (holdsNumber(precipitation)) {
            observation.precipitationProbability = json_node_get_double(precipitation);
        } else if (precipitation && !JSON_NODE_HOLDS_NULL(precipitation)) {
            g_object_unref(parser);
            return decodeFailure(where + ": invalid `precipitation_probability`");
        }

        JsonNode* condition = member(entry, "condition");
        if (holdsString(condition)) {
            observation.condition = json_node_get_string(condition);
        } else if (!condition || JSON_NODE_HOLDS_NULL(condition)) {
            observation.condition = kDefaultCondition;
        } else {
            g_object_unref(parser);
            return decodeFailure(where + ": invalid `condition`");
        }

        result.observations.push_back(observation);
    }

    g_object_unref(parser);
    result.success = true;
    return result;
}

ForecastResult ForecastService::fetch(const Location& location, const std::string& from, const std::string& to) {
    const Config& config = Config::getInstance();
    HttpClient client(config.getUserAgent(), config.getTimeoutSeconds());

    auto response = client.get(buildUrl(location, from, to));
    if (!response.success) {
        ForecastResult result;
        result.failure = ForecastFailure::Transport;
        result.error = response.error;
        return result;
    }

    ForecastResult result = parseResponse(response.body);
    if (result.success) {
        g_debug("decoded %u hourly records", static_cast<unsigned>(result.observations.size()));
    }
    return result;
}

}
