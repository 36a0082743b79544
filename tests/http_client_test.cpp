#include <glib.h>
#include <string>
#include "utils/HttpClient.hpp"

using namespace WeatherTerm;

static void testEscape() {
    g_assert_cmpstr(HttpClient::escape("New York").c_str(), ==, "New%20York");
    g_assert_cmpstr(HttpClient::escape("2026-10-19T14:00").c_str(), ==, "2026-10-19T14%3A00");
    g_assert_cmpstr(HttpClient::escape("Zürich").c_str(), ==, "Z%C3%BCrich");
    g_assert_cmpstr(HttpClient::escape("").c_str(), ==, "");
}

static void testStatusError() {
    g_assert_cmpstr(HttpClient::statusError("https://api.brightsky.dev/weather", 404).c_str(), ==,
                    "https://api.brightsky.dev/weather: HTTP 404");
}

static void testRefusedConnection() {
    // Nothing listens on port 1; curl fails before any HTTP exchange.
    HttpClient client("weatherterm-test", 5);
    std::string url = "http://127.0.0.1:1/weather";
    HttpClient::Response response = client.get(url);
    g_assert_false(response.success);
    g_assert_cmpint(response.statusCode, ==, 0);
    g_assert_true(response.body.empty());
    g_assert_true(response.error.rfind(url + ": ", 0) == 0);
}

int main(int argc, char* argv[]) {
    g_test_init(&argc, &argv, nullptr);
    g_test_add_func("/http/escape", testEscape);
    g_test_add_func("/http/status-error", testStatusError);
    g_test_add_func("/http/refused-connection", testRefusedConnection);
    return g_test_run();
}
