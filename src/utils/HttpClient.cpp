#include "utils/HttpClient.hpp"
#include <curl/curl.h>
#include <glib.h>

namespace WeatherTerm {

HttpClient::HttpClient(const std::string& userAgent, long timeoutSeconds)
    : userAgent_(userAgent), timeoutSeconds_(timeoutSeconds) {
    curl_global_init(CURL_GLOBAL_ALL);
}

HttpClient::~HttpClient() { curl_global_cleanup(); }

size_t HttpClient::appendBody(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string HttpClient::escape(const std::string& value) {
    char* escaped = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) return "";
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::string HttpClient::statusError(const std::string& url, int statusCode) {
    return url + ": HTTP " + std::to_string(statusCode);
}

HttpClient::Response HttpClient::get(const std::string& url) const {
    Response response;
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        response.error = url + ": " + curl_easy_strerror(res);
    } else {
        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);
        response.success = httpCode >= 200 && httpCode < 300;
        if (!response.success) response.error = statusError(url, response.statusCode);
    }
    curl_easy_cleanup(curl);

    g_debug("GET %s -> %d, %zu bytes", url.c_str(), response.statusCode, response.body.size());
    return response;
}

}
