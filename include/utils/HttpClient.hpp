#pragma once
#include <string>

namespace WeatherTerm {

// Blocking GET over libcurl. One request per call, no retries.
class HttpClient {
public:
    HttpClient(const std::string& userAgent, long timeoutSeconds);
    ~HttpClient();

    struct Response {
        bool success = false;
        int statusCode = 0;     // 0 when no HTTP response arrived
        std::string body;
        std::string error;
    };

    Response get(const std::string& url) const;

    // Percent-encodes a query parameter value.
    static std::string escape(const std::string& value);

    // "<url>: HTTP <code>" for a non-2xx reply.
    static std::string statusError(const std::string& url, int statusCode);

private:
    static size_t appendBody(void* contents, size_t size, size_t nmemb, void* userp);

    std::string userAgent_;
    long timeoutSeconds_;
};

}
