#pragma once

#include <string>

namespace optval {

// Blocking libcurl GETs. One instance owns curl's global state.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Response body; throws DataFetchError on transport failure or a non-200 status
    std::string fetch(const std::string& url);

    // Fetch and write the body to filepath; failures are logged and return false
    bool downloadFile(const std::string& url, const std::string& filepath);

    void setTimeoutSeconds(long seconds) { timeout_seconds_ = seconds; }

private:
    long timeout_seconds_;
};

} // namespace optval
