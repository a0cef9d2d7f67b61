#include "http_client.hpp"
#include "logger.hpp"
#include "../core/errors.hpp"
#include <curl/curl.h>
#include <fstream>
#include <memory>

namespace optval {

namespace {

const char* kSource = "HttpClient";
const char* kUserAgent = "OptionsValidator/1.0";

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

size_t appendToString(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t bytes = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), bytes);
    return bytes;
}

} // namespace

HttpClient::HttpClient() : timeout_seconds_(30) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpClient::~HttpClient() {
    curl_global_cleanup();
}

std::string HttpClient::fetch(const std::string& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw DataFetchError("Failed to initialize CURL");
    }

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, kUserAgent);

    Logger::instance().debug(kSource, "GET " + url);
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw DataFetchError("Request to " + url + " failed: " + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        throw DataFetchError("Request to " + url + " returned HTTP " + std::to_string(status));
    }

    Logger::instance().debug(kSource, "Received " + std::to_string(body.size()) + " bytes");
    return body;
}

bool HttpClient::downloadFile(const std::string& url, const std::string& filepath) {
    std::string body;
    try {
        body = fetch(url);
    } catch (const DataFetchError& e) {
        Logger::instance().error(kSource, std::string("Failed to download: ") + e.what());
        return false;
    }

    std::ofstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        Logger::instance().error(kSource, "Cannot create file " + filepath);
        return false;
    }
    file << body;
    if (!file) {
        Logger::instance().error(kSource, "Failed writing " + filepath);
        return false;
    }

    Logger::instance().info(kSource, "Downloaded: " + url + " -> " + filepath);
    return true;
}

} // namespace optval
