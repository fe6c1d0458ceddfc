#include "../include/IpInfoProvider.hpp"
#include "../include/FilterUtils.hpp"
#include "../include/Logger.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

IpInfoProvider::IpInfoProvider(const std::string& base_url, const std::string& token, int timeout_ms)
    : base_url_(base_url), token_(token), timeout_ms_(timeout_ms) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string IpInfoProvider::buildUrl(const std::string& ip) const {
    return base_url_ + "/" + ip + "/json";
}

GeoLookupResult IpInfoProvider::lookup(const std::string& ip) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return GeoLookupResult::failed(GeoLookupError::TRANSPORT, "Failed to initialize CURL");
    }

    std::string url = buildUrl(ip);
    std::string response;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!token_.empty()) {
        std::string auth = "Authorization: Bearer " + token_;
        headers = curl_slist_append(headers, auth.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    LOG_DEBUG("[IpInfoProvider] GET " + url);

    CURLcode res = curl_easy_perform(curl);

    long http_status = 0;
    if (res == CURLE_OK) {
        res = curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return GeoLookupResult::failed(GeoLookupError::TRANSPORT,
                                       "HTTP GET failed: " + std::string(curl_easy_strerror(res)));
    }

    return parseResponse(http_status, response);
}

GeoLookupResult IpInfoProvider::parseResponse(long http_status, const std::string& body) {
    if (http_status == 429) {
        return GeoLookupResult::failed(GeoLookupError::QUOTA_EXCEEDED, "Rate limit or quota exceeded (HTTP 429)");
    }
    if (http_status == 404) {
        return GeoLookupResult::failed(GeoLookupError::NOT_FOUND, "Address not found (HTTP 404)");
    }
    if (http_status < 200 || http_status >= 300) {
        return GeoLookupResult::failed(GeoLookupError::TRANSPORT,
                                       "Unexpected HTTP status " + std::to_string(http_status));
    }

    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return GeoLookupResult::failed(GeoLookupError::MALFORMED_RESPONSE, "Response is not a JSON object");
    }

    if (j.contains("bogon") && j["bogon"].is_boolean() && j["bogon"].get<bool>()) {
        return GeoLookupResult::failed(GeoLookupError::NOT_FOUND, "Address is a bogon");
    }

    if (!j.contains("country") || !j["country"].is_string()) {
        return GeoLookupResult::failed(GeoLookupError::MALFORMED_RESPONSE, "Response has no country");
    }

    std::string country = to_upper(trim(j["country"].get<std::string>()));
    if (!is_country_code(country)) {
        return GeoLookupResult::failed(GeoLookupError::MALFORMED_RESPONSE,
                                       "Invalid country code '" + country + "'");
    }

    std::string city;
    if (j.contains("city") && j["city"].is_string()) {
        city = j["city"].get<std::string>();
    }

    return GeoLookupResult::found(country, city);
}
