#ifndef IPINFO_PROVIDER_HPP
#define IPINFO_PROVIDER_HPP

#include "GeoProvider.hpp"
#include <string>

// ipinfo.io client over libcurl. curl_global_init() must have run before use.
class IpInfoProvider : public GeoProvider {
public:
    IpInfoProvider(const std::string& base_url, const std::string& token, int timeout_ms);

    GeoLookupResult lookup(const std::string& ip) override;

    // Maps an HTTP status and body to a lookup result.
    static GeoLookupResult parseResponse(long http_status, const std::string& body);

    std::string buildUrl(const std::string& ip) const;

private:
    std::string base_url_;
    std::string token_;
    int timeout_ms_;
};

#endif // IPINFO_PROVIDER_HPP
