#ifndef GEO_PROVIDER_HPP
#define GEO_PROVIDER_HPP

#include <string>

enum class GeoLookupError {
    NONE,
    TRANSPORT,
    QUOTA_EXCEEDED,
    NOT_FOUND,
    MALFORMED_RESPONSE
};

struct GeoLookupResult {
    bool success;
    std::string country_code;
    std::string city;
    GeoLookupError error;
    std::string error_message;

    GeoLookupResult()
        : success(false),
          error(GeoLookupError::NONE) {}

    static GeoLookupResult found(const std::string& country, const std::string& city_name = "") {
        GeoLookupResult r;
        r.success = true;
        r.country_code = country;
        r.city = city_name;
        return r;
    }

    static GeoLookupResult failed(GeoLookupError err, const std::string& message) {
        GeoLookupResult r;
        r.error = err;
        r.error_message = message;
        return r;
    }
};

std::string geo_error_to_string(GeoLookupError error);

// Country lookup by IP. Must be callable from several threads at once.
class GeoProvider {
public:
    virtual ~GeoProvider() = default;

    virtual GeoLookupResult lookup(const std::string& ip) = 0;
};

#endif // GEO_PROVIDER_HPP
