#include "../include/GeoProvider.hpp"

std::string geo_error_to_string(GeoLookupError error) {
    switch (error) {
        case GeoLookupError::NONE:
            return "NONE";
        case GeoLookupError::TRANSPORT:
            return "TRANSPORT";
        case GeoLookupError::QUOTA_EXCEEDED:
            return "QUOTA_EXCEEDED";
        case GeoLookupError::NOT_FOUND:
            return "NOT_FOUND";
        case GeoLookupError::MALFORMED_RESPONSE:
        default:
            return "MALFORMED_RESPONSE";
    }
}
