#ifndef TARGET_SERIALIZER_HPP
#define TARGET_SERIALIZER_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace ResolverBench {
namespace Shared {

// One resolver from the input catalog. Identity is ip_address.
struct Target {
    std::string ip_address;
    std::string claimed_country_code;
    std::optional<std::string> resolved_country_code;
    std::string city;

    Target() = default;
    Target(const std::string& ip, const std::string& claimed, const std::string& city_name = "")
        : ip_address(ip), claimed_country_code(claimed), city(city_name) {}

    // Resolved country when reconciliation corrected it, claimed country otherwise.
    const std::string& effectiveCountryCode() const {
        return resolved_country_code ? *resolved_country_code : claimed_country_code;
    }

    bool wasCorrected() const { return resolved_country_code.has_value(); }
};

class TargetSerializer {
public:
    static json serializeTarget(const Target& target);
    static Target deserializeTarget(const json& j);

    static json serializeTargets(const std::vector<Target>& targets);
    static std::vector<Target> deserializeTargets(const json& j);
};

} // namespace Shared
} // namespace ResolverBench

#endif // TARGET_SERIALIZER_HPP
