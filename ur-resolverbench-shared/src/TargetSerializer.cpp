#include "../include/TargetSerializer.hpp"

namespace ResolverBench {
namespace Shared {

json TargetSerializer::serializeTarget(const Target& target) {
    json j;
    j["ip_address"] = target.ip_address;
    j["claimed_country_code"] = target.claimed_country_code;
    if (target.resolved_country_code) {
        j["resolved_country_code"] = *target.resolved_country_code;
    } else {
        j["resolved_country_code"] = nullptr;
    }
    j["city"] = target.city;
    return j;
}

Target TargetSerializer::deserializeTarget(const json& j) {
    Target target;
    target.ip_address = j.value("ip_address", "");
    target.claimed_country_code = j.value("claimed_country_code", "");
    if (j.contains("resolved_country_code") && j["resolved_country_code"].is_string()) {
        target.resolved_country_code = j["resolved_country_code"].get<std::string>();
    }
    target.city = j.value("city", "");
    return target;
}

json TargetSerializer::serializeTargets(const std::vector<Target>& targets) {
    json arr = json::array();
    for (const auto& target : targets) {
        arr.push_back(serializeTarget(target));
    }
    return arr;
}

std::vector<Target> TargetSerializer::deserializeTargets(const json& j) {
    std::vector<Target> targets;
    if (!j.is_array()) {
        return targets;
    }
    for (const auto& item : j) {
        targets.push_back(deserializeTarget(item));
    }
    return targets;
}

} // namespace Shared
} // namespace ResolverBench
