#include "../include/ProbeAttemptSerializer.hpp"

namespace ResolverBench {
namespace Shared {

std::string ProbeAttemptSerializer::outcomeToString(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::SUCCESS:
            return "SUCCESS";
        case ProbeOutcome::TIMEOUT:
            return "TIMEOUT";
        case ProbeOutcome::UNREACHABLE:
            return "UNREACHABLE";
        case ProbeOutcome::ERROR:
        default:
            return "ERROR";
    }
}

ProbeOutcome ProbeAttemptSerializer::stringToOutcome(const std::string& outcome_str) {
    if (outcome_str == "SUCCESS") return ProbeOutcome::SUCCESS;
    if (outcome_str == "TIMEOUT") return ProbeOutcome::TIMEOUT;
    if (outcome_str == "UNREACHABLE") return ProbeOutcome::UNREACHABLE;
    return ProbeOutcome::ERROR;
}

json ProbeAttemptSerializer::serializeAttempt(const ProbeAttempt& attempt) {
    json j;
    j["target_ip"] = attempt.target_ip;
    j["sequence_number"] = attempt.sequence_number;
    j["outcome"] = outcomeToString(attempt.outcome);
    j["rtt_ms"] = attempt.rtt_ms;
    j["rejected"] = attempt.rejected;
    j["error_message"] = attempt.error_message;
    return j;
}

ProbeAttempt ProbeAttemptSerializer::deserializeAttempt(const json& j) {
    ProbeAttempt attempt;
    attempt.target_ip = j.value("target_ip", "");
    attempt.sequence_number = j.value("sequence_number", 0);
    attempt.outcome = stringToOutcome(j.value("outcome", "ERROR"));
    attempt.rtt_ms = j.value("rtt_ms", 0.0);
    attempt.rejected = j.value("rejected", false);
    attempt.error_message = j.value("error_message", "");
    return attempt;
}

json ProbeAttemptSerializer::serializeSummary(const TargetSummary& summary) {
    json j;
    j["target_ip"] = summary.target_ip;
    j["effective_country_code"] = summary.effective_country_code;
    j["samples"] = summary.samples;
    j["attempted_count"] = summary.attempted_count;
    j["failed_count"] = summary.failed_count;
    j["rejected"] = summary.rejected;
    return j;
}

TargetSummary ProbeAttemptSerializer::deserializeSummary(const json& j) {
    TargetSummary summary;
    summary.target_ip = j.value("target_ip", "");
    summary.effective_country_code = j.value("effective_country_code", "");
    if (j.contains("samples") && j["samples"].is_array()) {
        summary.samples = j["samples"].get<std::vector<double>>();
    }
    summary.attempted_count = j.value("attempted_count", 0);
    summary.failed_count = j.value("failed_count", 0);
    summary.rejected = j.value("rejected", false);
    return summary;
}

} // namespace Shared
} // namespace ResolverBench
