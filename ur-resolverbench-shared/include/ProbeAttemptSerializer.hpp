#ifndef PROBE_ATTEMPT_SERIALIZER_HPP
#define PROBE_ATTEMPT_SERIALIZER_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace ResolverBench {
namespace Shared {

enum class ProbeOutcome {
    SUCCESS,
    TIMEOUT,
    UNREACHABLE,
    ERROR
};

// Result of one echo round against one target. Immutable once produced.
struct ProbeAttempt {
    std::string target_ip;
    int sequence_number;
    ProbeOutcome outcome;
    double rtt_ms;              // valid only for SUCCESS
    bool rejected;              // target refused at enqueue, no packet was sent
    std::string error_message;

    ProbeAttempt()
        : sequence_number(0),
          outcome(ProbeOutcome::ERROR),
          rtt_ms(0.0),
          rejected(false) {}

    static ProbeAttempt success(const std::string& ip, int sequence, double rtt) {
        ProbeAttempt a;
        a.target_ip = ip;
        a.sequence_number = sequence;
        a.outcome = ProbeOutcome::SUCCESS;
        a.rtt_ms = rtt;
        return a;
    }

    static ProbeAttempt failure(const std::string& ip, int sequence, ProbeOutcome outcome,
                                const std::string& message = "") {
        ProbeAttempt a;
        a.target_ip = ip;
        a.sequence_number = sequence;
        a.outcome = outcome;
        a.error_message = message;
        return a;
    }

    bool isSuccess() const { return outcome == ProbeOutcome::SUCCESS; }
};

// Folded view of all attempts against one target.
struct TargetSummary {
    std::string target_ip;
    std::string effective_country_code;
    std::vector<double> samples;    // successful RTTs ordered by sequence number
    int attempted_count;
    int failed_count;
    bool rejected;

    TargetSummary()
        : attempted_count(0),
          failed_count(0),
          rejected(false) {}

    bool isReachable() const { return !samples.empty(); }
};

class ProbeAttemptSerializer {
public:
    static std::string outcomeToString(ProbeOutcome outcome);
    static ProbeOutcome stringToOutcome(const std::string& outcome_str);

    static json serializeAttempt(const ProbeAttempt& attempt);
    static ProbeAttempt deserializeAttempt(const json& j);

    static json serializeSummary(const TargetSummary& summary);
    static TargetSummary deserializeSummary(const json& j);
};

} // namespace Shared
} // namespace ResolverBench

#endif // PROBE_ATTEMPT_SERIALIZER_HPP
