#ifndef PROBER_HPP
#define PROBER_HPP

#include "../ur-resolverbench-shared/include/ProbeAttemptSerializer.hpp"
#include "../ur-resolverbench-shared/include/TargetSerializer.hpp"

using ResolverBench::Shared::ProbeAttempt;
using ResolverBench::Shared::ProbeOutcome;
using ResolverBench::Shared::Target;

// One echo round against one target. Implementations must be safe to call
// from several worker threads at once and must never throw.
class Prober {
public:
    virtual ~Prober() = default;

    virtual ProbeAttempt probe(const Target& target, int sequence, int timeout_ms) = 0;
};

#endif // PROBER_HPP
