#ifndef ICMP_PROBER_HPP
#define ICMP_PROBER_HPP

#include "Prober.hpp"
#include "../ur-resolverbench-shared/include/RunConfigSerializer.hpp"
#include <atomic>
#include <cstdint>
#include <string>

using ResolverBench::Shared::ProbeConfig;

/**
 * @brief Sends ICMP / ICMPv6 echo requests, one socket per attempt.
 *
 * Raw sockets need root or CAP_NET_RAW. Datagram sockets work unprivileged
 * where net.ipv4.ping_group_range allows it, but only observe echo replies:
 * ICMP errors are not delivered to them, so unreachable hosts time out.
 */
class IcmpProber : public Prober {
public:
    explicit IcmpProber(const ProbeConfig& config);

    ProbeAttempt probe(const Target& target, int sequence, int timeout_ms) override;

private:
    ProbeConfig config_;
    uint16_t identifier_base_;
    std::atomic<uint32_t> identifier_counter_;

    uint16_t nextIdentifier();
};

#endif // ICMP_PROBER_HPP
