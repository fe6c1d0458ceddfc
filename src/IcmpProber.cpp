#include "../include/IcmpProber.hpp"
#include "../include/AddressUtils.hpp"
#include "../include/IcmpPacket.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using ResolverBench::Shared::SocketType;

namespace {

class ScopedSocket {
public:
    explicit ScopedSocket(int fd) : fd_(fd) {}
    ~ScopedSocket() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    int fd() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

std::string errno_message(const std::string& what) {
    return what + ": " + std::string(strerror(errno));
}

} // namespace

IcmpProber::IcmpProber(const ProbeConfig& config)
    : config_(config),
      identifier_base_(static_cast<uint16_t>(getpid() & 0xFFFF)),
      identifier_counter_(0) {
}

uint16_t IcmpProber::nextIdentifier() {
    return static_cast<uint16_t>(identifier_base_ + identifier_counter_.fetch_add(1));
}

ProbeAttempt IcmpProber::probe(const Target& target, int sequence, int timeout_ms) {
    const std::string& ip = target.ip_address;

    sockaddr_storage addr;
    socklen_t addr_len;
    if (!parse_ip_address(ip, addr, addr_len)) {
        return ProbeAttempt::failure(ip, sequence, ProbeOutcome::ERROR, "Invalid IP address");
    }

    bool ipv6 = addr.ss_family == AF_INET6;
    bool datagram = config_.socket_type == SocketType::DGRAM;
    int sock_type = datagram ? SOCK_DGRAM : SOCK_RAW;

    ScopedSocket sock(ipv6 ? socket(AF_INET6, sock_type, IPPROTO_ICMPV6)
                           : socket(AF_INET, sock_type, IPPROTO_ICMP));
    if (!sock.valid()) {
        return ProbeAttempt::failure(ip, sequence, ProbeOutcome::ERROR,
                                     errno_message("Failed to create socket"));
    }

    int ttl = config_.ttl;
    int rc = ipv6 ? setsockopt(sock.fd(), IPPROTO_IPV6, IPV6_UNICAST_HOPS, &ttl, sizeof(ttl))
                  : setsockopt(sock.fd(), IPPROTO_IP, IP_TTL, &ttl, sizeof(ttl));
    if (rc < 0) {
        return ProbeAttempt::failure(ip, sequence, ProbeOutcome::ERROR,
                                     errno_message("Failed to set TTL"));
    }

    uint16_t identifier = nextIdentifier();
    uint16_t wire_sequence = static_cast<uint16_t>(sequence & 0xFFFF);
    std::vector<uint8_t> packet = IcmpPacket::buildEchoRequest(
        ipv6, identifier, wire_sequence, static_cast<size_t>(config_.packet_size));

    auto send_time = std::chrono::steady_clock::now();
    auto deadline = send_time + std::chrono::milliseconds(timeout_ms);

    ssize_t sent = sendto(sock.fd(), packet.data(), packet.size(), 0,
                          reinterpret_cast<sockaddr*>(&addr), addr_len);
    if (sent < 0 || static_cast<size_t>(sent) != packet.size()) {
        return ProbeAttempt::failure(ip, sequence, ProbeOutcome::ERROR,
                                     errno_message("Failed to send packet"));
    }

    std::vector<uint8_t> recv_buf(packet.size() + 1024);
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        int remaining_ms = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());

        pollfd pfd;
        pfd.fd = sock.fd();
        pfd.events = POLLIN;
        pfd.revents = 0;

        int poll_result = poll(&pfd, 1, remaining_ms > 0 ? remaining_ms : 1);
        if (poll_result < 0) {
            if (errno == EINTR) {
                continue;
            }
            return ProbeAttempt::failure(ip, sequence, ProbeOutcome::ERROR,
                                         errno_message("Failed to wait for reply"));
        }
        if (poll_result == 0) {
            continue;
        }

        sockaddr_storage from;
        socklen_t from_len = sizeof(from);
        ssize_t received = recvfrom(sock.fd(), recv_buf.data(), recv_buf.size(), 0,
                                    reinterpret_cast<sockaddr*>(&from), &from_len);
        auto recv_time = std::chrono::steady_clock::now();
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return ProbeAttempt::failure(ip, sequence, ProbeOutcome::ERROR,
                                         errno_message("Failed to receive packet"));
        }

        IcmpReply reply = IcmpPacket::parseReply(recv_buf.data(), static_cast<size_t>(received),
                                                 ipv6, !ipv6 && !datagram);
        if (reply.kind == IcmpReplyKind::NONE || reply.sequence != wire_sequence) {
            continue;
        }
        // Datagram sockets get their identifier rewritten by the kernel and only
        // see their own replies.
        if (!datagram && reply.identifier != identifier) {
            continue;
        }

        if (reply.kind == IcmpReplyKind::ERROR_REPORT) {
            return ProbeAttempt::failure(ip, sequence, ProbeOutcome::UNREACHABLE,
                                         "ICMP error type " + std::to_string(reply.icmp_type) +
                                         " code " + std::to_string(reply.icmp_code) +
                                         " from " + address_to_string(from));
        }

        if (address_to_string(from) != address_to_string(addr)) {
            continue;
        }

        double rtt_ms = std::chrono::duration_cast<std::chrono::microseconds>(
                            recv_time - send_time).count() / 1000.0;
        return ProbeAttempt::success(ip, sequence, rtt_ms);
    }

    return ProbeAttempt::failure(ip, sequence, ProbeOutcome::TIMEOUT, "Timeout waiting for reply");
}
