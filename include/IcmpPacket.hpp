#ifndef ICMP_PACKET_HPP
#define ICMP_PACKET_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

enum class IcmpReplyKind {
    NONE,           // not an answer to any echo request
    ECHO_REPLY,
    ERROR_REPORT    // destination unreachable / time exceeded quoting our request
};

struct IcmpReply {
    IcmpReplyKind kind;
    uint16_t identifier;
    uint16_t sequence;
    uint8_t icmp_type;
    uint8_t icmp_code;

    IcmpReply()
        : kind(IcmpReplyKind::NONE),
          identifier(0),
          sequence(0),
          icmp_type(0),
          icmp_code(0) {}
};

// Wire encoding of ICMP / ICMPv6 echo messages.
class IcmpPacket {
public:
    static const size_t kHeaderSize = 8;

    // Internet checksum (RFC 1071).
    static uint16_t checksum(const uint8_t* data, size_t len);

    // ICMPv6 checksums are left zero; the kernel fills them in.
    static std::vector<uint8_t> buildEchoRequest(bool ipv6, uint16_t identifier,
                                                 uint16_t sequence, size_t payload_size);

    /**
     * @brief Classify a datagram read from an ICMP socket.
     * @param ipv6 Datagram came from an ICMPv6 socket (never carries an IP header)
     * @param has_ip_header Raw IPv4 sockets deliver the IPv4 header in front
     */
    static IcmpReply parseReply(const uint8_t* data, size_t len, bool ipv6, bool has_ip_header);

private:
    static bool readEchoIds(const uint8_t* icmp, size_t len, uint8_t expected_type,
                            uint16_t& identifier, uint16_t& sequence);
};

#endif // ICMP_PACKET_HPP
