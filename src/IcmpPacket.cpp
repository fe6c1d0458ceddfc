#include "../include/IcmpPacket.hpp"

namespace {

const uint8_t kIcmpEchoReply = 0;
const uint8_t kIcmpDestUnreach = 3;
const uint8_t kIcmpEchoRequest = 8;
const uint8_t kIcmpTimeExceeded = 11;

const uint8_t kIcmp6DestUnreach = 1;
const uint8_t kIcmp6TimeExceeded = 3;
const uint8_t kIcmp6EchoRequest = 128;
const uint8_t kIcmp6EchoReply = 129;

const size_t kIpv6HeaderSize = 40;

uint16_t read_be16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

void write_be16(uint8_t* p, uint16_t value) {
    p[0] = static_cast<uint8_t>(value >> 8);
    p[1] = static_cast<uint8_t>(value & 0xFF);
}

} // namespace

const size_t IcmpPacket::kHeaderSize;

uint16_t IcmpPacket::checksum(const uint8_t* data, size_t len) {
    uint32_t sum = 0;

    while (len > 1) {
        sum += read_be16(data);
        data += 2;
        len -= 2;
    }

    if (len == 1) {
        sum += static_cast<uint32_t>(data[0]) << 8;
    }

    sum = (sum >> 16) + (sum & 0xFFFF);
    sum += (sum >> 16);

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> IcmpPacket::buildEchoRequest(bool ipv6, uint16_t identifier,
                                                  uint16_t sequence, size_t payload_size) {
    std::vector<uint8_t> packet(kHeaderSize + payload_size, 0);

    packet[0] = ipv6 ? kIcmp6EchoRequest : kIcmpEchoRequest;
    packet[1] = 0;
    write_be16(&packet[4], identifier);
    write_be16(&packet[6], sequence);

    // Fill data with pattern
    for (size_t i = kHeaderSize; i < packet.size(); i++) {
        packet[i] = static_cast<uint8_t>(i & 0xFF);
    }

    if (!ipv6) {
        write_be16(&packet[2], checksum(packet.data(), packet.size()));
    }
    return packet;
}

bool IcmpPacket::readEchoIds(const uint8_t* icmp, size_t len, uint8_t expected_type,
                             uint16_t& identifier, uint16_t& sequence) {
    if (len < kHeaderSize || icmp[0] != expected_type) {
        return false;
    }
    identifier = read_be16(icmp + 4);
    sequence = read_be16(icmp + 6);
    return true;
}

IcmpReply IcmpPacket::parseReply(const uint8_t* data, size_t len, bool ipv6, bool has_ip_header) {
    IcmpReply reply;

    size_t offset = 0;
    if (!ipv6 && has_ip_header) {
        if (len < 20) {
            return reply;
        }
        offset = static_cast<size_t>(data[0] & 0x0F) * 4;
    }
    if (offset + kHeaderSize > len) {
        return reply;
    }

    const uint8_t* icmp = data + offset;
    size_t icmp_len = len - offset;
    reply.icmp_type = icmp[0];
    reply.icmp_code = icmp[1];

    uint8_t echo_reply = ipv6 ? kIcmp6EchoReply : kIcmpEchoReply;
    if (icmp[0] == echo_reply) {
        if (readEchoIds(icmp, icmp_len, echo_reply, reply.identifier, reply.sequence)) {
            reply.kind = IcmpReplyKind::ECHO_REPLY;
        }
        return reply;
    }

    bool is_error = ipv6 ? (icmp[0] == kIcmp6DestUnreach || icmp[0] == kIcmp6TimeExceeded)
                         : (icmp[0] == kIcmpDestUnreach || icmp[0] == kIcmpTimeExceeded);
    if (!is_error) {
        return reply;
    }

    // The error quotes the offending datagram: its IP header, then our echo request.
    const uint8_t* inner = icmp + kHeaderSize;
    size_t inner_len = icmp_len - kHeaderSize;
    size_t inner_ip_len = kIpv6HeaderSize;
    if (!ipv6) {
        if (inner_len < 20) {
            return reply;
        }
        inner_ip_len = static_cast<size_t>(inner[0] & 0x0F) * 4;
    }
    if (inner_ip_len + kHeaderSize > inner_len) {
        return reply;
    }

    uint8_t echo_request = ipv6 ? kIcmp6EchoRequest : kIcmpEchoRequest;
    if (readEchoIds(inner + inner_ip_len, inner_len - inner_ip_len, echo_request,
                    reply.identifier, reply.sequence)) {
        reply.kind = IcmpReplyKind::ERROR_REPORT;
    }
    return reply;
}
