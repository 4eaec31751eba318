#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sping {
using Bytes = std::vector<uint8_t>;

enum class IcmpFamily { V4, V6 };

constexpr uint8_t kIcmpV4EchoReply = 0;
constexpr uint8_t kIcmpV4EchoRequest = 8;
constexpr uint8_t kIcmpV6EchoRequest = 128;
constexpr uint8_t kIcmpV6EchoReply = 129;

constexpr size_t kIcmpHeaderLen = 8;
constexpr size_t kIpv4MinHeaderLen = 20;
constexpr size_t kDefaultPayloadSize = 56;

// One ICMP/ICMPv6 message with an echo-style header. For non-echo types the
// identifier and sequence fields hold whatever the rest-of-header carries.
struct IcmpMessage {
    uint8_t type{0};
    uint8_t code{0};
    uint16_t checksum{0};
    uint16_t identifier{0};
    uint16_t sequence{0};
    Bytes payload;
};

struct EchoReply {
    uint16_t identifier{0};
    uint16_t sequence{0};
    Bytes payload;
    // The ICMP message itself, without any leading IP header.
    Bytes icmp;
};

enum class DecodeStatus { Ok, Truncated, BadIpHeader, BadChecksum, NotEchoReply };

const char* decode_status_name(DecodeStatus s);

uint8_t echo_request_type(IcmpFamily family);
uint8_t echo_reply_type(IcmpFamily family);

// RFC 1071 one's-complement checksum over len bytes, returned in host order.
uint16_t internet_checksum(const uint8_t* data, size_t len);

// Type 8/128, code 0, network-order identifier and sequence, payload. The
// checksum is filled in for V4 only; ICMPv6 leaves it to the kernel.
Bytes encode_echo_request(IcmpFamily family, uint16_t identifier, uint16_t sequence,
                          const Bytes& payload);

// Parses a bare ICMP message (no IP header). Checks the minimum length and, for
// V4, the checksum. Any type is accepted.
DecodeStatus parse_icmp_message(IcmpFamily family, const uint8_t* data, size_t len,
                                IcmpMessage& out);

// Returns the offset of the ICMP message in a V4 datagram by reading the IHL
// nibble, after checking version and protocol.
DecodeStatus locate_icmp_in_ipv4(const uint8_t* data, size_t len, size_t& offset);

// Decodes a datagram as received on a socket of the given family: V4 datagrams
// carry an IP header, V6 ones do not. Only echo replies with code 0 pass.
DecodeStatus decode_echo_reply(IcmpFamily family, const uint8_t* data, size_t len,
                               EchoReply& out);

// Default payload: 8-byte big-endian timestamp followed by an incrementing pattern.
Bytes default_payload(uint64_t timestamp_ns, size_t size = kDefaultPayloadSize);
}  // namespace sping
