#include "packet_codec.hpp"

#include <utility>

namespace sping {
namespace {
constexpr uint8_t kIpProtoIcmp = 1;

uint16_t read_be16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

void write_be16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v & 0xFF);
}

// Sum with the checksum field at bytes 2..3 taken as zero.
uint16_t checksum_with_zeroed_field(const uint8_t* data, size_t len) {
    uint32_t sum = 0;
    for (size_t i = 0; i + 1 < len; i += 2) {
        if (i == 2) continue;
        sum += read_be16(data + i);
    }
    if (len & 1) sum += static_cast<uint32_t>(data[len - 1]) << 8;
    while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return static_cast<uint16_t>(~sum);
}
}  // namespace

const char* decode_status_name(DecodeStatus s) {
    switch (s) {
        case DecodeStatus::Ok: return "ok";
        case DecodeStatus::Truncated: return "truncated";
        case DecodeStatus::BadIpHeader: return "bad_ip_header";
        case DecodeStatus::BadChecksum: return "bad_checksum";
        case DecodeStatus::NotEchoReply: return "not_echo_reply";
    }
    return "?";
}

uint8_t echo_request_type(IcmpFamily family) {
    return family == IcmpFamily::V4 ? kIcmpV4EchoRequest : kIcmpV6EchoRequest;
}

uint8_t echo_reply_type(IcmpFamily family) {
    return family == IcmpFamily::V4 ? kIcmpV4EchoReply : kIcmpV6EchoReply;
}

uint16_t internet_checksum(const uint8_t* data, size_t len) {
    uint32_t sum = 0;
    size_t i = 0;
    for (; i + 1 < len; i += 2) sum += read_be16(data + i);
    // Odd trailing byte is padded with a zero octet.
    if (i < len) sum += static_cast<uint32_t>(data[i]) << 8;
    while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return static_cast<uint16_t>(~sum);
}

Bytes encode_echo_request(IcmpFamily family, uint16_t identifier, uint16_t sequence,
                          const Bytes& payload) {
    Bytes pkt(kIcmpHeaderLen + payload.size(), 0);
    pkt[0] = echo_request_type(family);
    pkt[1] = 0;
    write_be16(&pkt[4], identifier);
    write_be16(&pkt[6], sequence);
    for (size_t i = 0; i < payload.size(); ++i) pkt[kIcmpHeaderLen + i] = payload[i];
    if (family == IcmpFamily::V4) {
        write_be16(&pkt[2], internet_checksum(pkt.data(), pkt.size()));
    }
    return pkt;
}

DecodeStatus parse_icmp_message(IcmpFamily family, const uint8_t* data, size_t len,
                                IcmpMessage& out) {
    if (data == nullptr || len < kIcmpHeaderLen) return DecodeStatus::Truncated;
    uint16_t received = read_be16(data + 2);
    if (family == IcmpFamily::V4 && checksum_with_zeroed_field(data, len) != received) {
        return DecodeStatus::BadChecksum;
    }
    out.type = data[0];
    out.code = data[1];
    out.checksum = received;
    out.identifier = read_be16(data + 4);
    out.sequence = read_be16(data + 6);
    out.payload.assign(data + kIcmpHeaderLen, data + len);
    return DecodeStatus::Ok;
}

DecodeStatus locate_icmp_in_ipv4(const uint8_t* data, size_t len, size_t& offset) {
    if (data == nullptr || len < kIpv4MinHeaderLen) return DecodeStatus::Truncated;
    if ((data[0] >> 4) != 4) return DecodeStatus::BadIpHeader;
    size_t ihl = static_cast<size_t>(data[0] & 0x0F) * 4;
    if (ihl < kIpv4MinHeaderLen) return DecodeStatus::BadIpHeader;
    if (data[9] != kIpProtoIcmp) return DecodeStatus::BadIpHeader;
    if (len < ihl + kIcmpHeaderLen) return DecodeStatus::Truncated;
    offset = ihl;
    return DecodeStatus::Ok;
}

DecodeStatus decode_echo_reply(IcmpFamily family, const uint8_t* data, size_t len,
                               EchoReply& out) {
    size_t offset = 0;
    if (family == IcmpFamily::V4) {
        DecodeStatus s = locate_icmp_in_ipv4(data, len, offset);
        if (s != DecodeStatus::Ok) return s;
    }
    IcmpMessage msg;
    DecodeStatus s = parse_icmp_message(family, data + offset, len - offset, msg);
    if (s != DecodeStatus::Ok) return s;
    if (msg.type != echo_reply_type(family) || msg.code != 0) return DecodeStatus::NotEchoReply;
    out.identifier = msg.identifier;
    out.sequence = msg.sequence;
    out.payload = std::move(msg.payload);
    out.icmp.assign(data + offset, data + len);
    return DecodeStatus::Ok;
}

Bytes default_payload(uint64_t timestamp_ns, size_t size) {
    Bytes out(size, 0);
    size_t i = 0;
    for (; i < size && i < 8; ++i) out[i] = static_cast<uint8_t>(timestamp_ns >> (56 - 8 * i));
    for (; i < size; ++i) out[i] = static_cast<uint8_t>(i);
    return out;
}
}  // namespace sping
