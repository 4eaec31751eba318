#include <cstdint>
#include <iostream>

#include "../src/ping/packet_codec.hpp"
#include "test_support.hpp"

using namespace sping;
using namespace sping_test;

static int test_checksum_reference_vector() {
    // RFC 1071 section 3 example.
    const uint8_t data[] = {0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7};
    if (internet_checksum(data, sizeof(data)) != 0x220d) return 1;
    return 0;
}

static int test_v4_request_layout() {
    Bytes pkt = encode_echo_request(IcmpFamily::V4, 0x1234, 0x0001, Bytes{0x61, 0x62});
    const Bytes want = {0x08, 0x00, 0x84, 0x68, 0x12, 0x34, 0x00, 0x01, 0x61, 0x62};
    if (pkt != want) return 1;
    // Odd payload length pads the last word with zero.
    Bytes odd = encode_echo_request(IcmpFamily::V4, 0x1234, 0x0001, Bytes{0x61});
    if (odd.size() != 9 || odd[2] != 0x84 || odd[3] != 0xca) return 2;
    return 0;
}

static int test_v6_request_layout() {
    Bytes pkt = encode_echo_request(IcmpFamily::V6, 0xBEEF, 0x0102, Bytes{1, 2, 3});
    const Bytes want = {0x80, 0x00, 0x00, 0x00, 0xBE, 0xEF, 0x01, 0x02, 1, 2, 3};
    return pkt == want ? 0 : 1;
}

static int test_round_trip() {
    struct Case {
        IcmpFamily family;
        uint16_t id;
        uint16_t seq;
        Bytes payload;
    };
    const Case cases[] = {
        {IcmpFamily::V4, 0, 0, Bytes{}},
        {IcmpFamily::V4, 0xFFFF, 0xFFFF, default_payload(123456789)},
        {IcmpFamily::V4, 7, 300, Bytes(1001, 0x5A)},
        {IcmpFamily::V6, 0x8001, 65535, Bytes{9, 8, 7}},
    };
    for (const auto& c : cases) {
        Bytes pkt = encode_echo_request(c.family, c.id, c.seq, c.payload);
        IcmpMessage msg;
        if (parse_icmp_message(c.family, pkt.data(), pkt.size(), msg) != DecodeStatus::Ok) return 1;
        if (msg.type != echo_request_type(c.family) || msg.code != 0) return 2;
        if (msg.identifier != c.id || msg.sequence != c.seq || msg.payload != c.payload) return 3;
    }
    return 0;
}

static int test_v4_single_bit_flip_is_detected() {
    Bytes icmp = make_icmp_v4(kIcmpV4EchoReply, 0, 0x4242, 17, default_payload(42));
    Bytes dgram = wrap_ipv4(icmp);
    EchoReply reply;
    if (decode_echo_reply(IcmpFamily::V4, dgram.data(), dgram.size(), reply) != DecodeStatus::Ok)
        return 1;
    const size_t ip_len = dgram.size() - icmp.size();
    for (size_t byte = ip_len; byte < dgram.size(); ++byte) {
        for (int bit = 0; bit < 8; ++bit) {
            Bytes corrupt = dgram;
            corrupt[byte] ^= static_cast<uint8_t>(1u << bit);
            if (decode_echo_reply(IcmpFamily::V4, corrupt.data(), corrupt.size(), reply) ==
                DecodeStatus::Ok)
                return 2;
        }
    }
    return 0;
}

static int test_v4_header_length_is_honoured() {
    // A 24-byte header (one word of options) in front of the reply.
    Bytes dgram = wrap_ipv4(make_icmp_v4(kIcmpV4EchoReply, 0, 99, 5, Bytes{1, 2, 3, 4}), 6);
    EchoReply reply;
    if (decode_echo_reply(IcmpFamily::V4, dgram.data(), dgram.size(), reply) != DecodeStatus::Ok)
        return 1;
    if (reply.identifier != 99 || reply.sequence != 5) return 2;
    if (reply.payload != Bytes({1, 2, 3, 4})) return 3;
    if (reply.icmp.size() != kIcmpHeaderLen + 4 || reply.icmp[0] != kIcmpV4EchoReply) return 4;
    return 0;
}

static int test_v4_rejections() {
    EchoReply reply;
    Bytes good = make_v4_reply_datagram(1, 1);

    Bytes short_ip(good.begin(), good.begin() + 19);
    if (decode_echo_reply(IcmpFamily::V4, short_ip.data(), short_ip.size(), reply) !=
        DecodeStatus::Truncated)
        return 1;

    Bytes short_icmp(good.begin(), good.begin() + 20 + 7);
    if (decode_echo_reply(IcmpFamily::V4, short_icmp.data(), short_icmp.size(), reply) !=
        DecodeStatus::Truncated)
        return 2;

    Bytes v6_version = good;
    v6_version[0] = 0x65;
    if (decode_echo_reply(IcmpFamily::V4, v6_version.data(), v6_version.size(), reply) !=
        DecodeStatus::BadIpHeader)
        return 3;

    Bytes tiny_ihl = good;
    tiny_ihl[0] = 0x44;
    if (decode_echo_reply(IcmpFamily::V4, tiny_ihl.data(), tiny_ihl.size(), reply) !=
        DecodeStatus::BadIpHeader)
        return 4;

    Bytes udp = good;
    udp[9] = 17;
    if (decode_echo_reply(IcmpFamily::V4, udp.data(), udp.size(), reply) != DecodeStatus::BadIpHeader)
        return 5;

    // Destination unreachable with a valid checksum.
    Bytes unreach = wrap_ipv4(make_icmp_v4(3, 1, 0, 0, Bytes(28, 0)));
    if (decode_echo_reply(IcmpFamily::V4, unreach.data(), unreach.size(), reply) !=
        DecodeStatus::NotEchoReply)
        return 6;

    // Our own request looped back on a raw socket.
    Bytes request = wrap_ipv4(encode_echo_request(IcmpFamily::V4, 1, 1, Bytes(8, 0)));
    if (decode_echo_reply(IcmpFamily::V4, request.data(), request.size(), reply) !=
        DecodeStatus::NotEchoReply)
        return 7;

    Bytes nonzero_code = wrap_ipv4(make_icmp_v4(kIcmpV4EchoReply, 1, 1, 1, Bytes{}));
    if (decode_echo_reply(IcmpFamily::V4, nonzero_code.data(), nonzero_code.size(), reply) !=
        DecodeStatus::NotEchoReply)
        return 8;
    return 0;
}

static int test_v6_decode() {
    EchoReply reply;
    Bytes icmp = make_v6_reply(0x0A0B, 0x0C0D, Bytes{5, 6});
    if (decode_echo_reply(IcmpFamily::V6, icmp.data(), icmp.size(), reply) != DecodeStatus::Ok)
        return 1;
    if (reply.identifier != 0x0A0B || reply.sequence != 0x0C0D || reply.payload != Bytes({5, 6}))
        return 2;
    if (reply.icmp != icmp) return 3;

    // The kernel owns the ICMPv6 checksum; any value is accepted.
    Bytes with_checksum = icmp;
    with_checksum[2] = 0x12;
    with_checksum[3] = 0x34;
    if (decode_echo_reply(IcmpFamily::V6, with_checksum.data(), with_checksum.size(), reply) !=
        DecodeStatus::Ok)
        return 4;

    Bytes request = encode_echo_request(IcmpFamily::V6, 1, 1, Bytes{});
    if (decode_echo_reply(IcmpFamily::V6, request.data(), request.size(), reply) !=
        DecodeStatus::NotEchoReply)
        return 5;

    // An ICMPv4 echo reply type value means nothing on an ICMPv6 socket.
    Bytes v4_type = icmp;
    v4_type[0] = kIcmpV4EchoReply;
    if (decode_echo_reply(IcmpFamily::V6, v4_type.data(), v4_type.size(), reply) !=
        DecodeStatus::NotEchoReply)
        return 6;

    if (decode_echo_reply(IcmpFamily::V6, icmp.data(), 7, reply) != DecodeStatus::Truncated) return 7;
    return 0;
}

static int test_decode_leaves_input_untouched() {
    Bytes dgram = make_v4_reply_datagram(3, 4);
    const Bytes copy = dgram;
    EchoReply reply;
    if (decode_echo_reply(IcmpFamily::V4, dgram.data(), dgram.size(), reply) != DecodeStatus::Ok)
        return 1;
    return dgram == copy ? 0 : 2;
}

static int test_default_payload() {
    Bytes p = default_payload(0x0102030405060708ULL);
    if (p.size() != kDefaultPayloadSize) return 1;
    if (p[0] != 0x01 || p[7] != 0x08) return 2;
    if (p[8] != 8 || p[55] != 55) return 3;
    if (default_payload(1, 4).size() != 4) return 4;
    return 0;
}

int main() {
    struct {
        const char* name;
        int (*fn)();
    } tests[] = {
        {"checksum_reference_vector", test_checksum_reference_vector},
        {"v4_request_layout", test_v4_request_layout},
        {"v6_request_layout", test_v6_request_layout},
        {"round_trip", test_round_trip},
        {"v4_single_bit_flip_is_detected", test_v4_single_bit_flip_is_detected},
        {"v4_header_length_is_honoured", test_v4_header_length_is_honoured},
        {"v4_rejections", test_v4_rejections},
        {"v6_decode", test_v6_decode},
        {"decode_leaves_input_untouched", test_decode_leaves_input_untouched},
        {"default_payload", test_default_payload},
    };
    int failures = 0;
    for (const auto& t : tests) {
        int rc = t.fn();
        if (rc != 0) {
            std::cerr << "FAIL " << t.name << " (" << rc << ")\n";
            ++failures;
        }
    }
    return failures == 0 ? 0 : 1;
}
