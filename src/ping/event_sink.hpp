#pragma once
#include <cstdint>

#include "../core/errors.hpp"
#include "address.hpp"
#include "packet_codec.hpp"

namespace sping {
// Observer for one ping session. All callbacks run on the reactor thread and
// may call back into the session (send, stop).
class PingEventSink {
   public:
    virtual ~PingEventSink() = default;
    // Socket is open; the caller may begin sending.
    virtual void on_started(const Address& address) = 0;
    // The session is now inert.
    virtual void on_failed(const Error& error) = 0;
    virtual void on_sent(uint16_t sequence, const Bytes& packet) = 0;
    virtual void on_send_failed(uint16_t sequence, const Bytes& packet, const Error& error) = 0;
    // packet is the ICMP message without any IP header.
    virtual void on_received(uint16_t sequence, const Bytes& packet, uint64_t rtt_ns) = 0;
    // packet is the datagram exactly as received.
    virtual void on_unexpected_packet(const Bytes& packet) = 0;
};
}  // namespace sping
