#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>

#include "../core/errors.hpp"
#include "../core/reactor.hpp"
#include "../core/scheduler_timerfd.hpp"
#include "address.hpp"
#include "event_sink.hpp"
#include "packet_codec.hpp"
#include "probe_socket.hpp"
#include "resolver.hpp"

namespace sping {
enum class SessionState { Idle, Resolving, Ready, Stopped, Failed };

const char* session_state_name(SessionState s);

struct SessionOptions {
    // When positive the session sends the first request on entering Ready and
    // then one per interval; zero leaves every send to the caller.
    int send_interval_ms{0};
    // Periodic sending ends after this many requests; zero means no limit.
    int send_count{0};
    size_t payload_size{kDefaultPayloadSize};
    // Random per session unless pinned. The socket may replace it (an ICMPv6
    // ping socket asked for 0 uses a kernel-chosen port as identifier).
    bool fixed_identifier{false};
    uint16_t identifier{0};
    // Most recent requests still eligible for a reply.
    size_t outstanding_window{120};
};

// One ICMP echo session: Idle -> Resolving -> Ready -> Stopped | Failed.
// Owned by the caller; after stop() returns no further events are delivered.
class PingSession {
   public:
    PingSession(Reactor& r, PingEventSink& sink, SessionOptions opts = SessionOptions{});
    PingSession(Reactor& r, PingEventSink& sink, SessionOptions opts, LookupFn lookup,
                SocketOpener opener);
    ~PingSession();
    PingSession(const PingSession&) = delete;
    PingSession& operator=(const PingSession&) = delete;

    // Only honoured while Idle.
    void set_address_style(AddressStyle style);
    AddressStyle address_style() const { return style_; }

    void start(const std::string& host);
    void start(const std::string& host, AddressStyle style);
    void stop();
    // Sends one echo request; nullptr selects the default payload.
    void send(const Bytes* payload = nullptr);

    SessionState state() const { return state_; }
    const std::string& host() const { return host_; }
    const Address& address() const { return address_; }
    uint16_t identifier() const { return identifier_; }
    uint16_t next_sequence_number() const { return next_seq_; }
    size_t outstanding() const { return outstanding_.size(); }

   private:
    struct Outstanding {
        uint64_t send_ns;
    };

    Reactor& reactor_;
    PingEventSink& sink_;
    SessionOptions opts_;
    SocketOpener opener_;
    Resolver resolver_;
    TimerScheduler scheduler_;
    std::unique_ptr<ProbeSocket> socket_;

    std::string host_;
    AddressStyle style_{AddressStyle::Any};
    Address address_;
    SessionState state_{SessionState::Idle};
    uint16_t identifier_{0};
    uint16_t next_seq_{0};
    int periodic_sent_{0};
    std::unordered_map<uint16_t, Outstanding> outstanding_;
    std::deque<uint16_t> outstanding_order_;

    void on_resolved(bool ok, const Address& addr, const Error& err);
    void on_tick();
    void on_readable(uint32_t events);
    void handle_datagram(const Bytes& datagram);
    void track(uint16_t seq, uint64_t send_ns);
    void teardown();
    void fail(const Error& err);
};
}  // namespace sping
