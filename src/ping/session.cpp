#include "session.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <random>
#include <string>
#include <utility>

#include "../core/logger.hpp"
#include "../core/time_utils.hpp"

namespace sping {
namespace {
uint16_t make_identifier() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    return static_cast<uint16_t>(rng());
}

IcmpFamily family_of(const Address& a) {
    return a.is_v6() ? IcmpFamily::V6 : IcmpFamily::V4;
}
}  // namespace

const char* session_state_name(SessionState s) {
    switch (s) {
        case SessionState::Idle: return "idle";
        case SessionState::Resolving: return "resolving";
        case SessionState::Ready: return "ready";
        case SessionState::Stopped: return "stopped";
        case SessionState::Failed: return "failed";
    }
    return "?";
}

PingSession::PingSession(Reactor& r, PingEventSink& sink, SessionOptions opts)
    : PingSession(r, sink, opts, system_lookup, IcmpSocket::open) {}

PingSession::PingSession(Reactor& r, PingEventSink& sink, SessionOptions opts, LookupFn lookup,
                         SocketOpener opener)
    : reactor_(r),
      sink_(sink),
      opts_(opts),
      opener_(std::move(opener)),
      resolver_(r, std::move(lookup)) {
    identifier_ = opts_.fixed_identifier ? opts_.identifier : make_identifier();
}

PingSession::~PingSession() { teardown(); }

void PingSession::set_address_style(AddressStyle style) {
    if (state_ != SessionState::Idle) {
        log(LogLevel::WARN, "address style can only change before start");
        return;
    }
    style_ = style;
}

void PingSession::start(const std::string& host, AddressStyle style) {
    set_address_style(style);
    start(host);
}

void PingSession::start(const std::string& host) {
    if (state_ != SessionState::Idle) {
        log(LogLevel::WARN, std::string("start ignored in state ") + session_state_name(state_));
        return;
    }
    host_ = host;
    state_ = SessionState::Resolving;
    log(LogLevel::INFO, "session " + std::to_string(identifier_) + " resolving " + host_);
    Error err;
    auto done = [this](bool resolved, const Address& addr, const Error& e) {
        on_resolved(resolved, addr, e);
    };
    if (!resolver_.resolve(host_, style_, done, err)) fail(err);
}

void PingSession::on_resolved(bool ok, const Address& addr, const Error& err) {
    if (state_ != SessionState::Resolving) return;
    if (!ok) {
        fail(err);
        return;
    }
    address_ = addr;
    Error open_err;
    socket_ = opener_(address_, identifier_, open_err);
    if (!socket_) {
        fail(open_err);
        return;
    }
    if (socket_->identifier() != identifier_) {
        log(LogLevel::INFO, "identifier " + std::to_string(identifier_) + " replaced by socket identifier " +
                                std::to_string(socket_->identifier()));
        identifier_ = socket_->identifier();
    }
    if (!reactor_.add_fd(socket_->fd(), EPOLLIN, [this](uint32_t ev) { on_readable(ev); })) {
        fail(make_error(ErrorKind::Socket, ErrorCode::CreationFailed, 0, "reactor registration failed"));
        return;
    }
    state_ = SessionState::Ready;
    log(LogLevel::INFO, "pinging " + host_ + " at " + address_.to_string() + " (" + address_.family_name() + ")");
    sink_.on_started(address_);
    if (state_ != SessionState::Ready || opts_.send_interval_ms <= 0) return;

    periodic_sent_ = 0;
    on_tick();
    if (state_ != SessionState::Ready) return;
    if (opts_.send_count > 0 && periodic_sent_ >= opts_.send_count) return;
    if (!scheduler_.arm(reactor_, opts_.send_interval_ms, [this]() { on_tick(); })) {
        fail(make_error(ErrorKind::Socket, ErrorCode::CreationFailed, 0, "send timer"));
    }
}

void PingSession::on_tick() {
    send();
    ++periodic_sent_;
    if (opts_.send_count > 0 && periodic_sent_ >= opts_.send_count) scheduler_.cancel();
}

void PingSession::send(const Bytes* payload) {
    if (state_ != SessionState::Ready || !socket_) {
        log(LogLevel::WARN, std::string("send ignored in state ") + session_state_name(state_));
        return;
    }
    uint16_t seq = next_seq_++;
    uint64_t now = monotonic_ns();
    Bytes packet = encode_echo_request(socket_->family(), identifier_, seq,
                                       payload ? *payload : default_payload(now, opts_.payload_size));
    Error err;
    if (socket_->send(packet, address_, err)) {
        track(seq, now);
        sink_.on_sent(seq, packet);
    } else {
        log(LogLevel::WARN, "#" + std::to_string(seq) + " send failed: " + err.message());
        sink_.on_send_failed(seq, packet, err);
    }
}

void PingSession::on_readable(uint32_t) {
    if (state_ != SessionState::Ready || !socket_) return;
    Bytes datagram;
    Address from;
    Error err;
    switch (socket_->receive(datagram, from, err)) {
        case RecvStatus::Datagram:
            handle_datagram(datagram);
            break;
        case RecvStatus::WouldBlock:
            break;
        case RecvStatus::Transient:
            log(LogLevel::DEBUG, "receive: " + err.message());
            break;
        case RecvStatus::Fatal:
            fail(err);
            break;
    }
}

void PingSession::handle_datagram(const Bytes& datagram) {
    EchoReply reply;
    DecodeStatus status =
        decode_echo_reply(family_of(address_), datagram.data(), datagram.size(), reply);
    if (status == DecodeStatus::Ok && reply.identifier == identifier_) {
        auto it = outstanding_.find(reply.sequence);
        if (it != outstanding_.end()) {
            uint64_t rtt = monotonic_ns() - it->second.send_ns;
            outstanding_.erase(it);
            outstanding_order_.erase(
                std::find(outstanding_order_.begin(), outstanding_order_.end(), reply.sequence));
            sink_.on_received(reply.sequence, reply.icmp, rtt);
            return;
        }
        log(LogLevel::DEBUG, "#" + std::to_string(reply.sequence) + " reply not outstanding");
    } else if (status == DecodeStatus::Ok) {
        log(LogLevel::DEBUG, "reply for identifier " + std::to_string(reply.identifier));
    } else {
        Error err = make_error(ErrorKind::Decode, ErrorCode::Malformed, 0, decode_status_name(status));
        log(LogLevel::DEBUG, "datagram rejected: " + err.message());
    }
    sink_.on_unexpected_packet(datagram);
}

void PingSession::track(uint16_t seq, uint64_t send_ns) {
    if (outstanding_.erase(seq) != 0) {
        outstanding_order_.erase(
            std::find(outstanding_order_.begin(), outstanding_order_.end(), seq));
    }
    outstanding_[seq] = Outstanding{send_ns};
    outstanding_order_.push_back(seq);
    while (outstanding_order_.size() > opts_.outstanding_window) {
        outstanding_.erase(outstanding_order_.front());
        outstanding_order_.pop_front();
    }
}

void PingSession::teardown() {
    scheduler_.cancel();
    resolver_.cancel();
    if (socket_) {
        reactor_.del_fd(socket_->fd());
        socket_->close();
        socket_.reset();
    }
    outstanding_.clear();
    outstanding_order_.clear();
}

void PingSession::fail(const Error& err) {
    teardown();
    state_ = SessionState::Failed;
    log(LogLevel::ERROR, "session for " + host_ + " failed: " + err.message());
    sink_.on_failed(err);
}

void PingSession::stop() {
    if (state_ == SessionState::Stopped) return;
    teardown();
    if (state_ == SessionState::Ready || state_ == SessionState::Resolving) {
        log(LogLevel::INFO, "session for " + host_ + " stopped");
    }
    state_ = SessionState::Stopped;
}
}  // namespace sping
