#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include "core/logger.hpp"
#include "core/reactor.hpp"
#include "core/time_utils.hpp"
#include "ping/resolver.hpp"
#include "ping/session.hpp"

using namespace sping;

namespace {
volatile std::sig_atomic_t g_interrupted = 0;

void on_signal(int) { g_interrupted = 1; }

struct CliOptions {
    std::string host;
    bool force_v4{false};
    bool force_v6{false};
    int interval_ms{1000};
    int count{-1};
    size_t payload_size{kDefaultPayloadSize};
    LogLevel log_level{LogLevel::WARN};
};

// Prints one line per session event, the way the classic ping tool does.
class ConsolePrinter : public PingEventSink {
   public:
    void on_started(const Address& address) override {
        std::printf("pinging %s\n", address.to_string().c_str());
    }
    void on_failed(const Error& error) override {
        std::printf("failed: %s\n", error.message().c_str());
        failed_ = true;
    }
    void on_sent(uint16_t sequence, const Bytes&) override {
        std::printf("#%u sent\n", static_cast<unsigned>(sequence));
        ++sent_;
        last_send_ns_ = monotonic_ns();
    }
    void on_send_failed(uint16_t sequence, const Bytes&, const Error& error) override {
        std::printf("#%u send failed: %s\n", static_cast<unsigned>(sequence), error.message().c_str());
        ++sent_;
        last_send_ns_ = monotonic_ns();
    }
    void on_received(uint16_t sequence, const Bytes& packet, uint64_t rtt_ns) override {
        std::printf("#%u received, size=%zu time=%.3f ms\n", static_cast<unsigned>(sequence),
                    packet.size(), ns_to_ms(rtt_ns));
    }
    void on_unexpected_packet(const Bytes& packet) override {
        std::printf("unexpected packet, size=%zu\n", packet.size());
    }

    bool failed() const { return failed_; }
    int sent() const { return sent_; }
    uint64_t last_send_ns() const { return last_send_ns_; }

   private:
    bool failed_{false};
    int sent_{0};
    uint64_t last_send_ns_{0};
};

void print_usage(const char* prog) {
    std::cerr << "usage: " << prog
              << " [-4] [-6] [-i interval_ms] [-c count] [-s payload_bytes]"
                 " [--log-level debug|info|warn|error] host\n";
}

bool parse_int(const char* text, int min, int& out) {
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || v < min || v > 3600 * 1000L) return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_args(int argc, char** argv, CliOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        int v = 0;
        if (a == "-4") {
            opt.force_v4 = true;
        } else if (a == "-6") {
            opt.force_v6 = true;
        } else if (a == "-i" && i + 1 < argc) {
            if (!parse_int(argv[++i], 1, v)) return false;
            opt.interval_ms = v;
        } else if (a == "-c" && i + 1 < argc) {
            if (!parse_int(argv[++i], 1, v)) return false;
            opt.count = v;
        } else if (a == "-s" && i + 1 < argc) {
            if (!parse_int(argv[++i], 0, v) || v > 65507 - static_cast<int>(kIcmpHeaderLen)) return false;
            opt.payload_size = static_cast<size_t>(v);
        } else if (a == "--log-level" && i + 1 < argc) {
            if (!parse_log_level(argv[++i], opt.log_level)) return false;
        } else if (!a.empty() && a[0] == '-') {
            return false;
        } else if (opt.host.empty()) {
            opt.host = a;
        } else {
            return false;
        }
    }
    return !opt.host.empty();
}
}  // namespace

int main(int argc, char** argv) {
    CliOptions opt;
    if (!parse_args(argc, argv, opt)) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    set_log_level(opt.log_level);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    Reactor reactor;
    if (!reactor.ok()) return EXIT_FAILURE;

    ConsolePrinter printer;
    SessionOptions sopts;
    sopts.send_interval_ms = opt.interval_ms;
    sopts.send_count = opt.count > 0 ? opt.count : 0;
    sopts.payload_size = opt.payload_size;
    PingSession session(reactor, printer, sopts);
    session.start(opt.host, address_style_from_flags(opt.force_v4, opt.force_v6));

    const uint64_t linger_ns = static_cast<uint64_t>(opt.interval_ms) * 1000000ULL;
    while (!g_interrupted) {
        SessionState st = session.state();
        if (st == SessionState::Failed || st == SessionState::Stopped) break;
        if (opt.count > 0 && printer.sent() >= opt.count) {
            // Sending has ended; give the last request one interval to be answered.
            if (monotonic_ns() - printer.last_send_ns() >= linger_ns) break;
        }
        if (reactor.loop_once(200) < 0) break;
    }
    session.stop();
    return printer.failed() ? EXIT_FAILURE : EXIT_SUCCESS;
}
