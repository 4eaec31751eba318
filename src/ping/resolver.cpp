#include "resolver.hpp"

#include <netdb.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <system_error>
#include <thread>
#include <utility>

#include "../core/logger.hpp"

namespace sping {
namespace {
bool is_not_found(int rc) {
    if (rc == EAI_NONAME) return true;
#ifdef EAI_NODATA
    if (rc == EAI_NODATA) return true;
#endif
#ifdef EAI_ADDRFAMILY
    if (rc == EAI_ADDRFAMILY) return true;
#endif
    return false;
}
}  // namespace

const char* address_style_name(AddressStyle style) {
    switch (style) {
        case AddressStyle::Any: return "any";
        case AddressStyle::ForceIPv4: return "ipv4";
        case AddressStyle::ForceIPv6: return "ipv6";
    }
    return "?";
}

AddressStyle address_style_from_flags(bool force_v4, bool force_v6) {
    if (force_v4 && !force_v6) return AddressStyle::ForceIPv4;
    if (force_v6 && !force_v4) return AddressStyle::ForceIPv6;
    return AddressStyle::Any;
}

int system_lookup(const std::string& host, std::vector<Address>& out) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0) return rc;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_family != AF_INET && ai->ai_family != AF_INET6) continue;
        out.emplace_back(ai->ai_addr, ai->ai_addrlen);
    }
    ::freeaddrinfo(res);
    return 0;
}

bool select_address(const std::vector<Address>& candidates, AddressStyle style, Address& out,
                    Error& err) {
    if (candidates.empty()) {
        err = make_error(ErrorKind::Resolution, ErrorCode::HostNotFound);
        return false;
    }
    for (const auto& a : candidates) {
        if (style == AddressStyle::Any || (style == AddressStyle::ForceIPv4 && a.is_v4()) ||
            (style == AddressStyle::ForceIPv6 && a.is_v6())) {
            out = a;
            return true;
        }
    }
    err = make_error(ErrorKind::Resolution, ErrorCode::NoMatchingFamily, 0, address_style_name(style));
    return false;
}

Resolver::Resolver(Reactor& r, LookupFn lookup) : reactor_(r), lookup_(std::move(lookup)) {}

Resolver::~Resolver() { cancel(); }

bool Resolver::resolve(const std::string& host, AddressStyle style, const Callback& cb, Error& err) {
    cancel();
    auto pending = std::make_shared<Pending>();
    pending->efd.reset(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC));
    if (!pending->efd) {
        err = make_error(ErrorKind::Resolution, ErrorCode::LookupFailed, 0,
                         std::string("eventfd: ") + std::strerror(errno));
        return false;
    }
    if (!reactor_.add_fd(pending->efd.get(), EPOLLIN, [this](uint32_t) { on_complete(); })) {
        err = make_error(ErrorKind::Resolution, ErrorCode::LookupFailed, 0, "reactor registration failed");
        return false;
    }
    LookupFn lookup = lookup_;
    try {
        std::thread([pending, lookup, host]() {
            std::vector<Address> results;
            int rc = lookup(host, results);
            {
                std::lock_guard<std::mutex> lk(pending->mu);
                pending->rc = rc;
                pending->results = std::move(results);
                pending->done = true;
            }
            uint64_t one = 1;
            // The eventfd outlives any cancel() through the shared Pending.
            if (::write(pending->efd.get(), &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one))) {
                log(LogLevel::WARN, "resolver wakeup write failed");
            }
        }).detach();
    } catch (const std::system_error& e) {
        reactor_.del_fd(pending->efd.get());
        err = make_error(ErrorKind::Resolution, ErrorCode::LookupFailed, 0, e.what());
        return false;
    }
    pending_ = std::move(pending);
    host_ = host;
    style_ = style;
    cb_ = cb;
    log(LogLevel::DEBUG, "resolving " + host + " (" + address_style_name(style) + ")");
    return true;
}

void Resolver::cancel() {
    if (!pending_) return;
    reactor_.del_fd(pending_->efd.get());
    pending_.reset();
    cb_ = nullptr;
}

void Resolver::on_complete() {
    if (!pending_) return;
    uint64_t count = 0;
    if (::read(pending_->efd.get(), &count, sizeof(count)) != static_cast<ssize_t>(sizeof(count))) return;
    int rc = 0;
    std::vector<Address> results;
    {
        std::lock_guard<std::mutex> lk(pending_->mu);
        if (!pending_->done) return;
        rc = pending_->rc;
        results = std::move(pending_->results);
    }
    reactor_.del_fd(pending_->efd.get());
    pending_.reset();
    Callback cb = std::move(cb_);
    cb_ = nullptr;

    Address chosen;
    Error err;
    bool ok = false;
    if (rc != 0) {
        err = make_error(ErrorKind::Resolution,
                         is_not_found(rc) ? ErrorCode::HostNotFound : ErrorCode::LookupFailed, rc,
                         host_);
    } else {
        ok = select_address(results, style_, chosen, err);
        if (!ok && err.detail.empty()) err.detail = host_;
    }
    if (ok) {
        log(LogLevel::DEBUG, host_ + " resolved to " + chosen.to_string());
    } else {
        log(LogLevel::WARN, "resolution of " + host_ + " failed: " + err.message());
    }
    if (cb) cb(ok, chosen, err);
}
}  // namespace sping
