#include "reactor.hpp"
#include <sys/epoll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>
#include "logger.hpp"

namespace sping {
namespace {
uint64_t pack(int fd, uint32_t generation) {
    return (static_cast<uint64_t>(generation) << 32) | static_cast<uint32_t>(fd);
}
}  // namespace

Reactor::Reactor() : epoll_fd_(::epoll_create1(EPOLL_CLOEXEC)) {
    if (!epoll_fd_) log(LogLevel::ERROR, std::string("epoll_create1 failed: ") + std::strerror(errno));
}

Reactor::~Reactor() = default;

bool Reactor::add_fd(int fd, uint32_t events, const FdHandler& cb) {
    uint32_t gen = next_generation_++;
    if (next_generation_ == 0) next_generation_ = 1;
    struct epoll_event ev {};
    ev.events = events;
    ev.data.u64 = pack(fd, gen);
    if (::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_ADD, fd, &ev) < 0) {
        log(LogLevel::WARN, "epoll_ctl ADD fd=" + std::to_string(fd) + ": " + std::strerror(errno));
        return false;
    }
    handlers_[fd] = Registration{gen, cb};
    return true;
}

void Reactor::del_fd(int fd) {
    auto it = handlers_.find(fd);
    if (it == handlers_.end()) return;
    // The descriptor may already be closed, in which case the kernel dropped it.
    ::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_DEL, fd, nullptr);
    handlers_.erase(it);
}

int Reactor::loop_once(int timeout_ms) {
    struct epoll_event evs[32];
    int n = ::epoll_wait(epoll_fd_.get(), evs, 32, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) return 0;
        log(LogLevel::ERROR, std::string("epoll_wait failed: ") + std::strerror(errno));
        return -1;
    }
    int dispatched = 0;
    for (int i = 0; i < n; ++i) {
        int fd = static_cast<int>(static_cast<uint32_t>(evs[i].data.u64));
        uint32_t gen = static_cast<uint32_t>(evs[i].data.u64 >> 32);
        auto it = handlers_.find(fd);
        if (it == handlers_.end() || it->second.generation != gen) continue;
        // The handler may deregister itself; run a copy.
        FdHandler cb = it->second.handler;
        cb(evs[i].events);
        ++dispatched;
    }
    return dispatched;
}
}  // namespace sping
