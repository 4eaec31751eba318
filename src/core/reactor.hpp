#pragma once
#include <cstdint>
#include <functional>
#include <unordered_map>

#include "fd.hpp"

namespace sping {
using FdHandler = std::function<void(uint32_t)>;

// Single-threaded epoll loop. Every registration carries a generation so that
// readiness collected before del_fd() is never dispatched, not even to a later
// registration that reuses the same descriptor number.
class Reactor {
   public:
    Reactor();
    ~Reactor();
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    bool ok() const { return epoll_fd_.valid(); }
    bool add_fd(int fd, uint32_t events, const FdHandler& cb);
    void del_fd(int fd);
    bool watching(int fd) const { return handlers_.count(fd) != 0; }
    // Waits up to timeout_ms and dispatches what is ready. Returns the number of
    // handlers invoked, or -1 if epoll_wait failed.
    int loop_once(int timeout_ms);

   private:
    struct Registration {
        uint32_t generation;
        FdHandler handler;
    };

    Fd epoll_fd_;
    uint32_t next_generation_{1};
    std::unordered_map<int, Registration> handlers_;
};
}  // namespace sping
