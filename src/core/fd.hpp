#pragma once
#include <unistd.h>

#include <utility>

namespace sping {
// Sole owner of a descriptor: epoll instance, timerfd, eventfd or probe
// socket. Moves transfer ownership; the descriptor is closed on destruction,
// reset() or close(), whichever comes first, and never twice.
class Fd {
   public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { close(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& o) noexcept : fd_(std::exchange(o.fd_, -1)) {}
    Fd& operator=(Fd&& o) noexcept {
        if (this != &o) reset(std::exchange(o.fd_, -1));
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    explicit operator bool() const { return valid(); }

    // Closes the current descriptor, if any, and adopts fd.
    void reset(int fd = -1) {
        if (fd_ >= 0 && fd_ != fd) ::close(fd_);
        fd_ = fd;
    }
    void close() { reset(); }

   private:
    int fd_{-1};
};
}  // namespace sping
