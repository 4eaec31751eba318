#include "scheduler_timerfd.hpp"
#include <sys/epoll.h>
#include <sys/timerfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include "logger.hpp"

namespace sping {
TimerScheduler::TimerScheduler() = default;
TimerScheduler::~TimerScheduler() { cancel(); }

bool TimerScheduler::arm(Reactor& r, int interval_ms, const std::function<void()>& cb) {
    cancel();
    if (interval_ms <= 0) {
        log(LogLevel::ERROR, "timer interval must be positive");
        return false;
    }
    int fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        log(LogLevel::ERROR, std::string("timerfd_create failed: ") + std::strerror(errno));
        return false;
    }
    Fd tfd(fd);
    itimerspec its{};
    its.it_interval.tv_sec = interval_ms / 1000;
    its.it_interval.tv_nsec = (interval_ms % 1000) * 1000000L;
    its.it_value = its.it_interval;
    if (::timerfd_settime(fd, 0, &its, nullptr) < 0) {
        log(LogLevel::ERROR, std::string("timerfd_settime failed: ") + std::strerror(errno));
        return false;
    }
    if (!r.add_fd(fd, EPOLLIN, [this](uint32_t) { on_expired(); })) return false;
    reactor_ = &r;
    tfd_ = std::move(tfd);
    cb_ = cb;
    return true;
}

void TimerScheduler::on_expired() {
    uint64_t expirations = 0;
    ssize_t n = ::read(tfd_.get(), &expirations, sizeof(expirations));
    if (n != static_cast<ssize_t>(sizeof(expirations))) return;
    // Overruns collapse into a single callback; a missed tick is not replayed.
    // The callback may cancel this timer, so it runs from a copy.
    std::function<void()> cb = cb_;
    if (cb) cb();
}

void TimerScheduler::cancel() {
    if (!tfd_) return;
    if (reactor_) reactor_->del_fd(tfd_.get());
    tfd_.reset();
    reactor_ = nullptr;
    cb_ = nullptr;
}
}  // namespace sping
