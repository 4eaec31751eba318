#pragma once
#include <functional>

#include "fd.hpp"
#include "reactor.hpp"

namespace sping {
// Repeating timer on the reactor. The callback first fires one interval after
// arm(); cancel() guarantees no further firing, including one already pending.
class TimerScheduler {
   public:
    TimerScheduler();
    ~TimerScheduler();
    TimerScheduler(const TimerScheduler&) = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

    bool arm(Reactor& r, int interval_ms, const std::function<void()>& cb);
    void cancel();
    bool armed() const { return tfd_.valid(); }

   private:
    Reactor* reactor_{nullptr};
    Fd tfd_;
    std::function<void()> cb_;

    void on_expired();
};
}  // namespace sping
