#include "core/TimerService.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace reflex::core {

TimerHandle TimerService::schedule(Seconds delay, ClockKind clock, Callback callback) {
    if (delay < Seconds{0.0}) {
        throw std::invalid_argument("TimerService::schedule: negative delay");
    }
    if (!callback) {
        throw std::invalid_argument("TimerService::schedule: empty callback");
    }

    const TimerHandle handle = nextHandle_++;
    timers_.emplace(handle, Entry{clock, now(clock) + delay, std::move(callback)});
    return handle;
}

void TimerService::cancel(TimerHandle handle) noexcept {
    timers_.erase(handle);
}

void TimerService::advance(Seconds realDelta) {
    if (realDelta < Seconds{0.0}) {
        throw std::invalid_argument("TimerService::advance: negative delta");
    }

    const Seconds scaledStart = scaledNow_;
    const Seconds unscaledStart = unscaledNow_;
    const double scale = timeScale_;

    unscaledNow_ += realDelta;
    scaledNow_ += realDelta * scale;

    // Real-time offset within this step at which an entry became due.
    auto dueOffset = [&](const Entry& e) {
        double offset = 0.0;
        if (e.clock == ClockKind::Unscaled) {
            offset = (e.due - unscaledStart).count();
        } else if (scale > 0.0) {
            offset = (e.due - scaledStart).count() / scale;
        }
        return std::max(offset, 0.0);
    };

    // Pick one due timer at a time: a callback may cancel or schedule
    // others, so the pending set is re-read after every firing.
    while (true) {
        auto next = timers_.end();
        double nextOffset = 0.0;

        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            const Entry& e = it->second;
            if (e.due > now(e.clock)) {
                continue; // not due yet
            }
            const double offset = dueOffset(e);
            if (next == timers_.end() || offset < nextOffset) {
                next = it;
                nextOffset = offset;
            }
        }

        if (next == timers_.end()) {
            break;
        }

        Callback callback = std::move(next->second.callback);
        timers_.erase(next);
        callback();
    }
}

bool TimerService::isPending(TimerHandle handle) const noexcept {
    return timers_.find(handle) != timers_.end();
}

void TimerService::setTimeScale(double scale) {
    if (scale < 0.0) {
        throw std::invalid_argument("TimerService::setTimeScale: negative scale");
    }
    timeScale_ = scale;
}

} // namespace reflex::core
