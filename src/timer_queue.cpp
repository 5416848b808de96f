#include "aegis/timer_queue.hpp"

#include <memory>

/**
 * @file timer_queue.cpp
 * @brief Implementation of TimerQueue and ScopedTimers.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    TimerQueue::TimerQueue(const Clock& clock)
        : clock_(clock) {}

    TimerId TimerQueue::schedule(std::int64_t delayMs, std::function<void()> callback) {
        if (delayMs < 0) delayMs = 0;

        TimerId id = nextId_++;
        std::int64_t deadline = clock_.nowMs() + delayMs;

        timers_.emplace(Key(deadline, id), std::move(callback));
        index_.emplace(id, deadline);
        return id;
    }

    bool TimerQueue::cancel(TimerId id) {
        auto it = index_.find(id);
        if (it == index_.end())
            return false;

        timers_.erase(Key(it->second, id));
        index_.erase(it);
        return true;
    }

    std::size_t TimerQueue::runDue() {
        std::size_t ran = 0;

        while (!timers_.empty()) {
            auto first = timers_.begin();
            if (first->first.first > clock_.nowMs())
                break;

            TimerId id = first->first.second;
            std::function<void()> callback = std::move(first->second);
            timers_.erase(first);
            index_.erase(id);

            if (callback) callback();
            ++ran;
        }

        return ran;
    }

    std::optional<std::int64_t> TimerQueue::nextDeadline() const {
        if (timers_.empty())
            return std::nullopt;
        return timers_.begin()->first.first;
    }

    ScopedTimers::ScopedTimers(TimerQueue& queue)
        : queue_(queue) {}

    ScopedTimers::~ScopedTimers() {
        cancelAll();
    }

    TimerId ScopedTimers::schedule(std::int64_t delayMs, std::function<void()> callback) {
        // The id is only known after scheduling; the wrapper reads it through a shared slot.
        auto slot = std::make_shared<TimerId>(0);
        TimerId id = queue_.schedule(delayMs, [this, slot, cb = std::move(callback)]() {
            owned_.erase(*slot);
            cb();
        });
        *slot = id;
        owned_.insert(id);
        return id;
    }

    bool ScopedTimers::cancel(TimerId id) {
        if (owned_.erase(id) == 0)
            return false;
        return queue_.cancel(id);
    }

    void ScopedTimers::cancelAll() {
        for (TimerId id : owned_)
            queue_.cancel(id);
        owned_.clear();
    }

} // namespace Aegis
