#ifndef AEGIS_TIMER_QUEUE_HPP
#define AEGIS_TIMER_QUEUE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <utility>

#include "clock.hpp"

/**
 * @file timer_queue.hpp
 * @brief Cancellable scheduled callbacks for the single-threaded flow actor.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    using TimerId = std::uint64_t;

    /**
     * @class TimerQueue
     * @brief Deadline-ordered callbacks, run from the host event loop.
     *
     * Nothing runs on its own: the host calls runDue() from its UI dispatch
     * thread (on every frame or tick), so callbacks execute on the same thread
     * as every other state transition.
     */
    class TimerQueue {
    public:
        explicit TimerQueue(const Clock& clock);

        TimerQueue(const TimerQueue&) = delete;
        TimerQueue& operator=(const TimerQueue&) = delete;

        /**
         * @brief Schedule a callback.
         * @param delayMs Delay from now; negative values are treated as 0.
         * @param callback Invoked once by runDue() after the delay elapsed.
         * @return Identifier usable with cancel().
         */
        TimerId schedule(std::int64_t delayMs, std::function<void()> callback);

        /**
         * @brief Cancel a pending callback.
         * @return true if the timer was pending.
         */
        bool cancel(TimerId id);

        bool isPending(TimerId id) const { return index_.count(id) != 0; }

        /**
         * @brief Run every callback whose deadline has passed, earliest first.
         *
         * Callbacks may schedule or cancel timers; a timer scheduled with a zero
         * delay from inside a callback runs in the same call.
         *
         * @return Number of callbacks run.
         */
        std::size_t runDue();

        std::size_t pending() const { return timers_.size(); }

        std::optional<std::int64_t> nextDeadline() const;

    private:
        using Key = std::pair<std::int64_t, TimerId>;

        const Clock& clock_;
        TimerId nextId_ = 1;
        std::map<Key, std::function<void()>> timers_;
        std::unordered_map<TimerId, std::int64_t> index_;
    };

    /**
     * @class ScopedTimers
     * @brief The set of timers owned by one flow; cancels them all on destruction.
     */
    class ScopedTimers {
    public:
        explicit ScopedTimers(TimerQueue& queue);
        ~ScopedTimers();

        ScopedTimers(const ScopedTimers&) = delete;
        ScopedTimers& operator=(const ScopedTimers&) = delete;

        TimerId schedule(std::int64_t delayMs, std::function<void()> callback);
        bool cancel(TimerId id);
        void cancelAll();

        std::size_t active() const { return owned_.size(); }

    private:
        TimerQueue& queue_;
        std::set<TimerId> owned_;
    };

} // namespace Aegis

#endif // AEGIS_TIMER_QUEUE_HPP
