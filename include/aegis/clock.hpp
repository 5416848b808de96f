#ifndef AEGIS_CLOCK_HPP
#define AEGIS_CLOCK_HPP

#include <cstdint>

/**
 * @file clock.hpp
 * @brief Time source shared by the lockout policy and the timer queue.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    /**
     * @class Clock
     * @brief Milliseconds since the Unix epoch.
     *
     * Wall-clock time is used because lockout deadlines are persisted and must
     * stay meaningful across a process restart.
     */
    class Clock {
    public:
        virtual ~Clock() = default;
        virtual std::int64_t nowMs() const = 0;
    };

    class SystemClock : public Clock {
    public:
        std::int64_t nowMs() const override;
    };

} // namespace Aegis

#endif // AEGIS_CLOCK_HPP
