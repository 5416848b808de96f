#include "aegis/lockout_policy.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

/**
 * @file lockout_policy.cpp
 * @brief Implementation of the LockoutPolicy.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    namespace {

        std::string plural(std::uint64_t n, const char* unit) {
            std::string s = std::to_string(n) + " " + unit;
            if (n != 1) s += "s";
            return s;
        }
    }

    LockoutPolicy::LockoutPolicy(SecurityStateStore& store, const Clock& clock, LockoutConfig config)
        : store_(store), clock_(clock), config_(config) {
        if (config_.maxFailedAttempts == 0)
            config_.maxFailedAttempts = 1;
        if (config_.multiplier == 0)
            config_.multiplier = 1;
        if (config_.initialLockoutMs < 0)
            config_.initialLockoutMs = 0;
        if (config_.maxLockoutMs < 0)
            config_.maxLockoutMs = 0;
    }

    std::int64_t LockoutPolicy::lockoutDuration(std::uint32_t failedAttempts) const {
        if (failedAttempts < config_.maxFailedAttempts)
            return 0;

        const std::int64_t multiplier = config_.multiplier;
        std::int64_t duration = std::min(config_.initialLockoutMs, config_.maxLockoutMs);
        for (std::uint32_t i = config_.maxFailedAttempts; i < failedAttempts; ++i) {
            // duration * multiplier would pass the cap (or overflow)
            if (duration > config_.maxLockoutMs / multiplier)
                return config_.maxLockoutMs;
            duration *= multiplier;
        }
        return duration;
    }

    SecurityState LockoutPolicy::derive(const SecurityRecord& record) const {
        SecurityState state;
        state.failedAttempts = record.failedAttempts;
        state.lockoutStartedAt = record.lockoutStartedAt;

        if (record.lockoutStartedAt) {
            std::int64_t started = *record.lockoutStartedAt;
            std::int64_t duration = lockoutDuration(record.failedAttempts);
            std::int64_t until = started > std::numeric_limits<std::int64_t>::max() - duration
                ? std::numeric_limits<std::int64_t>::max()
                : started + duration;
            std::int64_t now = clock_.nowMs();
            if (now < until) {
                state.isLocked = true;
                state.lockoutRemainingMs = static_cast<std::uint64_t>(until - now);
            }
        }
        return state;
    }

    SecurityRecord LockoutPolicy::failClosedRecord() const {
        SecurityRecord record;
        record.failedAttempts = config_.maxFailedAttempts;
        record.lockoutStartedAt = clock_.nowMs();
        return record;
    }

    SecurityRecord LockoutPolicy::update(const RecordMutator& mutate) {
        try {
            return store_.update(mutate);
        }
        catch (const CorruptStateException& e) {
            // A torn or corrupted record must never read as "no failures"
            spdlog::error("LockoutPolicy: {}; restoring a locked state", e.what());
            SecurityRecord repaired = mutate(failClosedRecord());
            store_.overwrite(repaired);
            return repaired;
        }
    }

    SecurityState LockoutPolicy::currentState() {
        return derive(update([](const SecurityRecord& r) { return r; }));
    }

    SecurityState LockoutPolicy::recordFailure() {
        SecurityRecord record = update([this](const SecurityRecord& current) {
            if (derive(current).isLocked)
                return current;

            SecurityRecord next = current;
            next.failedAttempts = current.failedAttempts + 1;
            if (lockoutDuration(next.failedAttempts) > 0)
                next.lockoutStartedAt = clock_.nowMs();
            return next;
        });

        SecurityState state = derive(record);
        if (state.isLocked) {
            spdlog::warn("LockoutPolicy: locked after {} failed attempts for {} ms",
                         state.failedAttempts, state.lockoutRemainingMs);
        }
        else {
            spdlog::info("LockoutPolicy: failed attempt {} of {}", state.failedAttempts, config_.maxFailedAttempts);
        }
        return state;
    }

    SecurityState LockoutPolicy::recordSuccess() {
        SecurityRecord record = update([](const SecurityRecord&) { return SecurityRecord{}; });
        spdlog::debug("LockoutPolicy: counters reset");
        return derive(record);
    }

    SecurityState LockoutPolicy::reset() {
        SecurityRecord fresh;
        store_.overwrite(fresh);
        spdlog::warn("LockoutPolicy: security state cleared");
        return derive(fresh);
    }

    std::uint32_t LockoutPolicy::remainingAttempts() {
        std::uint32_t failed = currentState().failedAttempts;
        return failed >= config_.maxFailedAttempts ? 0 : config_.maxFailedAttempts - failed;
    }

    std::string LockoutPolicy::formatLockoutTime(std::uint64_t seconds) {
        if (seconds < 60)
            return plural(seconds, "second");
        if (seconds < 3600)
            return plural((seconds + 59) / 60, "minute");
        return plural((seconds + 3599) / 3600, "hour");
    }

} // namespace Aegis
