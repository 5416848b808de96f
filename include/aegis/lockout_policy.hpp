#ifndef AEGIS_LOCKOUT_POLICY_HPP
#define AEGIS_LOCKOUT_POLICY_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "clock.hpp"
#include "security_state_store.hpp"

/**
 * @file lockout_policy.hpp
 * @brief Failed-attempt counter with escalating lockout windows.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    struct LockoutConfig {
        std::uint32_t maxFailedAttempts = 5;     // failures before the first lockout
        std::int64_t initialLockoutMs = 30000;
        std::int64_t maxLockoutMs = 3600000;
        std::uint32_t multiplier = 2;
    };

    /**
     * @brief Security state as seen by callers at a given instant.
     */
    struct SecurityState {
        std::uint32_t failedAttempts = 0;
        bool isLocked = false;
        std::uint64_t lockoutRemainingMs = 0;
        std::optional<std::int64_t> lockoutStartedAt;
    };

    /**
     * @class LockoutPolicy
     * @brief Rate limiter over the persisted SecurityRecord.
     *
     * The failure counter is reset by recordSuccess() or a wallet reset(). When a lockout
     * window expires the state reports unlocked, but the counter is kept, so
     * the next failure locks again straight away with a longer window.
     *
     * Every call reads the record from the store, so several policies (or
     * processes) sharing one store agree on the state.
     */
    class LockoutPolicy {
    public:
        LockoutPolicy(SecurityStateStore& store, const Clock& clock, LockoutConfig config = LockoutConfig());

        /**
         * @brief Current state, lock status derived from the clock.
         * @throw StorageException If the store cannot be read or repaired.
         */
        SecurityState currentState();

        bool isLocked() { return currentState().isLocked; }

        /**
         * @brief Count one failed credential attempt.
         *
         * No-op while locked: such attempts must have been rejected before
         * reaching credential comparison.
         *
         * @return State after the failure.
         * @throw StorageException If the new count cannot be persisted.
         */
        SecurityState recordFailure();

        /**
         * @brief Reset the counter and any lock, whatever the current state.
         * @throw StorageException If the reset cannot be persisted.
         */
        SecurityState recordSuccess();

        /**
         * @brief Discard the stored record without reading it, for a wallet reset.
         *
         * Unlike recordSuccess() this does not go through the fail-closed
         * repair, so a corrupt record is replaced by a fresh one.
         * @throw StorageException If the fresh record cannot be persisted.
         */
        SecurityState reset();

        /**
         * @brief Failures left before the next lockout (0 once the threshold is reached).
         */
        std::uint32_t remainingAttempts();

        /**
         * @brief Lockout window applied after the given number of failures.
         *
         * 0 below the threshold, then initialLockoutMs multiplied by
         * `multiplier` for every failure past the threshold, capped at
         * maxLockoutMs.
         */
        std::int64_t lockoutDuration(std::uint32_t failedAttempts) const;

        const LockoutConfig& config() const { return config_; }

        /**
         * @brief Human-readable lockout time, rounded up: "45 seconds", "2 minutes", "1 hour".
         */
        static std::string formatLockoutTime(std::uint64_t seconds);

    private:
        SecurityStateStore& store_;
        const Clock& clock_;
        LockoutConfig config_;

        SecurityState derive(const SecurityRecord& record) const;
        SecurityRecord failClosedRecord() const;
        SecurityRecord update(const RecordMutator& mutate);
    };

} // namespace Aegis

#endif // AEGIS_LOCKOUT_POLICY_HPP
