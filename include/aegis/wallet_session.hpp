#ifndef AEGIS_WALLET_SESSION_HPP
#define AEGIS_WALLET_SESSION_HPP

#include <cstdint>
#include <functional>
#include <utility>

#include "capabilities.hpp"
#include "clock.hpp"
#include "lockout_policy.hpp"
#include "timer_queue.hpp"

/**
 * @file wallet_session.hpp
 * @brief Locked/unlocked session state, inactivity auto-lock and wallet reset.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    struct AutoLockConfig {
        std::int64_t timeoutMs = 300000;         // used until the user picks a timeout
        std::int64_t checkIntervalMs = 2000;
        std::int64_t hiddenGraceMs = 1000;       // negative: never lock on hide
    };

    enum class LockReason {
        manual,
        inactivity,
        hidden,
        reset
    };

    const char* toString(LockReason reason);

    /**
     * @class WalletSession
     * @brief Tracks whether the wallet is unlocked and locks it again.
     *
     * The session starts locked. The host calls unlocked() once the unlock
     * or creation flow finished; from then on the inactivity check runs every
     * checkIntervalMs until the wallet locks. Activity is whatever the host
     * reports through recordActivity().
     *
     * Single-threaded, like the flows: every call and timer callback runs on
     * the dispatch thread.
     */
    class WalletSession {
    public:
        using LockListener = std::function<void(LockReason)>;

        /**
         * @param backend Receives lockWallet() and resetWallet().
         * @param lockout Cleared by resetWallet().
         * @param timers Queue driven by the host loop.
         * @param clock Time source for the inactivity window.
         * @param settings Optional; holds the persisted auto-lock preferences.
         */
        WalletSession(WalletBackend& backend,
                      LockoutPolicy& lockout,
                      TimerQueue& timers,
                      const Clock& clock,
                      SettingsStore* settings = nullptr,
                      AutoLockConfig config = AutoLockConfig());

        ~WalletSession() = default;

        WalletSession(const WalletSession&) = delete;
        WalletSession& operator=(const WalletSession&) = delete;

        bool isLocked() const { return locked_; }

        /**
         * @brief The wallet was unlocked: record activity and start the inactivity check.
         */
        void unlocked();

        /**
         * @brief Lock now. Ignored when already locked.
         */
        void lock(LockReason reason = LockReason::manual);

        void recordActivity();
        std::int64_t lastActivityMs() const { return lastActivity_; }

        /**
         * @brief Auto-lock is enabled and more than the timeout passed since the last activity.
         */
        bool shouldAutoLock() const;

        /**
         * @brief Lock if unlocked and shouldAutoLock().
         * @return true if this call locked the wallet.
         */
        bool checkAutoLock();

        /**
         * @brief Report the app going to the background or returning.
         *
         * Hidden for longer than hiddenGraceMs locks the wallet, whatever the
         * auto-lock switch says. Returning runs the inactivity check at once.
         */
        void setVisible(bool visible);

        bool autoLockEnabled() const { return enabled_; }
        void setAutoLockEnabled(bool enabled);

        std::int64_t autoLockTimeoutMs() const { return timeoutMs_; }

        /**
         * @throw ConfigException If the timeout is not positive.
         */
        void setAutoLockTimeoutMs(std::int64_t timeoutMs);

        /**
         * @brief Forget the wallet on this device.
         *
         * Clears the lockout record first, so a storage failure leaves the
         * wallet untouched. Then the backend deletes the vault, the auto-lock
         * preferences return to their defaults and biometric unlock is turned
         * off. The session ends locked.
         *
         * @throw StorageException If the lockout record cannot be cleared.
         */
        void resetWallet();

        void setLockListener(LockListener listener) { listener_ = std::move(listener); }

    private:
        WalletBackend& backend_;
        LockoutPolicy& lockout_;
        ScopedTimers timers_;
        const Clock& clock_;
        SettingsStore* settings_;
        AutoLockConfig config_;

        bool locked_ = true;
        bool visible_ = true;
        bool enabled_ = true;
        std::int64_t timeoutMs_;
        std::int64_t lastActivity_;

        TimerId checkTimer_ = 0;
        TimerId hiddenTimer_ = 0;

        LockListener listener_;

        void loadPreferences();
        void scheduleCheck();
        void stopTimers();
    };

} // namespace Aegis

#endif // AEGIS_WALLET_SESSION_HPP
