#ifndef AEGIS_UNLOCK_STATE_MACHINE_HPP
#define AEGIS_UNLOCK_STATE_MACHINE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "capabilities.hpp"
#include "lockout_policy.hpp"
#include "secure_string.hpp"
#include "timer_queue.hpp"

/**
 * @file unlock_state_machine.hpp
 * @brief PIN and biometric unlock gated by the LockoutPolicy.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    enum class UnlockState {
        idle,
        entering,
        submitting,
        accepted,
        rejected,
        biometricPending
    };

    const char* toString(UnlockState state);

    struct UnlockConfig {
        std::size_t pinLength = 6;
        std::int64_t biometricTimeoutMs = 30000;
        std::int64_t biometricAutoTriggerMs = 600;   // negative disables the auto prompt
        std::int64_t shakeMs = 500;
        std::int64_t countdownTickMs = 1000;
        std::uint32_t resetOfferThreshold = 3;       // failures before "Forgot passcode?" is offered
        std::uint32_t warnRemainingAttempts = 2;
    };

    /**
     * @class UnlockStateMachine
     * @brief Orchestrates the unlock screen.
     *
     * idle -> entering -> submitting -> accepted | rejected, with
     * biometricPending reachable from idle. The lockout gate is checked before
     * every backend call, for PIN and biometric credentials alike; a locked
     * policy never lets a credential reach comparison.
     *
     * Single-threaded: every method, backend callback and timer callback must
     * run on the same dispatch thread.
     */
    class UnlockStateMachine {
    public:
        /**
         * @param backend Verifies credentials.
         * @param lockout Failure counter; shared with any other unlock surface.
         * @param timers Queue driven by the host loop.
         * @param biometric Optional; null means unavailable.
         * @param settings Optional; holds the persisted biometric flag.
         */
        UnlockStateMachine(WalletBackend& backend,
                           LockoutPolicy& lockout,
                           TimerQueue& timers,
                           std::shared_ptr<BiometricCapability> biometric = nullptr,
                           SettingsStore* settings = nullptr,
                           UnlockConfig config = UnlockConfig());

        ~UnlockStateMachine();

        UnlockStateMachine(const UnlockStateMachine&) = delete;
        UnlockStateMachine& operator=(const UnlockStateMachine&) = delete;

        /**
         * @brief Screen shown: read the biometric flag, start the lockout
         * countdown if locked, or schedule the automatic biometric prompt.
         */
        void start();

        /**
         * @brief Append a digit. Ignored while locked, while a credential is
         * being verified and after acceptance. Submits automatically once the
         * PIN is complete.
         */
        void pressDigit(char digit);

        void pressDelete();

        /**
         * @brief Prompt for biometrics. Only from idle; rejected while locked.
         */
        void requestBiometric();

        /**
         * @brief Cancel all timers, wipe the partial PIN and drop any pending callback.
         * Idempotent; also run by the destructor.
         */
        void teardown();

        UnlockState state() const { return state_; }
        std::size_t enteredLength() const { return pin_.size(); }
        bool isShaking() const { return shaking_; }

        const std::optional<FlowError>& lastError() const { return lastError_; }
        void clearError() { lastError_.reset(); }

        bool isLocked();
        std::uint64_t lockoutSecondsRemaining();
        std::uint32_t remainingAttemptsBeforeLockout();

        /**
         * @brief Whether to offer the "forgot passcode" wallet reset.
         */
        bool shouldOfferReset();

        bool biometricEnabled() const { return biometricEnabled_; }
        bool biometricAvailable();

        void setStateListener(std::function<void(UnlockState)> listener) { listener_ = std::move(listener); }

    private:
        WalletBackend& backend_;
        LockoutPolicy& lockout_;
        ScopedTimers timers_;
        std::shared_ptr<BiometricCapability> biometric_;
        SettingsStore* settings_;
        UnlockConfig config_;

        UnlockState state_ = UnlockState::idle;
        secure_string pin_;
        std::optional<FlowError> lastError_;
        std::function<void(UnlockState)> listener_;

        bool biometricEnabled_ = false;
        bool shaking_ = false;
        bool tornDown_ = false;

        TimerId shakeTimer_ = 0;
        TimerId countdownTimer_ = 0;
        TimerId biometricTimer_ = 0;
        TimerId autoPromptTimer_ = 0;

        std::uint64_t submission_ = 0;
        std::uint64_t biometricAttempt_ = 0;

        // Expires on teardown so late backend or biometric callbacks are dropped
        std::shared_ptr<bool> alive_;

        void transition(UnlockState next);
        bool gateLocked();
        void submit(secure_string credential);
        void onVerified(std::uint64_t submission, BackendStatus status);
        void reject(const FlowError& error, bool locked);
        void scheduleCountdown();
        void onCountdownTick();
        void onBiometricResult(std::uint64_t attempt, BiometricResult result);
        void onBiometricTimeout(std::uint64_t attempt);
        void cancelTimer(TimerId& id);
        std::string biometricName() const;
        std::string lockoutMessage(std::uint64_t remainingMs) const;
    };

} // namespace Aegis

#endif // AEGIS_UNLOCK_STATE_MACHINE_HPP
