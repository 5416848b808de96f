#include "aegis/unlock_state_machine.hpp"

#include <spdlog/spdlog.h>

/**
 * @file unlock_state_machine.cpp
 * @brief Implementation of the UnlockStateMachine.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    namespace {

        const char* const BIOMETRIC_REASON = "Unlock your wallet";

        std::uint64_t ceilSeconds(std::uint64_t ms) {
            return (ms + 999) / 1000;
        }

        std::string attemptsLeft(std::uint32_t n) {
            return std::to_string(n) + (n == 1 ? " attempt" : " attempts") + " remaining";
        }
    }

    const char* toString(UnlockState state) {
        switch (state) {
            case UnlockState::idle:             return "idle";
            case UnlockState::entering:         return "entering";
            case UnlockState::submitting:       return "submitting";
            case UnlockState::accepted:         return "accepted";
            case UnlockState::rejected:         return "rejected";
            case UnlockState::biometricPending: return "biometricPending";
        }
        return "unknown";
    }

    UnlockStateMachine::UnlockStateMachine(WalletBackend& backend,
                                           LockoutPolicy& lockout,
                                           TimerQueue& timers,
                                           std::shared_ptr<BiometricCapability> biometric,
                                           SettingsStore* settings,
                                           UnlockConfig config)
        : backend_(backend),
          lockout_(lockout),
          timers_(timers),
          biometric_(std::move(biometric)),
          settings_(settings),
          config_(config),
          alive_(std::make_shared<bool>(true)) {
        biometricEnabled_ = settings_ ? settings_->biometricEnabled() : false;
    }

    UnlockStateMachine::~UnlockStateMachine() {
        teardown();
    }

    // ---------------------------------------------------------------------
    // Queries
    // ---------------------------------------------------------------------

    bool UnlockStateMachine::isLocked() {
        try {
            return lockout_.isLocked();
        }
        catch (const StorageException& e) {
            spdlog::error("UnlockStateMachine: security state unavailable: {}", e.what());
            return true;
        }
    }

    std::uint64_t UnlockStateMachine::lockoutSecondsRemaining() {
        try {
            return ceilSeconds(lockout_.currentState().lockoutRemainingMs);
        }
        catch (const StorageException& e) {
            spdlog::error("UnlockStateMachine: security state unavailable: {}", e.what());
            return 0;
        }
    }

    std::uint32_t UnlockStateMachine::remainingAttemptsBeforeLockout() {
        try {
            return lockout_.remainingAttempts();
        }
        catch (const StorageException& e) {
            spdlog::error("UnlockStateMachine: security state unavailable: {}", e.what());
            return 0;
        }
    }

    bool UnlockStateMachine::shouldOfferReset() {
        try {
            return lockout_.currentState().failedAttempts >= config_.resetOfferThreshold;
        }
        catch (const StorageException& e) {
            spdlog::error("UnlockStateMachine: security state unavailable: {}", e.what());
            return false;
        }
    }

    bool UnlockStateMachine::biometricAvailable() {
        return biometricEnabled_ && biometric_ && biometric_->isAvailable() && !isLocked();
    }

    std::string UnlockStateMachine::biometricName() const {
        return biometric_ ? biometric_->displayName() : std::string("Biometric");
    }

    std::string UnlockStateMachine::lockoutMessage(std::uint64_t remainingMs) const {
        return "Too many failed attempts. Try again in " + LockoutPolicy::formatLockoutTime(ceilSeconds(remainingMs));
    }

    // ---------------------------------------------------------------------
    // Transitions
    // ---------------------------------------------------------------------

    void UnlockStateMachine::transition(UnlockState next) {
        if (state_ == next) return;

        spdlog::debug("UnlockStateMachine: {} -> {}", toString(state_), toString(next));
        state_ = next;
        if (listener_) listener_(next);
    }

    void UnlockStateMachine::cancelTimer(TimerId& id) {
        if (id != 0) {
            timers_.cancel(id);
            id = 0;
        }
    }

    bool UnlockStateMachine::gateLocked() {
        SecurityState security;
        try {
            security = lockout_.currentState();
        }
        catch (const StorageException& e) {
            // Without a readable counter nothing may reach the backend
            spdlog::error("UnlockStateMachine: security state unavailable: {}", e.what());
            pin_.clear();
            lastError_ = FlowError{ErrorKind::backend, "Security check unavailable. Please try again."};
            return true;
        }

        if (!security.isLocked)
            return false;

        pin_.clear();
        lastError_ = FlowError{ErrorKind::lockout, lockoutMessage(security.lockoutRemainingMs)};
        scheduleCountdown();
        return true;
    }

    void UnlockStateMachine::start() {
        if (tornDown_) return;

        biometricEnabled_ = settings_ ? settings_->biometricEnabled() : false;

        if (gateLocked()) {
            spdlog::info("UnlockStateMachine: started while locked");
            return;
        }

        if (config_.biometricAutoTriggerMs >= 0 && biometricAvailable()) {
            autoPromptTimer_ = timers_.schedule(config_.biometricAutoTriggerMs, [this]() {
                autoPromptTimer_ = 0;
                if (state_ == UnlockState::idle)
                    requestBiometric();
            });
        }
    }

    void UnlockStateMachine::pressDigit(char digit) {
        if (tornDown_ || digit < '0' || digit > '9')
            return;

        if (state_ == UnlockState::submitting || state_ == UnlockState::biometricPending
            || state_ == UnlockState::accepted)
            return;

        if (gateLocked())
            return;

        if (state_ == UnlockState::rejected) {
            cancelTimer(shakeTimer_);
            shaking_ = false;
        }

        if (pin_.size() >= config_.pinLength)
            return;

        cancelTimer(autoPromptTimer_);
        pin_.push_back(digit);
        transition(UnlockState::entering);

        if (pin_.size() == config_.pinLength) {
            secure_string credential = std::move(pin_);
            pin_.clear();
            submit(std::move(credential));
        }
    }

    void UnlockStateMachine::pressDelete() {
        if (tornDown_ || state_ != UnlockState::entering)
            return;

        pin_.pop_back();
        lastError_.reset();
        if (pin_.empty())
            transition(UnlockState::idle);
    }

    void UnlockStateMachine::submit(secure_string credential) {
        transition(UnlockState::submitting);

        if (gateLocked()) {
            credential.clear();
            transition(UnlockState::idle);
            return;
        }

        lastError_.reset();
        std::uint64_t id = ++submission_;
        std::weak_ptr<bool> alive = alive_;

        backend_.unlockWallet(credential, [this, alive, id](BackendStatus status) {
            if (alive.expired()) return;
            onVerified(id, status);
        });

        credential.clear();
    }

    void UnlockStateMachine::onVerified(std::uint64_t submission, BackendStatus status) {
        if (submission != submission_ || state_ != UnlockState::submitting) {
            spdlog::debug("UnlockStateMachine: dropping stale verification result");
            return;
        }

        switch (status) {
            case BackendStatus::ok: {
                try {
                    lockout_.recordSuccess();
                }
                catch (const StorageException& e) {
                    spdlog::error("UnlockStateMachine: failed to reset security state: {}", e.what());
                }
                lastError_.reset();
                cancelTimer(countdownTimer_);
                spdlog::info("UnlockStateMachine: wallet unlocked");
                transition(UnlockState::accepted);
                return;
            }

            case BackendStatus::invalidCredential: {
                SecurityState security;
                try {
                    security = lockout_.recordFailure();
                }
                catch (const StorageException& e) {
                    spdlog::error("UnlockStateMachine: failed to record attempt: {}", e.what());
                    reject(FlowError{ErrorKind::backend, "Security check unavailable. Please try again."}, false);
                    return;
                }

                std::uint32_t max = lockout_.config().maxFailedAttempts;
                std::uint32_t remaining = security.failedAttempts >= max ? 0 : max - security.failedAttempts;

                std::string message = "Invalid PIN";
                if (security.isLocked)
                    message = lockoutMessage(security.lockoutRemainingMs);
                else if (remaining <= config_.warnRemainingAttempts)
                    message = "Invalid PIN. " + attemptsLeft(remaining);

                reject(FlowError{ErrorKind::credential, message}, security.isLocked);
                return;
            }

            case BackendStatus::weakPin:
            case BackendStatus::backendError:
                break;
        }

        spdlog::warn("UnlockStateMachine: backend failed to verify the credential");
        pin_.clear();
        lastError_ = FlowError{ErrorKind::backend, "Unable to unlock wallet. Please try again."};
        transition(UnlockState::idle);
    }

    void UnlockStateMachine::reject(const FlowError& error, bool locked) {
        pin_.clear();
        lastError_ = error;
        shaking_ = true;
        transition(UnlockState::rejected);

        cancelTimer(shakeTimer_);
        shakeTimer_ = timers_.schedule(config_.shakeMs, [this]() {
            shakeTimer_ = 0;
            shaking_ = false;
            if (state_ == UnlockState::rejected)
                transition(UnlockState::idle);
        });

        if (locked)
            scheduleCountdown();
    }

    // ---------------------------------------------------------------------
    // Lockout countdown
    // ---------------------------------------------------------------------

    void UnlockStateMachine::scheduleCountdown() {
        if (countdownTimer_ != 0 || tornDown_)
            return;

        countdownTimer_ = timers_.schedule(config_.countdownTickMs, [this]() {
            countdownTimer_ = 0;
            onCountdownTick();
        });
    }

    void UnlockStateMachine::onCountdownTick() {
        SecurityState security;
        try {
            security = lockout_.currentState();
        }
        catch (const StorageException& e) {
            spdlog::error("UnlockStateMachine: security state unavailable: {}", e.what());
            scheduleCountdown();
            return;
        }

        if (security.isLocked) {
            if (lastError_ && lastError_->kind != ErrorKind::backend)
                lastError_->message = lockoutMessage(security.lockoutRemainingMs);
            scheduleCountdown();
            return;
        }

        spdlog::info("UnlockStateMachine: lockout window elapsed");
        if (lastError_ && (lastError_->kind == ErrorKind::lockout || lastError_->kind == ErrorKind::credential))
            lastError_.reset();
        if (listener_) listener_(state_);
    }

    // ---------------------------------------------------------------------
    // Biometric path
    // ---------------------------------------------------------------------

    void UnlockStateMachine::requestBiometric() {
        if (tornDown_)
            return;

        if (state_ != UnlockState::idle) {
            spdlog::debug("UnlockStateMachine: biometric request ignored in state {}", toString(state_));
            return;
        }

        if (!biometricEnabled_ || !biometric_) {
            lastError_ = FlowError{ErrorKind::capability, biometricName() + " is not enabled. Enable it in Settings."};
            return;
        }

        if (!biometric_->isAvailable()) {
            lastError_ = FlowError{ErrorKind::capability, biometricName() + " is unavailable. Please use PIN."};
            return;
        }

        if (gateLocked())
            return;

        cancelTimer(autoPromptTimer_);
        lastError_.reset();

        std::uint64_t attempt = ++biometricAttempt_;
        transition(UnlockState::biometricPending);

        biometricTimer_ = timers_.schedule(config_.biometricTimeoutMs, [this, attempt]() {
            biometricTimer_ = 0;
            onBiometricTimeout(attempt);
        });

        std::weak_ptr<bool> alive = alive_;
        biometric_->authenticate(BIOMETRIC_REASON, [this, alive, attempt](BiometricResult result) {
            if (alive.expired()) {
                result.token.clear();
                return;
            }
            onBiometricResult(attempt, std::move(result));
        });
    }

    void UnlockStateMachine::onBiometricTimeout(std::uint64_t attempt) {
        if (attempt != biometricAttempt_ || state_ != UnlockState::biometricPending)
            return;

        // A result arriving after this point belongs to an abandoned prompt
        ++biometricAttempt_;
        biometric_->cancel();

        spdlog::warn("UnlockStateMachine: biometric prompt timed out");
        lastError_ = FlowError{ErrorKind::capability, biometricName() + " timed out. Please use PIN."};
        transition(UnlockState::idle);
    }

    void UnlockStateMachine::onBiometricResult(std::uint64_t attempt, BiometricResult result) {
        if (attempt != biometricAttempt_ || state_ != UnlockState::biometricPending) {
            result.token.clear();
            spdlog::debug("UnlockStateMachine: dropping stale biometric result");
            return;
        }

        cancelTimer(biometricTimer_);

        switch (result.outcome) {
            case BiometricOutcome::success:
                if (result.token.empty()) {
                    spdlog::warn("UnlockStateMachine: biometric succeeded without a credential; disabling biometric unlock");
                    biometricEnabled_ = false;
                    if (settings_) settings_->setBiometricEnabled(false);
                    lastError_ = FlowError{ErrorKind::capability,
                                           biometricName() + " not configured. Please re-enable in Settings."};
                    transition(UnlockState::idle);
                    return;
                }
                submit(std::move(result.token));
                return;

            case BiometricOutcome::cancelled:
                spdlog::debug("UnlockStateMachine: biometric prompt cancelled");
                transition(UnlockState::idle);
                return;

            case BiometricOutcome::unavailable:
                spdlog::warn("UnlockStateMachine: biometric capability unavailable");
                lastError_ = FlowError{ErrorKind::capability, biometricName() + " is unavailable. Please use PIN."};
                transition(UnlockState::idle);
                return;

            case BiometricOutcome::timeout:
                spdlog::warn("UnlockStateMachine: biometric capability reported a timeout");
                lastError_ = FlowError{ErrorKind::capability, biometricName() + " timed out. Please use PIN."};
                transition(UnlockState::idle);
                return;
        }
    }

    // ---------------------------------------------------------------------
    // Teardown
    // ---------------------------------------------------------------------

    void UnlockStateMachine::teardown() {
        if (tornDown_) return;
        tornDown_ = true;

        timers_.cancelAll();
        shakeTimer_ = countdownTimer_ = biometricTimer_ = autoPromptTimer_ = 0;

        // Invalidate callbacks first: cancel() may report synchronously
        alive_.reset();
        ++submission_;
        ++biometricAttempt_;

        if (state_ == UnlockState::biometricPending && biometric_)
            biometric_->cancel();

        pin_.clear();

        spdlog::debug("UnlockStateMachine: torn down in state {}", toString(state_));
    }

} // namespace Aegis
