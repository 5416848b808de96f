#include "aegis/wallet_session.hpp"

#include <spdlog/spdlog.h>

#include "aegis/exceptions.hpp"

/**
 * @file wallet_session.cpp
 * @brief Implementation of the WalletSession.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    const char* toString(LockReason reason) {
        switch (reason) {
            case LockReason::manual:     return "manual";
            case LockReason::inactivity: return "inactivity";
            case LockReason::hidden:     return "hidden";
            case LockReason::reset:      return "reset";
        }
        return "unknown";
    }

    WalletSession::WalletSession(WalletBackend& backend,
                                 LockoutPolicy& lockout,
                                 TimerQueue& timers,
                                 const Clock& clock,
                                 SettingsStore* settings,
                                 AutoLockConfig config)
        : backend_(backend),
          lockout_(lockout),
          timers_(timers),
          clock_(clock),
          settings_(settings),
          config_(config),
          timeoutMs_(config.timeoutMs),
          lastActivity_(clock.nowMs()) {
        loadPreferences();
    }

    void WalletSession::loadPreferences() {
        enabled_ = settings_ ? settings_->autoLockEnabled() : true;
        timeoutMs_ = config_.timeoutMs;

        if (settings_) {
            auto stored = settings_->autoLockTimeoutMs();
            if (stored && *stored > 0)
                timeoutMs_ = *stored;
            else if (stored)
                spdlog::warn("WalletSession: ignoring stored auto-lock timeout {} ms", *stored);
        }
    }

    void WalletSession::stopTimers() {
        timers_.cancelAll();
        checkTimer_ = hiddenTimer_ = 0;
    }

    void WalletSession::scheduleCheck() {
        if (checkTimer_ != 0)
            return;

        checkTimer_ = timers_.schedule(config_.checkIntervalMs, [this]() {
            checkTimer_ = 0;
            if (!checkAutoLock() && !locked_)
                scheduleCheck();
        });
    }

    void WalletSession::unlocked() {
        lastActivity_ = clock_.nowMs();
        if (!locked_)
            return;

        locked_ = false;
        scheduleCheck();
        spdlog::info("WalletSession: unlocked, auto-lock {} after {} ms",
                     enabled_ ? "on" : "off", timeoutMs_);
    }

    void WalletSession::lock(LockReason reason) {
        if (locked_)
            return;

        locked_ = true;
        stopTimers();
        backend_.lockWallet();

        spdlog::info("WalletSession: locked ({})", toString(reason));
        if (listener_) listener_(reason);
    }

    void WalletSession::recordActivity() {
        lastActivity_ = clock_.nowMs();
    }

    bool WalletSession::shouldAutoLock() const {
        if (!enabled_)
            return false;
        return clock_.nowMs() - lastActivity_ > timeoutMs_;
    }

    bool WalletSession::checkAutoLock() {
        if (locked_ || !shouldAutoLock())
            return false;

        lock(LockReason::inactivity);
        return true;
    }

    void WalletSession::setVisible(bool visible) {
        visible_ = visible;

        if (visible) {
            if (hiddenTimer_ != 0) {
                timers_.cancel(hiddenTimer_);
                hiddenTimer_ = 0;
            }
            checkAutoLock();
            return;
        }

        if (locked_ || config_.hiddenGraceMs < 0 || hiddenTimer_ != 0)
            return;

        hiddenTimer_ = timers_.schedule(config_.hiddenGraceMs, [this]() {
            hiddenTimer_ = 0;
            if (!visible_)
                lock(LockReason::hidden);
        });
    }

    void WalletSession::setAutoLockEnabled(bool enabled) {
        enabled_ = enabled;
        if (settings_) settings_->setAutoLockEnabled(enabled);
        spdlog::info("WalletSession: auto-lock {}", enabled ? "enabled" : "disabled");
    }

    void WalletSession::setAutoLockTimeoutMs(std::int64_t timeoutMs) {
        if (timeoutMs <= 0)
            throw ConfigException("WalletSession: auto-lock timeout must be positive, got "
                                  + std::to_string(timeoutMs));

        timeoutMs_ = timeoutMs;
        if (settings_) settings_->setAutoLockTimeoutMs(timeoutMs);
    }

    void WalletSession::resetWallet() {
        lockout_.reset();

        bool wasLocked = locked_;
        locked_ = true;
        visible_ = true;
        stopTimers();

        backend_.resetWallet();
        if (settings_) {
            settings_->clearAutoLock();
            settings_->setBiometricEnabled(false);
        }
        loadPreferences();
        lastActivity_ = clock_.nowMs();

        spdlog::warn("WalletSession: wallet reset, security state cleared");
        if (!wasLocked && listener_) listener_(LockReason::reset);
    }

} // namespace Aegis
