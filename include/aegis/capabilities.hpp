#ifndef AEGIS_CAPABILITIES_HPP
#define AEGIS_CAPABILITIES_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "secure_string.hpp"

/**
 * @file capabilities.hpp
 * @brief Contracts of the collaborators the credential flows call into.
 * @author Aegis Project
 * @date 2026
 *
 * Implementations live in the host application. Every capability is passed
 * into the state machines explicitly; a missing (null) capability is the
 * "Unavailable" variant.
 */

namespace Aegis {

    // ---------------------------------------------------------------------
    // Wallet backend
    // ---------------------------------------------------------------------

    enum class BackendStatus {
        ok,
        weakPin,
        invalidCredential,
        backendError
    };

    struct CreateWalletResult {
        BackendStatus status = BackendStatus::backendError;
        secure_string mnemonic;     // set only when status == ok
    };

    using CreateWalletCallback = std::function<void(CreateWalletResult)>;
    using UnlockCallback = std::function<void(BackendStatus)>;

    /**
     * @class WalletBackend
     * @brief Key generation, vault encryption and credential verification.
     *
     * Calls may complete synchronously or later; either way the callback runs
     * on the flow's dispatch thread, exactly once.
     */
    class WalletBackend {
    public:
        virtual ~WalletBackend() = default;

        /**
         * @brief Generate a wallet and persist its encrypted vault under the PIN.
         * @param pin The confirmed PIN. Valid only for the duration of the call.
         * @param label Display name of the wallet.
         * @param done Receives ok + mnemonic, weakPin or backendError.
         */
        virtual void createWallet(const secure_string& pin, const std::string& label, CreateWalletCallback done) = 0;

        /**
         * @brief Verify a PIN or a biometric token.
         * @param credential Valid only for the duration of the call.
         * @param done Receives ok, invalidCredential or backendError.
         */
        virtual void unlockWallet(const secure_string& credential, UnlockCallback done) = 0;

        /**
         * @brief Mark the wallet unlocked for this session. Idempotent.
         */
        virtual void completeWalletSetup() = 0;

        /**
         * @brief Drop the decrypted wallet from memory. Idempotent.
         */
        virtual void lockWallet() = 0;

        /**
         * @brief Delete the encrypted vault and everything derived from it on this device.
         */
        virtual void resetWallet() = 0;
    };

    // ---------------------------------------------------------------------
    // Biometric capability
    // ---------------------------------------------------------------------

    enum class BiometricOutcome {
        success,
        cancelled,
        unavailable,
        timeout
    };

    struct BiometricResult {
        BiometricOutcome outcome = BiometricOutcome::unavailable;
        secure_string token;        // one-time credential, set only on success
    };

    using BiometricCallback = std::function<void(BiometricResult)>;

    class BiometricCapability {
    public:
        virtual ~BiometricCapability() = default;

        virtual bool isAvailable() const = 0;

        /**
         * @brief "Face ID", "Touch ID" or a generic label, for messages.
         */
        virtual std::string displayName() const { return "Biometric"; }

        /**
         * @brief Prompt the user. The token must never be cached by either side.
         */
        virtual void authenticate(const std::string& reason, BiometricCallback done) = 0;

        /**
         * @brief Abandon an outstanding prompt. Best effort.
         */
        virtual void cancel() {}
    };

    // ---------------------------------------------------------------------
    // Clipboard and settings
    // ---------------------------------------------------------------------

    /**
     * @class ClipboardCapability
     * @brief Best-effort clipboard. Failures are logged by the caller, never fatal.
     */
    class ClipboardCapability {
    public:
        virtual ~ClipboardCapability() = default;
        virtual bool write(const secure_string& text) = 0;
        virtual bool clear() = 0;
    };

    /**
     * @class SettingsStore
     * @brief Persisted user preferences of the credential flows.
     *
     * The biometric flag is read at flow start and written only on an explicit
     * user toggle, when a biometric unlock proves the capability is
     * misconfigured, or on a wallet reset.
     */
    class SettingsStore {
    public:
        virtual ~SettingsStore() = default;
        virtual bool biometricEnabled() const = 0;
        virtual void setBiometricEnabled(bool enabled) = 0;

        /**
         * @brief Inactivity auto-lock switch; true when never set.
         */
        virtual bool autoLockEnabled() const = 0;
        virtual void setAutoLockEnabled(bool enabled) = 0;

        /**
         * @brief Inactivity timeout chosen by the user, empty when never set.
         */
        virtual std::optional<std::int64_t> autoLockTimeoutMs() const = 0;
        virtual void setAutoLockTimeoutMs(std::int64_t timeoutMs) = 0;

        /**
         * @brief Forget both auto-lock preferences.
         */
        virtual void clearAutoLock() = 0;
    };

    // ---------------------------------------------------------------------
    // Flow errors
    // ---------------------------------------------------------------------

    enum class ErrorKind {
        validation,     // weak PIN, mismatched confirmation, empty name
        lockout,        // attempt made while locked
        credential,     // PIN or token rejected by the backend
        capability,     // biometric or clipboard failure
        backend         // storage or network failure
    };

    /**
     * @brief Recoverable failure surfaced to the UI. Never carries secret material.
     */
    struct FlowError {
        ErrorKind kind = ErrorKind::backend;
        std::string message;
    };

} // namespace Aegis

#endif // AEGIS_CAPABILITIES_HPP
