#ifndef AEGIS_CONFIG_HPP
#define AEGIS_CONFIG_HPP

#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <vector>

#include "creation_state_machine.hpp"
#include "lockout_policy.hpp"
#include "unlock_state_machine.hpp"
#include "wallet_session.hpp"

/**
 * @file config.hpp
 * @brief key = value configuration of the credential flows.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    /**
     * @class Config
     * @brief Flat key/value settings layered over built-in defaults.
     *
     * File format: one `key = value` per line, blank lines and lines starting
     * with '#' ignored. Recognised keys:
     *
     *   pin.length                     6..8
     *   lockout.max_failed_attempts    failures before the first lockout
     *   lockout.initial_ms             first lockout window, at most one year
     *   lockout.max_ms                 cap on the lockout window, at most one year
     *   lockout.multiplier             growth per failure past the threshold, 1..1000
     *   biometric.timeout_ms           prompt timeout
     *   biometric.auto_trigger_ms      delay of the automatic prompt, -1 disables it
     *   clipboard.clear_ms             delay before the copied phrase is wiped
     *   quiz.max_attempts              verification attempts before re-showing the phrase
     *   ui.shake_ms                    duration of the rejected-PIN feedback
     *   autolock.timeout_ms            inactivity before the wallet locks, unless the user chose one
     *   autolock.check_interval_ms     period of the inactivity check
     *   autolock.hidden_grace_ms       time in the background before locking, -1 disables it
     *   storage.security_state_path    file backing the lockout counter
     */
    class Config {
    public:
        Config();

        /**
         * @brief Read a configuration file over the current values.
         * @return false if the file cannot be opened.
         */
        bool load(const std::string& path);

        void loadFromStream(std::istream& in);
        void loadFromString(const std::string& text);

        void reset();

        bool has(const std::string& key) const { return data_.count(key) != 0; }
        std::string getString(const std::string& key, const std::string& def = "") const;

        /**
         * @throw ConfigException If the value is not an integer.
         */
        std::int64_t getInt64(const std::string& key, std::int64_t def = 0) const;

        void set(const std::string& key, const std::string& value);
        void set(const std::string& key, std::int64_t value);

        std::vector<std::string> keys() const;

        /**
         * @throw ConfigException If a value is out of range.
         */
        LockoutConfig lockout() const;
        UnlockConfig unlock() const;
        CreationConfig creation() const;
        AutoLockConfig autoLock() const;

        std::string securityStatePath() const { return getString("storage.security_state_path"); }

    private:
        std::map<std::string, std::string> data_;

        void loadDefaults();
        std::uint32_t getUnsigned(const std::string& key, std::uint32_t min,
                                  std::uint32_t max = UINT32_MAX) const;
        std::int64_t getDuration(const std::string& key, std::int64_t min,
                                 std::int64_t max = INT64_MAX) const;
        std::size_t pinLength() const;
    };

} // namespace Aegis

#endif // AEGIS_CONFIG_HPP
