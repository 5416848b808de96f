#include "aegis/config.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "aegis/exceptions.hpp"
#include "aegis/pin_policy.hpp"

/**
 * @file config.cpp
 * @brief Implementation of the Config loader.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    namespace {

        constexpr std::int64_t MAX_LOCKOUT_MS = 365LL * 24 * 3600 * 1000;
        constexpr std::uint32_t MAX_MULTIPLIER = 1000;

        std::string trim(const std::string& s) {
            auto begin = s.find_first_not_of(" \t\r");
            if (begin == std::string::npos) return "";
            auto end = s.find_last_not_of(" \t\r");
            return s.substr(begin, end - begin + 1);
        }
    }

    Config::Config() {
        loadDefaults();
    }

    void Config::loadDefaults() {
        set("pin.length", static_cast<std::int64_t>(6));

        set("lockout.max_failed_attempts", static_cast<std::int64_t>(5));
        set("lockout.initial_ms", static_cast<std::int64_t>(30000));
        set("lockout.max_ms", static_cast<std::int64_t>(3600000));
        set("lockout.multiplier", static_cast<std::int64_t>(2));

        set("biometric.timeout_ms", static_cast<std::int64_t>(30000));
        set("biometric.auto_trigger_ms", static_cast<std::int64_t>(600));

        set("clipboard.clear_ms", static_cast<std::int64_t>(15000));
        set("quiz.max_attempts", static_cast<std::int64_t>(3));
        set("ui.shake_ms", static_cast<std::int64_t>(500));

        set("autolock.timeout_ms", static_cast<std::int64_t>(300000));
        set("autolock.check_interval_ms", static_cast<std::int64_t>(2000));
        set("autolock.hidden_grace_ms", static_cast<std::int64_t>(1000));

        set("storage.security_state_path", "security_state.dat");
    }

    void Config::reset() {
        data_.clear();
        loadDefaults();
    }

    bool Config::load(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("Config: cannot open {}; using defaults", path);
            return false;
        }

        loadFromStream(file);
        spdlog::info("Config: loaded {}", path);
        return true;
    }

    void Config::loadFromString(const std::string& text) {
        std::istringstream in(text);
        loadFromStream(in);
    }

    void Config::loadFromStream(std::istream& in) {
        std::string line;
        std::size_t lineNo = 0;

        while (std::getline(in, line)) {
            ++lineNo;
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                spdlog::warn("Config: line {} ignored, expected key = value", lineNo);
                continue;
            }

            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));

            if (!has(key))
                spdlog::warn("Config: unknown key '{}' ignored", key);
            else
                data_[key] = value;
        }
    }

    std::string Config::getString(const std::string& key, const std::string& def) const {
        auto it = data_.find(key);
        return it != data_.end() ? it->second : def;
    }

    std::int64_t Config::getInt64(const std::string& key, std::int64_t def) const {
        auto it = data_.find(key);
        if (it == data_.end()) return def;

        const std::string& value = it->second;
        errno = 0;
        char* end = nullptr;
        long long parsed = std::strtoll(value.c_str(), &end, 10);
        if (value.empty() || end != value.c_str() + value.size() || errno == ERANGE)
            throw ConfigException("Config: '" + key + "' must be an integer, got '" + value + "'");

        return static_cast<std::int64_t>(parsed);
    }

    void Config::set(const std::string& key, const std::string& value) {
        data_[key] = value;
    }

    void Config::set(const std::string& key, std::int64_t value) {
        data_[key] = std::to_string(value);
    }

    std::vector<std::string> Config::keys() const {
        std::vector<std::string> result;
        result.reserve(data_.size());
        for (const auto& kv : data_) result.push_back(kv.first);
        return result;
    }

    std::uint32_t Config::getUnsigned(const std::string& key, std::uint32_t min, std::uint32_t max) const {
        std::int64_t value = getInt64(key);
        if (value < static_cast<std::int64_t>(min) || value > static_cast<std::int64_t>(max))
            throw ConfigException("Config: '" + key + "' out of range");
        return static_cast<std::uint32_t>(value);
    }

    std::int64_t Config::getDuration(const std::string& key, std::int64_t min, std::int64_t max) const {
        std::int64_t value = getInt64(key);
        if (value < min || value > max)
            throw ConfigException("Config: '" + key + "' out of range");
        return value;
    }

    std::size_t Config::pinLength() const {
        std::int64_t length = getInt64("pin.length");
        if (length < static_cast<std::int64_t>(PinPolicy::MIN_LENGTH)
            || length > static_cast<std::int64_t>(PinPolicy::MAX_LENGTH))
            throw ConfigException("Config: 'pin.length' must be between "
                                  + std::to_string(PinPolicy::MIN_LENGTH) + " and "
                                  + std::to_string(PinPolicy::MAX_LENGTH));
        return static_cast<std::size_t>(length);
    }

    LockoutConfig Config::lockout() const {
        LockoutConfig config;
        config.maxFailedAttempts = getUnsigned("lockout.max_failed_attempts", 1);
        config.initialLockoutMs = getDuration("lockout.initial_ms", 0, MAX_LOCKOUT_MS);
        config.maxLockoutMs = getDuration("lockout.max_ms", config.initialLockoutMs, MAX_LOCKOUT_MS);
        config.multiplier = getUnsigned("lockout.multiplier", 1, MAX_MULTIPLIER);
        return config;
    }

    UnlockConfig Config::unlock() const {
        UnlockConfig config;
        config.pinLength = pinLength();
        config.biometricTimeoutMs = getDuration("biometric.timeout_ms", 1);
        config.biometricAutoTriggerMs = getDuration("biometric.auto_trigger_ms", -1);
        config.shakeMs = getDuration("ui.shake_ms", 0);
        return config;
    }

    CreationConfig Config::creation() const {
        CreationConfig config;
        config.pinLength = pinLength();
        config.clipboardClearMs = getDuration("clipboard.clear_ms", 0);
        config.maxQuizAttempts = getUnsigned("quiz.max_attempts", 1);
        return config;
    }

    AutoLockConfig Config::autoLock() const {
        AutoLockConfig config;
        config.timeoutMs = getDuration("autolock.timeout_ms", 1);
        config.checkIntervalMs = getDuration("autolock.check_interval_ms", 1);
        config.hiddenGraceMs = getDuration("autolock.hidden_grace_ms", -1);
        return config;
    }

} // namespace Aegis
