/**
 * @file test_config.cpp
 * @brief Unit tests for Aegis::Config.
 * @author Aegis Project
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "aegis/config.hpp"
#include "aegis/exceptions.hpp"

#include <filesystem>
#include <fstream>

using namespace Aegis;

TEST_CASE("Config defaults match the built-in flow parameters", "[defaults]") {
    Config config;

    auto lockout = config.lockout();
    REQUIRE(lockout.maxFailedAttempts == 5);
    REQUIRE(lockout.initialLockoutMs == 30000);
    REQUIRE(lockout.maxLockoutMs == 3600000);
    REQUIRE(lockout.multiplier == 2);

    auto unlock = config.unlock();
    REQUIRE(unlock.pinLength == 6);
    REQUIRE(unlock.biometricTimeoutMs == 30000);
    REQUIRE(unlock.biometricAutoTriggerMs == 600);
    REQUIRE(unlock.shakeMs == 500);

    auto creation = config.creation();
    REQUIRE(creation.pinLength == 6);
    REQUIRE(creation.clipboardClearMs == 15000);
    REQUIRE(creation.maxQuizAttempts == 3);

    auto autoLock = config.autoLock();
    REQUIRE(autoLock.timeoutMs == 300000);
    REQUIRE(autoLock.checkIntervalMs == 2000);
    REQUIRE(autoLock.hiddenGraceMs == 1000);

    REQUIRE(config.securityStatePath() == "security_state.dat");
}

TEST_CASE("Config reads the auto-lock settings", "[autoLock]") {
    Config config;
    config.loadFromString("autolock.timeout_ms = 60000\nautolock.hidden_grace_ms = -1\n");

    auto autoLock = config.autoLock();
    REQUIRE(autoLock.timeoutMs == 60000);
    REQUIRE(autoLock.checkIntervalMs == 2000);
    REQUIRE(autoLock.hiddenGraceMs == -1);

    config.loadFromString("autolock.timeout_ms = 0\n");
    REQUIRE_THROWS_AS(config.autoLock(), ConfigException);
}

TEST_CASE("Config parses key = value lines over the defaults", "[load]") {
    Config config;
    config.loadFromString(
        "# credential flow settings\n"
        "\n"
        "pin.length = 8\n"
        "lockout.max_failed_attempts=3\n"
        "  lockout.initial_ms =  1000  \n"
        "biometric.auto_trigger_ms = -1\n"
        "storage.security_state_path = /var/lib/aegis/state\n");

    REQUIRE(config.unlock().pinLength == 8);
    REQUIRE(config.creation().pinLength == 8);
    REQUIRE(config.lockout().maxFailedAttempts == 3);
    REQUIRE(config.lockout().initialLockoutMs == 1000);
    REQUIRE(config.lockout().maxLockoutMs == 3600000);
    REQUIRE(config.unlock().biometricAutoTriggerMs == -1);
    REQUIRE(config.securityStatePath() == "/var/lib/aegis/state");
}

TEST_CASE("Config ignores unknown keys and malformed lines", "[load]") {
    Config config;
    auto before = config.keys();

    config.loadFromString("network.port = 8333\nnot a setting\n");
    REQUIRE(config.keys() == before);
    REQUIRE_FALSE(config.has("network.port"));
}

TEST_CASE("Config rejects malformed and out-of-range values", "[validate]") {
    Config config;

    SECTION("non-numeric") {
        config.loadFromString("lockout.initial_ms = soon\n");
        REQUIRE_THROWS_AS(config.lockout(), ConfigException);
    }
    SECTION("trailing garbage") {
        config.loadFromString("quiz.max_attempts = 3x\n");
        REQUIRE_THROWS_AS(config.creation(), ConfigException);
    }
    SECTION("PIN length outside 6..8") {
        config.loadFromString("pin.length = 4\n");
        REQUIRE_THROWS_AS(config.unlock(), ConfigException);
        REQUIRE_THROWS_AS(config.creation(), ConfigException);
    }
    SECTION("zero threshold") {
        config.loadFromString("lockout.max_failed_attempts = 0\n");
        REQUIRE_THROWS_AS(config.lockout(), ConfigException);
    }
    SECTION("cap below the first window") {
        config.loadFromString("lockout.max_ms = 10\n");
        REQUIRE_THROWS_AS(config.lockout(), ConfigException);
    }
    SECTION("cap beyond one year") {
        config.loadFromString("lockout.max_ms = 9223372036854775807\n");
        REQUIRE_THROWS_AS(config.lockout(), ConfigException);
    }
    SECTION("huge multiplier") {
        config.loadFromString("lockout.multiplier = 4294967295\n");
        REQUIRE_THROWS_AS(config.lockout(), ConfigException);
    }
}

TEST_CASE("Config accepts the largest lockout bounds", "[validate]") {
    Config config;
    config.loadFromString("lockout.max_ms = 31536000000\nlockout.multiplier = 1000\n");

    auto lockout = config.lockout();
    REQUIRE(lockout.maxLockoutMs == 31536000000LL);
    REQUIRE(lockout.multiplier == 1000);
}

TEST_CASE("Config::load reads a file and reports a missing one", "[load]") {
    namespace fs = std::filesystem;
    std::string path = (fs::temp_directory_path() / "aegis_config_test.conf").string();
    {
        std::ofstream out(path);
        out << "clipboard.clear_ms = 5000\n";
    }

    Config config;
    REQUIRE(config.load(path));
    REQUIRE(config.creation().clipboardClearMs == 5000);
    REQUIRE(fs::remove(path));

    REQUIRE_FALSE(config.load(path));
    REQUIRE(config.creation().clipboardClearMs == 5000);

    config.reset();
    REQUIRE(config.creation().clipboardClearMs == 15000);
}
