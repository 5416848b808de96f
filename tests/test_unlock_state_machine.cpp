/**
 * @file test_unlock_state_machine.cpp
 * @brief Unit tests for Aegis::UnlockStateMachine.
 * @author Aegis Project
 * @date 2026
 *
 * Drives the machine with a manual clock, a scripted backend and a biometric
 * prompt the test answers by hand.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "aegis/unlock_state_machine.hpp"
#include "fakes.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace Aegis;
using namespace AegisTest;

namespace {

    struct Harness {
        ManualClock clock;
        TimerQueue timers{clock};
        InMemorySecurityStateStore store;
        LockoutPolicy lockout{store, clock};
        FakeBackend backend;
        std::shared_ptr<FakeBiometric> biometric = std::make_shared<FakeBiometric>();
        FakeSettings settings{true};

        std::unique_ptr<UnlockStateMachine> make(UnlockConfig config = UnlockConfig()) {
            return std::make_unique<UnlockStateMachine>(backend, lockout, timers, biometric, &settings, config);
        }

        void advance(std::int64_t ms) {
            clock.advance(ms);
            timers.runDue();
        }

        std::uint32_t failures() { return lockout.currentState().failedAttempts; }
    };

    void enter(UnlockStateMachine& m, const std::string& pin) {
        for (char c : pin) m.pressDigit(c);
    }

    /**
     * @brief Store whose every access fails, as a broken disk would.
     */
    class FailingStore : public SecurityStateStore {
    public:
        SecurityRecord load() override { throw StorageException("disk gone"); }
        SecurityRecord update(const RecordMutator&) override { throw StorageException("disk gone"); }
        void overwrite(const SecurityRecord&) override { throw StorageException("disk gone"); }
    };
}

TEST_CASE("UnlockStateMachine accepts the correct PIN", "[pin]") {
    Harness h;
    auto m = h.make();
    std::vector<UnlockState> seen;
    m->setStateListener([&](UnlockState s) { seen.push_back(s); });

    h.lockout.recordFailure();
    enter(*m, "385104");

    REQUIRE(m->state() == UnlockState::accepted);
    REQUIRE(h.backend.unlockCalls == 1);
    REQUIRE(h.failures() == 0);
    REQUIRE_FALSE(m->lastError().has_value());
    REQUIRE(seen == std::vector<UnlockState>{UnlockState::entering, UnlockState::submitting, UnlockState::accepted});

    // Input after acceptance is ignored
    m->pressDigit('1');
    REQUIRE(m->enteredLength() == 0);
}

TEST_CASE("UnlockStateMachine rejects a wrong PIN and returns to idle after the shake", "[pin]") {
    Harness h;
    auto m = h.make();

    enter(*m, "999111");
    REQUIRE(m->state() == UnlockState::rejected);
    REQUIRE(m->isShaking());
    REQUIRE(m->enteredLength() == 0);
    REQUIRE(m->lastError()->kind == ErrorKind::credential);
    REQUIRE(m->lastError()->message == "Invalid PIN");
    REQUIRE(h.failures() == 1);

    h.advance(499);
    REQUIRE(m->state() == UnlockState::rejected);
    h.advance(1);
    REQUIRE(m->state() == UnlockState::idle);
    REQUIRE_FALSE(m->isShaking());
}

TEST_CASE("UnlockStateMachine typing during the shake starts a new entry", "[pin]") {
    Harness h;
    auto m = h.make();

    enter(*m, "999111");
    m->pressDigit('3');
    REQUIRE(m->state() == UnlockState::entering);
    REQUIRE(m->enteredLength() == 1);
    REQUIRE_FALSE(m->isShaking());

    h.advance(1000);
    REQUIRE(m->state() == UnlockState::entering);
}

TEST_CASE("UnlockStateMachine warns when few attempts remain and offers a reset", "[pin]") {
    Harness h;
    auto m = h.make();

    enter(*m, "999111");
    enter(*m, "999111");
    REQUIRE(m->lastError()->message == "Invalid PIN");
    REQUIRE_FALSE(m->shouldOfferReset());

    enter(*m, "999111");
    REQUIRE(m->lastError()->message == "Invalid PIN. 2 attempts remaining");
    REQUIRE(m->shouldOfferReset());

    enter(*m, "999111");
    REQUIRE(m->lastError()->message == "Invalid PIN. 1 attempt remaining");
    REQUIRE(m->remainingAttemptsBeforeLockout() == 1);
}

TEST_CASE("UnlockStateMachine never reaches the backend while locked", "[lockout]") {
    Harness h;
    auto m = h.make();

    for (int i = 0; i < 5; ++i) enter(*m, "999111");
    REQUIRE(h.backend.unlockCalls == 5);
    REQUIRE(m->isLocked());
    REQUIRE(m->lastError()->message == "Too many failed attempts. Try again in 30 seconds");

    h.advance(500);
    enter(*m, "385104");

    REQUIRE(h.backend.unlockCalls == 5);
    REQUIRE(m->enteredLength() == 0);
    REQUIRE(m->state() == UnlockState::idle);
    REQUIRE(m->lastError()->kind == ErrorKind::lockout);
    REQUIRE(h.failures() == 5);
}

TEST_CASE("UnlockStateMachine counts the lockout down and clears it", "[lockout]") {
    Harness h;
    auto m = h.make();

    for (int i = 0; i < 5; ++i) enter(*m, "999111");
    REQUIRE(m->lockoutSecondsRemaining() == 30);

    for (int i = 0; i < 10; ++i) h.advance(1000);
    REQUIRE(m->lockoutSecondsRemaining() == 20);
    REQUIRE(m->lastError()->message == "Too many failed attempts. Try again in 20 seconds");

    for (int i = 0; i < 20; ++i) h.advance(1000);
    REQUIRE_FALSE(m->isLocked());
    REQUIRE_FALSE(m->lastError().has_value());

    // Counter survives the window; the next failure locks again for longer
    enter(*m, "999111");
    REQUIRE(h.failures() == 6);
    REQUIRE(m->lockoutSecondsRemaining() == 60);
    REQUIRE(m->lastError()->message == "Too many failed attempts. Try again in 1 minute");
}

TEST_CASE("UnlockStateMachine starts in a running lockout", "[lockout]") {
    Harness h;
    for (int i = 0; i < 5; ++i) h.lockout.recordFailure();

    auto m = h.make();
    m->start();
    REQUIRE(m->lastError()->kind == ErrorKind::lockout);

    // No automatic biometric prompt while locked
    h.advance(1000);
    REQUIRE(h.biometric->prompts == 0);
    REQUIRE_FALSE(m->biometricAvailable());
}

TEST_CASE("UnlockStateMachine does not count backend failures", "[pin]") {
    Harness h;
    h.backend.unlockFails = true;
    auto m = h.make();

    enter(*m, "385104");
    REQUIRE(m->state() == UnlockState::idle);
    REQUIRE(m->lastError()->kind == ErrorKind::backend);
    REQUIRE(h.failures() == 0);
}

TEST_CASE("UnlockStateMachine ignores input while a credential is verified", "[pin]") {
    Harness h;
    h.backend.deferred = true;
    auto m = h.make();

    enter(*m, "385104");
    REQUIRE(m->state() == UnlockState::submitting);

    m->pressDigit('1');
    m->pressDelete();
    m->requestBiometric();
    REQUIRE(h.backend.unlockCalls == 1);
    REQUIRE(h.biometric->prompts == 0);

    h.backend.resolveUnlock();
    REQUIRE(m->state() == UnlockState::accepted);
}

TEST_CASE("UnlockStateMachine drops results arriving after teardown", "[teardown]") {
    Harness h;
    h.backend.deferred = true;
    auto m = h.make();

    enter(*m, "999111");
    m->teardown();
    h.backend.resolveUnlock();

    REQUIRE(m->state() == UnlockState::submitting);
    REQUIRE(h.failures() == 0);
    REQUIRE(h.timers.pending() == 0);

    m.reset();
}

TEST_CASE("UnlockStateMachine pressDelete edits the entry", "[pin]") {
    Harness h;
    auto m = h.make();

    m->pressDigit('3');
    m->pressDigit('8');
    m->pressDelete();
    REQUIRE(m->enteredLength() == 1);
    m->pressDelete();
    REQUIRE(m->state() == UnlockState::idle);

    m->pressDigit('x');
    REQUIRE(m->enteredLength() == 0);
}

TEST_CASE("UnlockStateMachine fails closed when the security state is unreadable", "[lockout]") {
    ManualClock clock;
    TimerQueue timers(clock);
    FailingStore store;
    LockoutPolicy lockout(store, clock);
    FakeBackend backend;
    UnlockStateMachine m(backend, lockout, timers);

    enter(m, "385104");
    REQUIRE(backend.unlockCalls == 0);
    REQUIRE(m.lastError()->kind == ErrorKind::backend);
    REQUIRE(m.isLocked());
}

TEST_CASE("UnlockStateMachine auto-prompts for biometrics on start", "[biometric]") {
    Harness h;
    auto m = h.make();
    m->start();
    REQUIRE(m->biometricAvailable());

    h.advance(599);
    REQUIRE(h.biometric->prompts == 0);
    h.advance(1);
    REQUIRE(h.biometric->prompts == 1);
    REQUIRE(h.biometric->lastReason == "Unlock your wallet");
    REQUIRE(m->state() == UnlockState::biometricPending);

    h.biometric->respond(BiometricOutcome::success, "385104");
    REQUIRE(m->state() == UnlockState::accepted);
    REQUIRE(h.backend.unlockCalls == 1);
}

TEST_CASE("UnlockStateMachine skips the auto-prompt once the user types", "[biometric]") {
    Harness h;
    auto m = h.make();
    m->start();
    m->pressDigit('3');

    h.advance(1000);
    REQUIRE(h.biometric->prompts == 0);
    REQUIRE(m->state() == UnlockState::entering);
}

TEST_CASE("UnlockStateMachine counts a rejected biometric token", "[biometric]") {
    Harness h;
    auto m = h.make();

    m->requestBiometric();
    h.biometric->respond(BiometricOutcome::success, "000000");
    REQUIRE(m->state() == UnlockState::rejected);
    REQUIRE(h.failures() == 1);
}

TEST_CASE("UnlockStateMachine does not count a cancelled prompt", "[biometric]") {
    Harness h;
    auto m = h.make();

    m->requestBiometric();
    h.biometric->respond(BiometricOutcome::cancelled);
    REQUIRE(m->state() == UnlockState::idle);
    REQUIRE_FALSE(m->lastError().has_value());
    REQUIRE(h.failures() == 0);
    REQUIRE(h.backend.unlockCalls == 0);
}

TEST_CASE("UnlockStateMachine times out a silent biometric prompt", "[biometric]") {
    Harness h;
    auto m = h.make();

    m->requestBiometric();
    REQUIRE(m->state() == UnlockState::biometricPending);

    h.advance(30000);
    REQUIRE(m->state() == UnlockState::idle);
    REQUIRE(m->lastError()->kind == ErrorKind::capability);
    REQUIRE(m->lastError()->message == "Face ID timed out. Please use PIN.");
    REQUIRE(h.biometric->cancels == 1);
    REQUIRE(h.failures() == 0);

    // A late answer belongs to the abandoned prompt
    h.biometric->respond(BiometricOutcome::success, "385104");
    REQUIRE(h.backend.unlockCalls == 0);
    REQUIRE(m->state() == UnlockState::idle);
}

TEST_CASE("UnlockStateMachine reports capability failures without counting them", "[biometric]") {
    Harness h;
    auto m = h.make();

    SECTION("unavailable") {
        m->requestBiometric();
        h.biometric->respond(BiometricOutcome::unavailable);
        REQUIRE(m->lastError()->message == "Face ID is unavailable. Please use PIN.");
    }
    SECTION("timeout reported by the capability") {
        m->requestBiometric();
        h.biometric->respond(BiometricOutcome::timeout);
        REQUIRE(m->lastError()->message == "Face ID timed out. Please use PIN.");
    }
    SECTION("capability gone before the prompt") {
        h.biometric->available = false;
        m->requestBiometric();
        REQUIRE(h.biometric->prompts == 0);
    }

    REQUIRE(m->state() == UnlockState::idle);
    REQUIRE(m->lastError()->kind == ErrorKind::capability);
    REQUIRE(h.failures() == 0);
}

TEST_CASE("UnlockStateMachine disables biometrics on a success without a token", "[biometric]") {
    Harness h;
    auto m = h.make();

    m->requestBiometric();
    h.biometric->respond(BiometricOutcome::success, "");

    REQUIRE(m->state() == UnlockState::idle);
    REQUIRE(m->lastError()->kind == ErrorKind::capability);
    REQUIRE_FALSE(h.settings.biometricEnabled());
    REQUIRE_FALSE(m->biometricEnabled());
    REQUIRE(h.backend.unlockCalls == 0);
}

TEST_CASE("UnlockStateMachine respects the biometric setting", "[biometric]") {
    Harness h;
    h.settings.setBiometricEnabled(false);
    auto m = h.make();
    m->start();

    h.advance(1000);
    REQUIRE(h.biometric->prompts == 0);

    m->requestBiometric();
    REQUIRE(h.biometric->prompts == 0);
    REQUIRE(m->lastError()->message == "Face ID is not enabled. Enable it in Settings.");
}

TEST_CASE("UnlockStateMachine refuses biometrics while locked", "[biometric]") {
    Harness h;
    auto m = h.make();
    for (int i = 0; i < 5; ++i) enter(*m, "999111");
    h.advance(500);

    m->requestBiometric();
    REQUIRE(h.biometric->prompts == 0);
    REQUIRE(m->lastError()->kind == ErrorKind::lockout);
}

TEST_CASE("UnlockStateMachine teardown abandons a pending prompt", "[teardown]") {
    Harness h;
    auto m = h.make();

    m->requestBiometric();
    m->teardown();
    m->teardown();

    REQUIRE(h.biometric->cancels == 1);
    REQUIRE(h.timers.pending() == 0);

    h.biometric->respond(BiometricOutcome::success, "385104");
    REQUIRE(h.backend.unlockCalls == 0);
}

TEST_CASE("UnlockStateMachine teardown ignores a cancel reported inline", "[teardown]") {
    Harness h;
    h.biometric->cancelReportsInline = true;
    auto m = h.make();

    m->requestBiometric();
    REQUIRE(m->state() == UnlockState::biometricPending);

    int notifications = 0;
    m->setStateListener([&](UnlockState) { ++notifications; });
    m->teardown();

    REQUIRE(h.biometric->cancels == 1);
    REQUIRE_FALSE(h.biometric->hasPending());
    REQUIRE(notifications == 0);
    REQUIRE(m->state() == UnlockState::biometricPending);
    REQUIRE_FALSE(m->lastError().has_value());

    m.reset();
    REQUIRE(notifications == 0);
}

TEST_CASE("UnlockStateMachine names its states", "[toString]") {
    REQUIRE(std::string(toString(UnlockState::idle)) == "idle");
    REQUIRE(std::string(toString(UnlockState::biometricPending)) == "biometricPending");
}
