#include "aegis/creation_state_machine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

/**
 * @file creation_state_machine.cpp
 * @brief Implementation of the CreationStateMachine.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    namespace {

        bool isBlank(const std::string& s) {
            return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
        }
    }

    const char* toString(CreationStep step) {
        switch (step) {
            case CreationStep::name:          return "name";
            case CreationStep::pin:           return "pin";
            case CreationStep::confirmPin:    return "confirmPin";
            case CreationStep::mnemonic:      return "mnemonic";
            case CreationStep::verify:        return "verify";
            case CreationStep::backupConfirm: return "backupConfirm";
            case CreationStep::done:          return "done";
        }
        return "unknown";
    }

    CreationStateMachine::CreationStateMachine(WalletBackend& backend,
                                               TimerQueue& timers,
                                               std::shared_ptr<ClipboardCapability> clipboard,
                                               QuizGenerator quiz,
                                               CreationConfig config)
        : backend_(backend),
          timers_(timers),
          clipboard_(std::move(clipboard)),
          quizGenerator_(std::move(quiz)),
          config_(config),
          alive_(std::make_shared<bool>(true)) {}

    CreationStateMachine::~CreationStateMachine() {
        teardown();
    }

    void CreationStateMachine::transition(CreationStep next) {
        if (step_ == next) return;

        spdlog::debug("CreationStateMachine: {} -> {}", toString(step_), toString(next));
        step_ = next;
        if (listener_) listener_(next);
    }

    void CreationStateMachine::require(CreationStep expected, const char* operation) const {
        if (tornDown_)
            throw InvalidTransition(std::string("CreationStateMachine::") + operation + ": flow torn down");
        if (step_ != expected)
            throw InvalidTransition(std::string("CreationStateMachine::") + operation
                                    + ": not permitted in step " + toString(step_));
    }

    std::size_t CreationStateMachine::enteredLength() const {
        return step_ == CreationStep::confirmPin ? confirmPin_.size() : pin_.size();
    }

    // ---------------------------------------------------------------------
    // Name and PIN
    // ---------------------------------------------------------------------

    bool CreationStateMachine::setName(const std::string& label) {
        require(CreationStep::name, "setName");

        if (isBlank(label)) {
            lastError_ = FlowError{ErrorKind::validation, "Wallet name cannot be empty"};
            return false;
        }

        name_ = label;
        lastError_.reset();
        transition(CreationStep::pin);
        return true;
    }

    void CreationStateMachine::pressDigit(char digit) {
        if (tornDown_ || busy_ || digit < '0' || digit > '9')
            return;

        if (step_ == CreationStep::pin) {
            if (pin_.size() >= config_.pinLength) return;
            if (pin_.empty()) {
                lastError_.reset();
                pinValidation_.reset();
            }
            pin_.push_back(digit);
            if (pin_.size() == config_.pinLength)
                onPinComplete();
        }
        else if (step_ == CreationStep::confirmPin) {
            if (confirmPin_.size() >= config_.pinLength) return;
            if (confirmPin_.empty())
                lastError_.reset();
            confirmPin_.push_back(digit);
            if (confirmPin_.size() == config_.pinLength)
                onConfirmComplete();
        }
    }

    void CreationStateMachine::pressDelete() {
        if (tornDown_ || busy_)
            return;

        if (step_ == CreationStep::pin)
            pin_.pop_back();
        else if (step_ == CreationStep::confirmPin)
            confirmPin_.pop_back();
    }

    void CreationStateMachine::onPinComplete() {
        PinValidationResult result = PinPolicy::validate(pin_.view());
        pinValidation_ = result;

        if (!result.isValid) {
            spdlog::debug("CreationStateMachine: PIN rejected by policy");
            lastError_ = FlowError{ErrorKind::validation, result.errors.front()};
            pin_.clear();
            return;
        }

        lastError_.reset();
        transition(CreationStep::confirmPin);
    }

    void CreationStateMachine::onConfirmComplete() {
        if (confirmPin_ != pin_) {
            lastError_ = FlowError{ErrorKind::validation, "Passcodes don't match. Try again."};
            confirmPin_.clear();
            return;
        }

        busy_ = true;
        lastError_.reset();

        std::uint64_t id = ++request_;
        std::weak_ptr<bool> alive = alive_;

        spdlog::info("CreationStateMachine: creating wallet");
        backend_.createWallet(pin_, name_, [this, alive, id](CreateWalletResult result) {
            if (alive.expired()) {
                result.mnemonic.clear();
                return;
            }
            onWalletCreated(id, std::move(result));
        });
    }

    void CreationStateMachine::onWalletCreated(std::uint64_t request, CreateWalletResult result) {
        if (request != request_ || step_ != CreationStep::confirmPin || !busy_) {
            result.mnemonic.clear();
            spdlog::debug("CreationStateMachine: dropping stale creation result");
            return;
        }
        busy_ = false;

        if (result.status == BackendStatus::ok && !result.mnemonic.empty()) {
            secret_.set(std::move(result.mnemonic));
            pin_.clear();
            confirmPin_.clear();
            revealed_ = false;
            spdlog::info("CreationStateMachine: wallet created");
            transition(CreationStep::mnemonic);
            return;
        }

        result.mnemonic.clear();

        if (result.status == BackendStatus::weakPin) {
            spdlog::warn("CreationStateMachine: backend rejected the PIN");
            lastError_ = FlowError{ErrorKind::validation, "This PIN was rejected. Please choose a different PIN"};
            pin_.clear();
            confirmPin_.clear();
            pinValidation_.reset();
            transition(CreationStep::pin);
            return;
        }

        spdlog::error("CreationStateMachine: wallet creation failed");
        lastError_ = FlowError{ErrorKind::backend, "Failed to create wallet. Please try again."};
        confirmPin_.clear();
    }

    // ---------------------------------------------------------------------
    // Recovery phrase
    // ---------------------------------------------------------------------

    void CreationStateMachine::revealPhrase() {
        require(CreationStep::mnemonic, "revealPhrase");
        revealed_ = true;
    }

    std::vector<secure_string> CreationStateMachine::phraseWords() const {
        if (!revealed_ || step_ != CreationStep::mnemonic)
            return {};
        return secret_.getWords();
    }

    const char* CreationStateMachine::clipboardWarning() {
        return "Clipboard data can be accessed by other apps. "
               "The clipboard will be cleared after 15 seconds. Continue?";
    }

    bool CreationStateMachine::copyPhraseToClipboard(bool warningAccepted) {
        require(CreationStep::mnemonic, "copyPhraseToClipboard");

        if (!revealed_)
            throw InvalidTransition("CreationStateMachine::copyPhraseToClipboard: phrase not revealed");

        if (!warningAccepted)
            return false;

        if (!clipboard_) {
            lastError_ = FlowError{ErrorKind::capability, "Clipboard is not available"};
            return false;
        }

        bool written = clipboard_->write(secret_.get());
        if (!written) {
            spdlog::warn("CreationStateMachine: clipboard write failed");
            lastError_ = FlowError{ErrorKind::capability, "Failed to copy to clipboard"};
        }

        // Cleared on a fixed delay whatever the user does with the clipboard
        if (clipboardTimer_ != 0)
            timers_.cancel(clipboardTimer_);
        clipboardTimer_ = timers_.schedule(config_.clipboardClearMs, [this]() {
            clipboardTimer_ = 0;
            clearClipboard();
        });

        return written;
    }

    void CreationStateMachine::clearClipboard() {
        if (clipboard_ && !clipboard_->clear())
            spdlog::warn("CreationStateMachine: failed to clear clipboard");
        else
            spdlog::debug("CreationStateMachine: clipboard cleared");
    }

    // ---------------------------------------------------------------------
    // Verification quiz
    // ---------------------------------------------------------------------

    bool CreationStateMachine::drawQuiz() {
        resetQuiz();
        quiz_ = quizGenerator_.generate(secret_.getWords());
        return !quiz_.empty();
    }

    void CreationStateMachine::resetQuiz() {
        quiz_.clear();
        answers_.clear();
    }

    bool CreationStateMachine::startVerification() {
        require(CreationStep::mnemonic, "startVerification");

        if (!revealed_)
            throw InvalidTransition("CreationStateMachine::startVerification: phrase not revealed");

        if (!drawQuiz()) {
            spdlog::error("CreationStateMachine: could not build a verification quiz");
            lastError_ = FlowError{ErrorKind::backend, "Unable to verify the recovery phrase. Please try again."};
            return false;
        }

        lastError_.reset();
        transition(CreationStep::verify);
        return true;
    }

    bool CreationStateMachine::selectAnswer(std::size_t position, std::string_view word) {
        require(CreationStep::verify, "selectAnswer");

        auto it = std::find_if(quiz_.begin(), quiz_.end(),
                               [position](const QuizQuestion& q) { return q.position == position; });
        if (it == quiz_.end())
            throw InvalidTransition("CreationStateMachine::selectAnswer: no question at position "
                                    + std::to_string(position));

        if (answers_.count(position) != 0)
            return false;

        answers_.emplace(position, secure_string(word));
        return true;
    }

    bool CreationStateMachine::allQuestionsAnswered() const {
        return !quiz_.empty() && answers_.size() == quiz_.size();
    }

    bool CreationStateMachine::allAnswersCorrect() const {
        if (!allQuestionsAnswered())
            return false;

        for (const QuizQuestion& q : quiz_) {
            auto it = answers_.find(q.position);
            if (it == answers_.end() || !q.isCorrect(it->second.view()))
                return false;
        }
        return true;
    }

    std::uint32_t CreationStateMachine::remainingQuizAttempts() const {
        return quizAttempts_ >= config_.maxQuizAttempts ? 0 : config_.maxQuizAttempts - quizAttempts_;
    }

    bool CreationStateMachine::submitQuiz() {
        require(CreationStep::verify, "submitQuiz");

        if (!allQuestionsAnswered()) {
            lastError_ = FlowError{ErrorKind::validation, "Answer every question to continue"};
            return false;
        }

        if (allAnswersCorrect()) {
            resetQuiz();
            quizAttempts_ = 0;
            lastError_.reset();
            spdlog::info("CreationStateMachine: recovery phrase verified");
            transition(CreationStep::backupConfirm);
            return true;
        }

        ++quizAttempts_;
        spdlog::info("CreationStateMachine: verification attempt {} of {} failed",
                     quizAttempts_, config_.maxQuizAttempts);

        if (quizAttempts_ >= config_.maxQuizAttempts) {
            resetQuiz();
            quizAttempts_ = 0;
            revealed_ = true;
            lastError_ = FlowError{ErrorKind::validation, "Please review your recovery phrase again carefully."};
            transition(CreationStep::mnemonic);
            return false;
        }

        if (!drawQuiz()) {
            spdlog::error("CreationStateMachine: could not rebuild the verification quiz");
            revealed_ = true;
            lastError_ = FlowError{ErrorKind::backend, "Unable to verify the recovery phrase. Please try again."};
            transition(CreationStep::mnemonic);
            return false;
        }

        std::uint32_t left = remainingQuizAttempts();
        lastError_ = FlowError{ErrorKind::validation,
                               "Incorrect answer. " + std::to_string(left)
                               + (left == 1 ? " attempt" : " attempts") + " remaining"};
        return false;
    }

    // ---------------------------------------------------------------------
    // Completion
    // ---------------------------------------------------------------------

    void CreationStateMachine::setBackupAcknowledged(bool acknowledged) {
        require(CreationStep::backupConfirm, "setBackupAcknowledged");
        backupAcknowledged_ = acknowledged;
    }

    bool CreationStateMachine::complete() {
        require(CreationStep::backupConfirm, "complete");

        if (!backupAcknowledged_) {
            lastError_ = FlowError{ErrorKind::validation, "Confirm that you have backed up your recovery phrase"};
            return false;
        }

        secret_.clear();
        pin_.clear();
        confirmPin_.clear();
        revealed_ = false;
        lastError_.reset();

        backend_.completeWalletSetup();
        spdlog::info("CreationStateMachine: wallet setup complete");
        transition(CreationStep::done);
        return true;
    }

    void CreationStateMachine::teardown() {
        if (tornDown_) return;
        tornDown_ = true;

        if (clipboardTimer_ != 0) {
            timers_.cancel(clipboardTimer_);
            clipboardTimer_ = 0;
            clearClipboard();
        }
        timers_.cancelAll();

        resetQuiz();
        pin_.clear();
        confirmPin_.clear();
        secret_.clear();
        revealed_ = false;
        busy_ = false;

        alive_.reset();
        ++request_;

        spdlog::debug("CreationStateMachine: torn down in step {}", toString(step_));
    }

} // namespace Aegis
