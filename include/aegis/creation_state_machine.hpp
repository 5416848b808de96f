#ifndef AEGIS_CREATION_STATE_MACHINE_HPP
#define AEGIS_CREATION_STATE_MACHINE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "capabilities.hpp"
#include "pin_policy.hpp"
#include "quiz_generator.hpp"
#include "secret_container.hpp"
#include "secure_string.hpp"
#include "timer_queue.hpp"

/**
 * @file creation_state_machine.hpp
 * @brief Wallet creation flow, from naming to backup acknowledgment.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    enum class CreationStep {
        name,
        pin,
        confirmPin,
        mnemonic,
        verify,
        backupConfirm,
        done
    };

    const char* toString(CreationStep step);

    struct CreationConfig {
        std::size_t pinLength = 6;
        std::int64_t clipboardClearMs = 15000;
        std::uint32_t maxQuizAttempts = 3;
    };

    /**
     * @class CreationStateMachine
     * @brief Orchestrates wallet creation around a single SecretContainer.
     *
     * Steps advance strictly in order:
     *   name -> pin -> confirmPin -> mnemonic -> verify -> backupConfirm -> done
     * Verify may loop onto itself with a fresh quiz after a wrong answer, and
     * falls back to mnemonic (phrase revealed, attempts reset) once the attempt
     * budget is spent.
     *
     * The recovery phrase lives in the machine's SecretContainer from the moment
     * the backend returns it until completion or teardown, whichever comes
     * first. Calling a step operation outside its step throws InvalidTransition;
     * bad user input is reported through lastError() instead.
     *
     * Single-threaded, like UnlockStateMachine.
     */
    class CreationStateMachine {
    public:
        CreationStateMachine(WalletBackend& backend,
                             TimerQueue& timers,
                             std::shared_ptr<ClipboardCapability> clipboard = nullptr,
                             QuizGenerator quiz = QuizGenerator(),
                             CreationConfig config = CreationConfig());

        /**
         * @brief Runs teardown().
         */
        ~CreationStateMachine();

        CreationStateMachine(const CreationStateMachine&) = delete;
        CreationStateMachine& operator=(const CreationStateMachine&) = delete;

        // -- name ---------------------------------------------------------

        /**
         * @brief Set the wallet label and move on to PIN entry.
         * @return false (validation error) if the label is blank.
         */
        bool setName(const std::string& label);

        // -- pin / confirmPin ---------------------------------------------

        /**
         * @brief Append a digit to the PIN or its confirmation.
         *
         * A complete first PIN is checked against PinPolicy; a complete
         * confirmation is compared to it and, on a match, handed to the
         * backend. Ignored while the backend call is outstanding.
         */
        void pressDigit(char digit);

        void pressDelete();

        // -- mnemonic -----------------------------------------------------

        void revealPhrase();

        /**
         * @brief Words of the phrase for display.
         *
         * Empty until the phrase has been revealed. The caller must not keep
         * the words beyond rendering.
         */
        std::vector<secure_string> phraseWords() const;

        /**
         * @brief Text the user has to accept before a copy.
         */
        static const char* clipboardWarning();

        /**
         * @brief Copy the phrase to the clipboard and (re)schedule its clearing.
         * @param warningAccepted Whether the user accepted clipboardWarning().
         * @return true if the clipboard accepted the phrase.
         */
        bool copyPhraseToClipboard(bool warningAccepted);

        /**
         * @brief Build a quiz from the phrase and enter verify.
         * @return false if no quiz could be built; the step is unchanged.
         */
        bool startVerification();

        // -- verify -------------------------------------------------------

        const std::vector<QuizQuestion>& quiz() const { return quiz_; }

        /**
         * @brief Record the answer for the question at the given position.
         * @return false if that question was already answered (the first answer is final).
         * @throw InvalidTransition If no question has that position.
         */
        bool selectAnswer(std::size_t position, std::string_view word);

        bool isAnswered(std::size_t position) const { return answers_.count(position) != 0; }
        bool allQuestionsAnswered() const;
        bool allAnswersCorrect() const;

        /**
         * @brief Grade the quiz.
         *
         * All correct: backupConfirm. Otherwise one attempt is spent and a new
         * quiz is drawn, or, with no attempts left, the flow returns to the
         * revealed phrase.
         *
         * @return true if every answer was correct.
         */
        bool submitQuiz();

        std::uint32_t quizAttempts() const { return quizAttempts_; }
        std::uint32_t remainingQuizAttempts() const;

        // -- backupConfirm ------------------------------------------------

        void setBackupAcknowledged(bool acknowledged);
        bool backupAcknowledged() const { return backupAcknowledged_; }

        /**
         * @brief Wipe the phrase, hand over to the backend and finish.
         * @return false (validation error) without the backup acknowledgment.
         */
        bool complete();

        // -- any step -----------------------------------------------------

        /**
         * @brief Release everything the flow holds.
         *
         * Flushes a pending clipboard clear, cancels timers, wipes the phrase,
         * both PIN buffers and the quiz, and drops any outstanding backend
         * callback. Idempotent.
         */
        void teardown();

        CreationStep step() const { return step_; }
        const std::string& walletName() const { return name_; }
        std::size_t enteredLength() const;
        bool isBusy() const { return busy_; }
        bool isPhraseRevealed() const { return revealed_; }

        const std::optional<PinValidationResult>& pinValidation() const { return pinValidation_; }
        const std::optional<FlowError>& lastError() const { return lastError_; }
        void clearError() { lastError_.reset(); }

        const SecretContainer& secret() const { return secret_; }

        void setStepListener(std::function<void(CreationStep)> listener) { listener_ = std::move(listener); }

    private:
        WalletBackend& backend_;
        ScopedTimers timers_;
        std::shared_ptr<ClipboardCapability> clipboard_;
        QuizGenerator quizGenerator_;
        CreationConfig config_;

        CreationStep step_ = CreationStep::name;
        std::string name_;
        secure_string pin_;
        secure_string confirmPin_;
        SecretContainer secret_;

        std::optional<PinValidationResult> pinValidation_;
        std::optional<FlowError> lastError_;
        std::function<void(CreationStep)> listener_;

        std::vector<QuizQuestion> quiz_;
        std::map<std::size_t, secure_string> answers_;
        std::uint32_t quizAttempts_ = 0;

        bool busy_ = false;
        bool revealed_ = false;
        bool backupAcknowledged_ = false;
        bool tornDown_ = false;

        TimerId clipboardTimer_ = 0;
        std::uint64_t request_ = 0;
        std::shared_ptr<bool> alive_;

        void transition(CreationStep next);
        void require(CreationStep expected, const char* operation) const;
        void onPinComplete();
        void onConfirmComplete();
        void onWalletCreated(std::uint64_t request, CreateWalletResult result);
        bool drawQuiz();
        void resetQuiz();
        void clearClipboard();
    };

} // namespace Aegis

#endif // AEGIS_CREATION_STATE_MACHINE_HPP
