#ifndef AEGIS_QUIZ_GENERATOR_HPP
#define AEGIS_QUIZ_GENERATOR_HPP

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

#include "random.hpp"
#include "secure_string.hpp"

/**
 * @file quiz_generator.hpp
 * @brief Recovery-phrase verification challenge.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    /**
     * @brief One multiple-choice prompt: "which word is at position N?".
     */
    struct QuizQuestion {
        std::size_t position = 0;              // 1-indexed word slot
        secure_string correctWord;
        std::vector<secure_string> options;    // correct word + decoys, shuffled

        bool isCorrect(std::string_view answer) const {
            return correctWord == secure_string(answer);
        }
    };

    /**
     * @class QuizGenerator
     * @brief Derives a verification challenge from the words of a recovery phrase.
     *
     * Decoys are drawn only from the other words of the same phrase, so the
     * options reveal nothing about the wordlist the phrase came from. Every
     * call samples afresh; a retry never sees the previous question set.
     */
    class QuizGenerator {
    public:
        static constexpr std::size_t QUESTION_COUNT = 2;
        static constexpr std::size_t OPTION_COUNT = 4;
        static constexpr std::size_t MIN_WORDS = 12;

        /**
         * @brief Generator drawing from the OpenSSL CSPRNG.
         */
        QuizGenerator();

        explicit QuizGenerator(std::shared_ptr<RandomSource> random);

        /**
         * @brief Build a quiz.
         * @param words Phrase words in order.
         * @return QUESTION_COUNT questions in ascending position order, or an
         *         empty vector if fewer than MIN_WORDS words are given or the
         *         phrase has too few distinct words to build the options.
         * @throw RandomnessException If the random source fails.
         */
        std::vector<QuizQuestion> generate(const std::vector<secure_string>& words) const;

    private:
        std::shared_ptr<RandomSource> random_;

        std::vector<std::size_t> sample(std::vector<std::size_t> pool, std::size_t count) const;
    };

} // namespace Aegis

#endif // AEGIS_QUIZ_GENERATOR_HPP
