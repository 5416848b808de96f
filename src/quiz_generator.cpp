#include "aegis/quiz_generator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>
#include <utility>

/**
 * @file quiz_generator.cpp
 * @brief Implementation of the QuizGenerator.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    QuizGenerator::QuizGenerator()
        : random_(std::make_shared<CsprngRandom>()) {}

    QuizGenerator::QuizGenerator(std::shared_ptr<RandomSource> random)
        : random_(std::move(random)) {}

    std::vector<std::size_t> QuizGenerator::sample(std::vector<std::size_t> pool, std::size_t count) const {
        // Partial Fisher-Yates: the first `count` slots end up a uniform draw without replacement
        count = std::min(count, pool.size());
        for (std::size_t i = 0; i < count; ++i) {
            std::size_t j = i + random_->uniform(pool.size() - i);
            std::swap(pool[i], pool[j]);
        }
        pool.resize(count);
        return pool;
    }

    std::vector<QuizQuestion> QuizGenerator::generate(const std::vector<secure_string>& words) const {
        std::vector<QuizQuestion> quiz;

        if (words.size() < MIN_WORDS)
            return quiz;

        std::vector<std::size_t> allPositions(words.size());
        std::iota(allPositions.begin(), allPositions.end(), 0);

        std::vector<std::size_t> positions = sample(allPositions, QUESTION_COUNT);
        std::sort(positions.begin(), positions.end());

        for (std::size_t pos : positions) {
            // Candidate decoys: other slots, one per distinct word, never equal to the answer
            std::vector<std::size_t> candidates;
            for (std::size_t i = 0; i < words.size(); ++i) {
                if (i == pos || words[i] == words[pos]) continue;
                bool duplicate = std::any_of(candidates.begin(), candidates.end(),
                    [&](std::size_t c) { return words[c] == words[i]; });
                if (!duplicate) candidates.push_back(i);
            }

            if (candidates.size() < OPTION_COUNT - 1) {
                spdlog::warn("QuizGenerator::generate: phrase has too few distinct words for a challenge");
                return {};
            }

            QuizQuestion question;
            question.position = pos + 1;
            question.correctWord = words[pos].clone();

            question.options.reserve(OPTION_COUNT);
            question.options.push_back(words[pos].clone());
            for (std::size_t d : sample(std::move(candidates), OPTION_COUNT - 1))
                question.options.push_back(words[d].clone());

            for (std::size_t i = question.options.size() - 1; i > 0; --i) {
                std::size_t j = random_->uniform(i + 1);
                if (i != j) std::swap(question.options[i], question.options[j]);
            }

            quiz.push_back(std::move(question));
        }

        return quiz;
    }

} // namespace Aegis
