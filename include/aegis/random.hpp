#ifndef AEGIS_RANDOM_HPP
#define AEGIS_RANDOM_HPP

#include <cstddef>
#include <cstdint>

#include "exceptions.hpp"

/**
 * @file random.hpp
 * @brief Source of uniform random indices for challenge generation.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    /**
     * @class RandomSource
     * @brief Uniform integer source. Injected so tests can script the draws.
     */
    class RandomSource {
    public:
        virtual ~RandomSource() = default;

        /**
         * @brief Draw uniformly from [0, bound).
         * @param bound Exclusive upper bound, must be > 0.
         */
        virtual std::size_t uniform(std::size_t bound) = 0;
    };

    /**
     * @class CsprngRandom
     * @brief RandomSource backed by the OpenSSL CSPRNG.
     *
     * Bounded values are produced by rejection sampling so every index is
     * equally likely.
     */
    class CsprngRandom : public RandomSource {
    public:
        /**
         * @throw RandomnessException If RAND_bytes fails.
         * @throw std::invalid_argument If bound is 0.
         */
        std::size_t uniform(std::size_t bound) override;
    };

} // namespace Aegis

#endif // AEGIS_RANDOM_HPP
