#include "aegis/random.hpp"

#include <openssl/rand.h>

#include <limits>
#include <stdexcept>

/**
 * @file random.cpp
 * @brief OpenSSL-backed uniform integer source.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    namespace {

        std::uint32_t randomWord() {
            std::uint32_t value = 0;
            if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1)
                throw RandomnessException("CSPRNG byte generation failed.");
            return value;
        }
    }

    std::size_t CsprngRandom::uniform(std::size_t bound) {
        if (bound == 0)
            throw std::invalid_argument("CsprngRandom::uniform bound must be positive");
        if (bound > std::numeric_limits<std::uint32_t>::max())
            throw std::invalid_argument("CsprngRandom::uniform bound exceeds 32 bits");

        const std::uint32_t b = static_cast<std::uint32_t>(bound);

        // Values below `limit` map evenly onto [0, b); everything above is redrawn.
        const std::uint32_t limit = std::numeric_limits<std::uint32_t>::max()
                                  - (std::numeric_limits<std::uint32_t>::max() % b);

        std::uint32_t value = randomWord();
        while (value >= limit)
            value = randomWord();

        return value % b;
    }

} // namespace Aegis
