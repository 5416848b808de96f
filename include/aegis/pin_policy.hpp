#ifndef AEGIS_PIN_POLICY_HPP
#define AEGIS_PIN_POLICY_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file pin_policy.hpp
 * @brief PIN complexity rules.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    enum class PinStrength {
        weak,
        acceptable,
        strong
    };

    /**
     * @brief Outcome of a PIN validation. Produced fresh on each call, never persisted.
     *
     * errors[0] is the single most actionable violation.
     */
    struct PinValidationResult {
        bool isValid = false;
        PinStrength strength = PinStrength::weak;
        std::vector<std::string> errors;
    };

    /**
     * @class PinPolicy
     * @brief Stateless validation of PIN strength.
     */
    class PinPolicy {
    public:
        static constexpr std::size_t MIN_LENGTH = 6;
        static constexpr std::size_t MAX_LENGTH = 8;

        /**
         * @brief Validate a candidate PIN.
         *
         * Rejects wrong lengths, non-digits, all-identical digits, strictly
         * ascending or descending sequences, repetitions of a 2- or 3-digit
         * cycle and a blocklist of commonly chosen PINs.
         *
         * A valid PIN is strong when no digit occurs more than twice and it
         * contains no ascending or descending run of 3 or more digits.
         *
         * @param pin Candidate PIN.
         * @return Validation result.
         */
        static PinValidationResult validate(std::string_view pin);

        static bool isAllSameDigit(std::string_view pin);
        static bool isSequential(std::string_view pin);
        static bool hasRepeatedCycle(std::string_view pin);
        static bool isCommonPin(std::string_view pin);
    };

} // namespace Aegis

#endif // AEGIS_PIN_POLICY_HPP
