#include "aegis/pin_policy.hpp"

#include <algorithm>
#include <array>

/**
 * @file pin_policy.cpp
 * @brief Implementation of the PIN complexity rules.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    namespace {

        // PINs that appear at the top of every leaked-PIN frequency table.
        // Structural rules already catch most of them; the rest are listed here.
        const std::array<std::string_view, 40> COMMON_PINS = {
            "000000", "111111", "222222", "333333", "444444",
            "555555", "666666", "777777", "888888", "999999",
            "123456", "654321", "123123", "112233", "121212",
            "696969", "000001", "100000", "420420", "112211",
            "131313", "141414", "151515", "161616", "171717",
            "181818", "191919", "101010", "102030", "010203",
            "123321", "789456", "456789", "987654", "147258",
            "258369", "369258", "159753", "357159", "246810"
        };

        inline bool isDigit(char c) {
            return c >= '0' && c <= '9';
        }

        /**
         * @brief Longest run of digits each one above (or each one below) its predecessor.
         */
        std::size_t longestSequentialRun(std::string_view pin) {
            if (pin.empty()) return 0;

            std::size_t longest = 1;
            std::size_t up = 1;
            std::size_t down = 1;

            for (std::size_t i = 1; i < pin.size(); ++i) {
                int step = pin[i] - pin[i - 1];
                up = (step == 1) ? up + 1 : 1;
                down = (step == -1) ? down + 1 : 1;
                longest = std::max(longest, std::max(up, down));
            }
            return longest;
        }

        std::size_t maxDigitOccurrences(std::string_view pin) {
            std::array<std::size_t, 10> counts{};
            for (char c : pin) {
                if (isDigit(c)) ++counts[static_cast<std::size_t>(c - '0')];
            }
            return *std::max_element(counts.begin(), counts.end());
        }

        bool repeatsCycle(std::string_view pin, std::size_t cycle) {
            if (pin.size() <= cycle || pin.size() % cycle != 0) return false;
            for (std::size_t i = cycle; i < pin.size(); ++i) {
                if (pin[i] != pin[i % cycle]) return false;
            }
            return true;
        }
    }

    bool PinPolicy::isAllSameDigit(std::string_view pin) {
        if (pin.size() < 2) return false;
        return std::all_of(pin.begin(), pin.end(), [&](char c) { return c == pin.front(); });
    }

    bool PinPolicy::isSequential(std::string_view pin) {
        if (pin.size() < 3) return false;
        return longestSequentialRun(pin) == pin.size();
    }

    bool PinPolicy::hasRepeatedCycle(std::string_view pin) {
        return repeatsCycle(pin, 2) || repeatsCycle(pin, 3);
    }

    bool PinPolicy::isCommonPin(std::string_view pin) {
        return std::find(COMMON_PINS.begin(), COMMON_PINS.end(), pin) != COMMON_PINS.end();
    }

    PinValidationResult PinPolicy::validate(std::string_view pin) {
        PinValidationResult result;

        if (pin.size() < MIN_LENGTH)
            result.errors.push_back("PIN must be at least " + std::to_string(MIN_LENGTH) + " digits");
        if (pin.size() > MAX_LENGTH)
            result.errors.push_back("PIN must be at most " + std::to_string(MAX_LENGTH) + " digits");

        if (pin.empty() || !std::all_of(pin.begin(), pin.end(), isDigit))
            result.errors.push_back("PIN must contain only numbers");

        bool patterned = false;
        if (isAllSameDigit(pin)) {
            result.errors.push_back("PIN cannot be all the same digit");
            patterned = true;
        }
        else {
            if (isSequential(pin)) {
                result.errors.push_back("PIN cannot be a sequence of consecutive digits");
                patterned = true;
            }
            if (hasRepeatedCycle(pin)) {
                result.errors.push_back("PIN cannot repeat a short pattern");
                patterned = true;
            }
        }

        if (!patterned && isCommonPin(pin))
            result.errors.push_back("This PIN is too common and easily guessed");

        result.isValid = result.errors.empty();

        if (!result.isValid)
            result.strength = PinStrength::weak;
        else if (maxDigitOccurrences(pin) <= 2 && longestSequentialRun(pin) < 3)
            result.strength = PinStrength::strong;
        else
            result.strength = PinStrength::acceptable;

        return result;
    }

} // namespace Aegis
