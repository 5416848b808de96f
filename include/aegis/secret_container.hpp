#ifndef AEGIS_SECRET_CONTAINER_HPP
#define AEGIS_SECRET_CONTAINER_HPP

#include <cstdint>
#include <vector>

#include "exceptions.hpp"
#include "secure_string.hpp"

/**
 * @file secret_container.hpp
 * @brief Declaration of the SecretContainer holding a flow's recovery phrase.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    /**
     * @class SecretContainer
     * @brief Exclusive, explicitly-wiped holder of secret bytes for one flow.
     *
     * The container owns the only long-lived copy of the secret. Accessors hand
     * out zeroizing secure_string copies which the caller MUST NOT retain beyond
     * the current synchronous operation: store neither the returned value nor
     * a view into it in long-lived state.
     *
     * version() increments on every set() and clear() call so observers can
     * react to a change without touching the content.
     */
    class SecretContainer {
    public:
        SecretContainer() = default;

        /**
         * @brief Wipes the secret.
         */
        ~SecretContainer();

        SecretContainer(const SecretContainer&) = delete;
        SecretContainer& operator=(const SecretContainer&) = delete;
        SecretContainer(SecretContainer&&) = delete;
        SecretContainer& operator=(SecretContainer&&) = delete;

        /**
         * @brief Populate the container, taking ownership of the secret.
         * @param secret The secret bytes; moved from.
         * @throw AlreadyPopulated If live content is already held.
         */
        void set(secure_string&& secret);

        /**
         * @brief Copy of the raw secret.
         * @return Zeroizing copy, empty if the container is empty or cleared.
         */
        secure_string get() const;

        /**
         * @brief Whitespace-separated words of the secret.
         * @return Words in order, empty if the container is empty or cleared.
         */
        std::vector<secure_string> getWords() const;

        /**
         * @brief Overwrite the secret with zeros and release it. Idempotent.
         */
        void clear() noexcept;

        bool isPopulated() const { return !secret_.empty(); }

        std::uint64_t version() const { return version_; }

    private:
        secure_string secret_;
        std::uint64_t version_ = 0;
    };

} // namespace Aegis

#endif // AEGIS_SECRET_CONTAINER_HPP
