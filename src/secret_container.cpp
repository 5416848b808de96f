#include "aegis/secret_container.hpp"

#include <cctype>
#include <utility>

/**
 * @file secret_container.cpp
 * @brief Implementation of the SecretContainer.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    namespace {

        inline bool isSpace(char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }
    }

    SecretContainer::~SecretContainer() {
        secret_.clear();
    }

    void SecretContainer::set(secure_string&& secret) {
        if (!secret_.empty())
            throw AlreadyPopulated("SecretContainer already holds a secret; clear() it first.");

        secret_ = std::move(secret);
        secret.clear();
        ++version_;
    }

    secure_string SecretContainer::get() const {
        return secret_.clone();
    }

    std::vector<secure_string> SecretContainer::getWords() const {
        std::vector<secure_string> words;

        const char* p = secret_.data();
        const std::size_t len = secret_.size();
        std::size_t i = 0;

        while (i < len) {
            while (i < len && isSpace(p[i])) ++i;
            std::size_t start = i;
            while (i < len && !isSpace(p[i])) ++i;
            if (i > start)
                words.emplace_back(p + start, i - start);
        }

        return words;
    }

    void SecretContainer::clear() noexcept {
        secret_.clear();
        ++version_;
    }

} // namespace Aegis
