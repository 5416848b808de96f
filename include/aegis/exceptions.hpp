#ifndef AEGIS_EXCEPTIONS_HPP
#define AEGIS_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

/**
 * @file exceptions.hpp
 * @brief Exception hierarchy for credential and secret-material handling.
 * @author Aegis Project
 * @date 2026
 *
 * Exceptions signal API misuse and environment failures only. Outcomes of
 * user input (wrong PIN, weak PIN, lockout) are reported as FlowError values
 * by the state machines and never thrown.
 *
 * No exception message ever carries secret material.
 */

namespace Aegis {

    /**
     * @class CredentialException
     * @brief Base class for all exceptions raised by this library.
     *
     * Catch this type if you want to handle every Aegis error.
     */
    class CredentialException : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @class AlreadyPopulated
     * @brief Thrown by SecretContainer::set() when live content is present.
     *
     * Callers must clear() the container before reusing it.
     */
    class AlreadyPopulated : public CredentialException
    {
    public:
        using CredentialException::CredentialException;
    };

    /**
     * @class InvalidTransition
     * @brief Thrown when a flow operation is invoked in a step that does not permit it.
     */
    class InvalidTransition : public CredentialException
    {
    public:
        using CredentialException::CredentialException;
    };

    /**
     * @class StorageException
     * @brief Thrown when the security state cannot be read or written.
     */
    class StorageException : public CredentialException
    {
    public:
        using CredentialException::CredentialException;
    };

    /**
     * @class CorruptStateException
     * @brief Thrown when a persisted security record fails its checksum.
     */
    class CorruptStateException : public StorageException
    {
    public:
        using StorageException::StorageException;
    };

    /**
     * @class ConfigException
     * @brief Thrown on a malformed configuration value.
     */
    class ConfigException : public CredentialException
    {
    public:
        using CredentialException::CredentialException;
    };

    /**
     * @class RandomnessException
     * @brief Thrown when the CSPRNG fails to produce bytes.
     */
    class RandomnessException : public CredentialException
    {
    public:
        using CredentialException::CredentialException;
    };

} // namespace Aegis

#endif // AEGIS_EXCEPTIONS_HPP
