#ifndef AEGIS_SECURITY_STATE_STORE_HPP
#define AEGIS_SECURITY_STATE_STORE_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "exceptions.hpp"

/**
 * @file security_state_store.hpp
 * @brief Durable storage of the lockout counters.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    /**
     * @brief The persisted part of the security state.
     *
     * Lock status and remaining time are never stored; they are derived from
     * lockoutStartedAt, failedAttempts and the clock.
     */
    struct SecurityRecord {
        std::uint32_t failedAttempts = 0;
        std::optional<std::int64_t> lockoutStartedAt;

        bool operator==(const SecurityRecord& other) const {
            return failedAttempts == other.failedAttempts && lockoutStartedAt == other.lockoutStartedAt;
        }
    };

    using RecordMutator = std::function<SecurityRecord(const SecurityRecord&)>;

    /**
     * @class SecurityStateStore
     * @brief Storage that survives a process restart.
     *
     * update() is an atomic read-modify-write: a process killed mid-update
     * leaves either the previous or the new record, never a mix.
     */
    class SecurityStateStore {
    public:
        virtual ~SecurityStateStore() = default;

        /**
         * @throw CorruptStateException If the record fails its checksum.
         * @throw StorageException If the record is unreadable.
         */
        virtual SecurityRecord load() = 0;

        /**
         * @brief Atomically apply a mutation.
         * @return The record as written.
         * @throw CorruptStateException If the stored record fails its checksum.
         * @throw StorageException If the record is unreadable or cannot be written.
         */
        virtual SecurityRecord update(const RecordMutator& mutate) = 0;

        /**
         * @brief Replace the record without reading it. Used to recover from corruption.
         * @throw StorageException If the record cannot be written.
         */
        virtual void overwrite(const SecurityRecord& record) = 0;
    };

    /**
     * @class InMemorySecurityStateStore
     * @brief Store for hosts that persist the record through their own layer.
     */
    class InMemorySecurityStateStore : public SecurityStateStore {
    public:
        InMemorySecurityStateStore() = default;
        explicit InMemorySecurityStateStore(const SecurityRecord& initial) : record_(initial) {}

        SecurityRecord load() override;
        SecurityRecord update(const RecordMutator& mutate) override;
        void overwrite(const SecurityRecord& record) override;

    private:
        std::mutex mutex_;
        SecurityRecord record_;
    };

    /**
     * @class FileSecurityStateStore
     * @brief Key=value record file with a SHA-256 checksum line.
     *
     * The checksum is unkeyed: it detects torn or corrupted writes, not a
     * deliberate edit by someone who can rewrite the file. Writes go to
     * "<path>.tmp", are fsync'ed and then renamed over the original. A
     * missing file reads as a fresh record.
     */
    class FileSecurityStateStore : public SecurityStateStore {
    public:
        explicit FileSecurityStateStore(std::string path);

        SecurityRecord load() override;
        SecurityRecord update(const RecordMutator& mutate) override;
        void overwrite(const SecurityRecord& record) override;

        const std::string& path() const { return path_; }

        static std::string serialize(const SecurityRecord& record);

        /**
         * @throw CorruptStateException If the text is malformed or its checksum does not match.
         */
        static SecurityRecord deserialize(const std::string& text);

    private:
        std::string path_;
        std::mutex mutex_;

        SecurityRecord read() const;
        void write(const SecurityRecord& record) const;
    };

} // namespace Aegis

#endif // AEGIS_SECURITY_STATE_STORE_HPP
