#include "aegis/security_state_store.hpp"

#include <openssl/sha.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

/**
 * @file security_state_store.cpp
 * @brief In-memory and file-backed security state stores.
 * @author Aegis Project
 * @date 2026
 */

namespace Aegis {

    namespace {

        const char* const KEY_FAILED = "failed_attempts";
        const char* const KEY_STARTED = "lockout_started_at";
        const char* const KEY_CHECKSUM = "checksum";

        std::string sha256Hex(const std::string& data) {
            unsigned char hash[SHA256_DIGEST_LENGTH];
            SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

            std::ostringstream oss;
            for (unsigned char b : hash) {
                oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(b);
            }
            return oss.str();
        }

        std::string body(const SecurityRecord& record) {
            std::ostringstream oss;
            oss << KEY_FAILED << '=' << record.failedAttempts << '\n';
            oss << KEY_STARTED << '=';
            if (record.lockoutStartedAt)
                oss << *record.lockoutStartedAt;
            oss << '\n';
            return oss.str();
        }

        /**
         * @brief Split "key=value", failing if the key is not the expected one.
         */
        std::string expectField(const std::string& line, const char* key) {
            auto pos = line.find('=');
            if (pos == std::string::npos || line.compare(0, pos, key) != 0)
                throw CorruptStateException(std::string("Security state: expected field '") + key + "'");
            return line.substr(pos + 1);
        }

        std::int64_t parseInteger(const std::string& value, const char* key) {
            try {
                std::size_t consumed = 0;
                long long parsed = std::stoll(value, &consumed);
                if (consumed != value.size())
                    throw std::invalid_argument("trailing characters");
                return parsed;
            }
            catch (const std::exception&) {
                throw CorruptStateException(std::string("Security state: malformed value for '") + key + "'");
            }
        }

        void removeQuietly(const std::string& path) {
            if (std::remove(path.c_str()) != 0)
                spdlog::warn("FileSecurityStateStore: cannot remove {}: {}", path, std::strerror(errno));
        }

        void fsyncDirectoryOf(const std::string& path) {
            auto slash = path.find_last_of('/');
            std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
            if (dir.empty()) dir = "/";

            int fd = ::open(dir.c_str(), O_RDONLY);
            if (fd < 0) {
                spdlog::warn("FileSecurityStateStore: cannot open directory for fsync: {}", std::strerror(errno));
                return;
            }
            if (::fsync(fd) != 0)
                spdlog::warn("FileSecurityStateStore: directory fsync failed: {}", std::strerror(errno));
            ::close(fd);
        }
    }

    // ---------------------------------------------------------------------
    // InMemorySecurityStateStore
    // ---------------------------------------------------------------------

    SecurityRecord InMemorySecurityStateStore::load() {
        std::lock_guard<std::mutex> lock(mutex_);
        return record_;
    }

    SecurityRecord InMemorySecurityStateStore::update(const RecordMutator& mutate) {
        std::lock_guard<std::mutex> lock(mutex_);
        record_ = mutate(record_);
        return record_;
    }

    void InMemorySecurityStateStore::overwrite(const SecurityRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        record_ = record;
    }

    // ---------------------------------------------------------------------
    // FileSecurityStateStore
    // ---------------------------------------------------------------------

    FileSecurityStateStore::FileSecurityStateStore(std::string path)
        : path_(std::move(path)) {}

    std::string FileSecurityStateStore::serialize(const SecurityRecord& record) {
        std::string text = body(record);
        text += KEY_CHECKSUM;
        text += '=';
        text += sha256Hex(text);
        text += '\n';
        return text;
    }

    SecurityRecord FileSecurityStateStore::deserialize(const std::string& text) {
        std::istringstream in(text);
        std::string failedLine, startedLine, checksumLine;

        if (!std::getline(in, failedLine) || !std::getline(in, startedLine) || !std::getline(in, checksumLine))
            throw CorruptStateException("Security state: truncated record");

        SecurityRecord record;

        std::int64_t failed = parseInteger(expectField(failedLine, KEY_FAILED), KEY_FAILED);
        if (failed < 0 || failed > std::numeric_limits<std::uint32_t>::max())
            throw CorruptStateException("Security state: failed_attempts out of range");
        record.failedAttempts = static_cast<std::uint32_t>(failed);

        std::string started = expectField(startedLine, KEY_STARTED);
        if (!started.empty())
            record.lockoutStartedAt = parseInteger(started, KEY_STARTED);

        std::string checksum = expectField(checksumLine, KEY_CHECKSUM);
        if (checksum != sha256Hex(body(record)))
            throw CorruptStateException("Security state: checksum mismatch");

        return record;
    }

    SecurityRecord FileSecurityStateStore::read() const {
        if (::access(path_.c_str(), F_OK) != 0 && errno == ENOENT)
            return SecurityRecord{};

        std::ifstream file(path_, std::ios::binary);
        if (!file)
            throw StorageException("Security state: cannot open " + path_);

        std::ostringstream contents;
        contents << file.rdbuf();
        if (file.bad())
            throw StorageException("Security state: read failed: " + path_);

        return deserialize(contents.str());
    }

    void FileSecurityStateStore::write(const SecurityRecord& record) const {
        const std::string tmp = path_ + ".tmp";
        const std::string text = serialize(record);

        std::FILE* f = std::fopen(tmp.c_str(), "wb");
        if (!f)
            throw StorageException("Security state: cannot open " + tmp + ": " + std::strerror(errno));

        bool ok = std::fwrite(text.data(), 1, text.size(), f) == text.size();
        ok = ok && std::fflush(f) == 0;
        // Data must be on disk before the rename makes it visible
        ok = ok && ::fsync(::fileno(f)) == 0;

        if (std::fclose(f) != 0) ok = false;

        if (!ok) {
            removeQuietly(tmp);
            throw StorageException("Security state: write failed: " + tmp);
        }

        if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
            std::string reason = std::strerror(errno);
            removeQuietly(tmp);
            throw StorageException("Security state: rename failed: " + path_ + ": " + reason);
        }

        fsyncDirectoryOf(path_);
    }

    SecurityRecord FileSecurityStateStore::load() {
        std::lock_guard<std::mutex> lock(mutex_);
        return read();
    }

    SecurityRecord FileSecurityStateStore::update(const RecordMutator& mutate) {
        std::lock_guard<std::mutex> lock(mutex_);
        SecurityRecord current = read();
        SecurityRecord next = mutate(current);
        if (!(next == current))
            write(next);
        return next;
    }

    void FileSecurityStateStore::overwrite(const SecurityRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        write(record);
    }

} // namespace Aegis
