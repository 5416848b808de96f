/**
 * @file secure_string.hpp
 * @brief Memory-hardened container for PINs, tokens and recovery phrases.
 * @author Aegis Project
 * @date 2026
 */

#ifndef AEGIS_SECURE_STRING_HPP
#define AEGIS_SECURE_STRING_HPP

#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <new>
#include <string>
#include <string_view>
#include <vector>

#if defined(_WIN32) || defined(_WIN64)
    #include <windows.h>
#endif

namespace Aegis {

    /**
     * @brief Optimization-resistant memory zeroization.
     */
    inline void secure_memzero(void* ptr, size_t size) noexcept {
        if (!ptr || size == 0) return;

#if defined(_WIN32) || defined(_WIN64)
        RtlSecureZeroMemory(ptr, size);
#elif defined(__STDC_LIB_EXT1__)
        memset_s(ptr, size, 0, size);
#else
        volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
        while (size--) *p++ = 0;
        std::atomic_thread_fence(std::memory_order_seq_cst);
#endif
    }

    /**
     * @brief Allocator that zeroizes every block it hands back.
     * Vector growth therefore never leaves a stale copy of a PIN or phrase behind.
     */
    template <typename T>
    struct zero_allocator {
        using value_type = T;
        zero_allocator() = default;
        template <class U> constexpr zero_allocator(const zero_allocator<U>&) noexcept {}

        T* allocate(std::size_t n) {
            if (n > std::size_t(-1) / sizeof(T)) throw std::bad_alloc();
            if (auto p = static_cast<T*>(std::malloc(n * sizeof(T)))) return p;
            throw std::bad_alloc();
        }

        void deallocate(T* p, std::size_t n) noexcept {
            secure_memzero(p, n * sizeof(T));
            std::free(p);
        }
    };

    template <class T, class U>
    constexpr bool operator==(const zero_allocator<T>&, const zero_allocator<U>&) noexcept { return true; }

    template <class T, class U>
    constexpr bool operator!=(const zero_allocator<T>&, const zero_allocator<U>&) noexcept { return false; }

    /**
     * @class secure_string
     * @brief RAII container for every secret the credential flows handle.
     *
     * Copying is deleted so a secret has one owner at a time. Where a second
     * copy is genuinely needed (handing a PIN to the backend) it has to be
     * spelled out with clone(), and the clone wipes itself the same way.
     */
    class secure_string {
    private:
        std::vector<char, zero_allocator<char>> buffer;

    public:
        secure_string() = default;

        explicit secure_string(const std::string& str)
            : buffer(str.begin(), str.end()) {}

        explicit secure_string(std::string_view str)
            : buffer(str.begin(), str.end()) {}

        secure_string(const char* str) {
            if (str) buffer.assign(str, str + std::strlen(str));
        }

        secure_string(const char* str, size_t len) {
            if (str && len) buffer.assign(str, str + len);
        }

        ~secure_string() = default; // Zeroization handled by allocator

        secure_string(const secure_string&) = delete;
        secure_string& operator=(const secure_string&) = delete;

        secure_string(secure_string&&) noexcept = default;
        secure_string& operator=(secure_string&&) noexcept = default;

        /**
         * @brief Explicit deep copy into a new zeroizing buffer.
         */
        secure_string clone() const {
            return secure_string(buffer.data(), buffer.size());
        }

        // Data Access
        char* data() { return buffer.data(); }
        const char* data() const { return buffer.data(); }
        size_t size() const { return buffer.size(); }
        bool empty() const { return buffer.empty(); }

        /**
         * @brief Non-owning view, valid until the next mutation of this object.
         */
        std::string_view view() const { return std::string_view(buffer.data(), buffer.size()); }

        void push_back(char c) { buffer.push_back(c); }

        void pop_back() {
            if (buffer.empty()) return;
            buffer.back() = 0;
            buffer.pop_back();
        }

        void append(const char* str, size_t len) {
            if (str && len) buffer.insert(buffer.end(), str, str + len);
        }

        /**
         * @brief Wipe the content now and release the storage.
         * Safe to call repeatedly.
         */
        void clear() noexcept {
            secure_memzero(buffer.data(), buffer.size());
            std::vector<char, zero_allocator<char>>().swap(buffer);
        }

        /**
         * @brief Constant-time comparison to prevent timing side-channel attacks.
         */
        bool operator==(const secure_string& other) const {
            if (size() != other.size()) return false;
            volatile unsigned char diff = 0;
            for (size_t i = 0; i < size(); ++i) {
                diff |= (buffer[i] ^ other.buffer[i]);
            }
            return diff == 0;
        }

        bool operator!=(const secure_string& other) const { return !(*this == other); }
    };

} // namespace Aegis

#endif // AEGIS_SECURE_STRING_HPP
