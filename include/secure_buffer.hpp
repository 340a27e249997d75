#pragma once
#include <sodium.h>
#include <stdexcept>
#include <cstddef>
#include <cstring>
#include <string>

// Guarded, locked heap buffer for passwords and plaintext.
// Wiped and released on destruction; never copied.
class SecureBuffer {
public:
    explicit SecureBuffer(size_t size = 0)
        : size_(size)
    {
        if (size_ == 0) return;

        ptr_ = static_cast<unsigned char*>(sodium_malloc(size_));
        if (!ptr_) {
            throw std::runtime_error("SecureBuffer: sodium_malloc failed");
        }

        // RLIMIT_MEMLOCK may be small; sodium_malloc already guards the pages
        locked_ = (sodium_mlock(ptr_, size_) == 0);

        sodium_mprotect_readwrite(ptr_);
        sodium_memzero(ptr_, size_);
    }

    SecureBuffer(const void* src, size_t size)
        : SecureBuffer(size)
    {
        if (size_ > 0) std::memcpy(ptr_, src, size_);
    }

    static SecureBuffer from_string(const std::string& s) {
        return SecureBuffer(s.data(), s.size());
    }

    // Non-copyable
    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    // Movable
    SecureBuffer(SecureBuffer&& other) noexcept
        : ptr_(other.ptr_), size_(other.size_), locked_(other.locked_)
    {
        other.ptr_ = nullptr;
        other.size_ = 0;
        other.locked_ = false;
    }

    SecureBuffer& operator=(SecureBuffer&& other) noexcept {
        if (this != &other) {
            cleanup();
            ptr_ = other.ptr_;
            size_ = other.size_;
            locked_ = other.locked_;
            other.ptr_ = nullptr;
            other.size_ = 0;
            other.locked_ = false;
        }
        return *this;
    }

    ~SecureBuffer() {
        cleanup();
    }

    unsigned char* data() { return ptr_; }
    const unsigned char* data() const { return ptr_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    const char* chars() const { return reinterpret_cast<const char*>(ptr_); }

    // Copies out of locked memory; caller owns wiping the result
    std::string str() const {
        return size_ ? std::string(chars(), size_) : std::string();
    }

private:
    unsigned char* ptr_ = nullptr;
    size_t size_ = 0;
    bool locked_ = false;

    void cleanup() {
        if (ptr_) {
            sodium_mprotect_readwrite(ptr_);
            sodium_memzero(ptr_, size_);
            if (locked_) sodium_munlock(ptr_, size_);
            sodium_free(ptr_);
            ptr_ = nullptr;
            size_ = 0;
        }
    }
};
