#pragma once
#include "secure_buffer.hpp"
#include "zknotes_common.hpp"

// 256-bit key held in guarded memory. The subclasses only exist so the
// compiler keeps a KEK from being passed where a DEK is expected.
class SecureKey {
public:
    SecureKey()
        : buf_(KEY_LEN)
    {
    }

    SecureKey(const byte* raw, size_t len)
        : buf_(KEY_LEN)
    {
        if (len != KEY_LEN) {
            throw std::invalid_argument("SecureKey: wrong key length");
        }
        std::memcpy(buf_.data(), raw, KEY_LEN);
    }

    // non-copyable
    SecureKey(const SecureKey&) = delete;
    SecureKey& operator=(const SecureKey&) = delete;

    SecureKey(SecureKey&&) noexcept = default;
    SecureKey& operator=(SecureKey&&) noexcept = default;

    unsigned char* data() { return buf_.data(); }
    const unsigned char* data() const { return buf_.data(); }
    size_t size() const { return buf_.size(); }

    bool equals(const SecureKey& other) const {
        return size() == other.size() &&
            sodium_memcmp(data(), other.data(), size()) == 0;
    }

    void wipe() { sodium_memzero(buf_.data(), buf_.size()); }

private:
    SecureBuffer buf_;
};

// Derived from the account password, lives only in memory
class MasterKey : public SecureKey {
public:
    using SecureKey::SecureKey;
};

// Key-encrypting key, only ever used to wrap/unwrap DEKs
class Kek : public SecureKey {
public:
    using SecureKey::SecureKey;
};

// Per-entity data-encrypting key
class Dek : public SecureKey {
public:
    using SecureKey::SecureKey;
};

// Derived from the 24-word recovery phrase
class RecoveryKeyMaterial : public SecureKey {
public:
    using SecureKey::SecureKey;
};
