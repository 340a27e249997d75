#pragma once
#include "zknotes_common.hpp"
#include "envelope.hpp"
#include "secure_buffer.hpp"
#include "secure_key.hpp"
#include "status.hpp"
#include "logging.hpp"

// -------- Randomness --------
Bytes random_bytes(size_t n);
Bytes generate_salt();

// -------- Hashing / derivation primitives --------
std::string sha256_hex(const std::string& data);

// PBKDF2-HMAC-SHA256 (RFC 8018)
bool pbkdf2_sha256(
    const byte* pw,
    size_t pw_len,
    const byte* salt,
    size_t salt_len,
    uint32_t iterations,
    byte* out,
    size_t out_len
);

// HKDF-SHA256 (RFC 5869), all-zero salt, info = domain label
bool hkdf_sha256(
    const byte* ikm,
    size_t ikm_len,
    const std::string& info,
    byte* out,
    size_t out_len
);

// Short public identifier of a key (keyed BLAKE2b of a fixed string)
Bytes key_id_of(const SecureKey& key);

// -------- Authenticated encryption (XChaCha20-Poly1305, detached tag) --------
ZkStatus encrypt_blob(
    const SecureKey& key,
    const byte* plaintext,
    size_t plen,
    EncryptedBlob& out
);

// AUTHENTICATION_FAILURE if the blob was made under another key,
// INTEGRITY_FAILURE if iv/ciphertext/tag were altered.
ZkStatus decrypt_blob(
    const SecureKey& key,
    const EncryptedBlob& in,
    SecureBuffer& out
);

ZkStatus encrypt_text(const SecureKey& key, const std::string& text, EncryptedBlob& out);
ZkStatus decrypt_text(const SecureKey& key, const EncryptedBlob& in, std::string& out);
