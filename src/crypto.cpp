#include "crypto.hpp"
#include "encoding.hpp"

// -------- Randomness --------
Bytes random_bytes(size_t n) {
    Bytes out(n);
    if (n > 0) randombytes_buf(out.data(), n);
    return out;
}

Bytes generate_salt() {
    return random_bytes(SALT_LEN);
}

std::string sha256_hex(const std::string& data) {
    byte digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(digest,
        reinterpret_cast<const byte*>(data.data()),
        data.size());
    return to_hex(digest, sizeof(digest));
}


// -------- PBKDF2-HMAC-SHA256 --------
bool pbkdf2_sha256( // password stretching on libsodium's HMAC-SHA256
    const byte* pw,
    size_t pw_len,
    const byte* salt,
    size_t salt_len,
    uint32_t iterations,
    byte* out,
    size_t out_len
)
{
    if ((!pw && pw_len > 0) || !salt || !out) {
        audit_log_level(LogLevel::ERROR,
            "pbkdf2_sha256: null pointer",
            "crypto_module",
            "failure");
        return false;
    }
    if (iterations == 0 || out_len == 0 || pw_len > MAX_PASS_LEN * 4) {
        audit_log_level(LogLevel::WARN,
            "pbkdf2_sha256: invalid parameters",
            "crypto_module",
            "failure");
        return false;
    }

    // keyed state computed once, copied for every block
    crypto_auth_hmacsha256_state keyed;
    crypto_auth_hmacsha256_init(&keyed, pw, pw_len);

    byte u[crypto_auth_hmacsha256_BYTES];
    byte t[crypto_auth_hmacsha256_BYTES];
    size_t produced = 0;

    for (uint32_t block = 1; produced < out_len; ++block) {
        byte be[4] = {
            static_cast<byte>(block >> 24),
            static_cast<byte>(block >> 16),
            static_cast<byte>(block >> 8),
            static_cast<byte>(block)
        };

        crypto_auth_hmacsha256_state st = keyed;
        crypto_auth_hmacsha256_update(&st, salt, salt_len);
        crypto_auth_hmacsha256_update(&st, be, sizeof(be));
        crypto_auth_hmacsha256_final(&st, u);
        std::memcpy(t, u, sizeof(t));

        for (uint32_t i = 1; i < iterations; ++i) {
            st = keyed;
            crypto_auth_hmacsha256_update(&st, u, sizeof(u));
            crypto_auth_hmacsha256_final(&st, u);
            for (size_t k = 0; k < sizeof(t); ++k) t[k] ^= u[k];
        }

        size_t take = (std::min)(sizeof(t), out_len - produced);
        std::memcpy(out + produced, t, take);
        produced += take;
    }

    sodium_memzero(u, sizeof(u));
    sodium_memzero(t, sizeof(t));
    sodium_memzero(&keyed, sizeof(keyed));
    return true;
}


// -------- HKDF-SHA256 --------
bool hkdf_sha256(
    const byte* ikm,
    size_t ikm_len,
    const std::string& info,
    byte* out,
    size_t out_len
)
{
    if (!ikm || !out || out_len == 0 || out_len > 255 * crypto_auth_hmacsha256_BYTES) {
        audit_log_level(LogLevel::ERROR,
            "hkdf_sha256: invalid parameters",
            "crypto_module",
            "failure");
        return false;
    }

    // extract
    const byte zero_salt[crypto_auth_hmacsha256_BYTES] = { 0 };
    byte prk[crypto_auth_hmacsha256_BYTES];
    crypto_auth_hmacsha256_state st;
    crypto_auth_hmacsha256_init(&st, zero_salt, sizeof(zero_salt));
    crypto_auth_hmacsha256_update(&st, ikm, ikm_len);
    crypto_auth_hmacsha256_final(&st, prk);

    // expand
    byte t[crypto_auth_hmacsha256_BYTES];
    size_t t_len = 0;
    size_t produced = 0;
    for (byte counter = 1; produced < out_len; ++counter) {
        crypto_auth_hmacsha256_init(&st, prk, sizeof(prk));
        crypto_auth_hmacsha256_update(&st, t, t_len);
        crypto_auth_hmacsha256_update(&st,
            reinterpret_cast<const byte*>(info.data()), info.size());
        crypto_auth_hmacsha256_update(&st, &counter, 1);
        crypto_auth_hmacsha256_final(&st, t);
        t_len = sizeof(t);

        size_t take = (std::min)(sizeof(t), out_len - produced);
        std::memcpy(out + produced, t, take);
        produced += take;
    }

    sodium_memzero(prk, sizeof(prk));
    sodium_memzero(t, sizeof(t));
    sodium_memzero(&st, sizeof(st));
    return true;
}

Bytes key_id_of(const SecureKey& key) {
    static const char tag[] = "zknotes-key-id";
    Bytes id(KEY_ID_LEN);
    crypto_generichash(id.data(), id.size(),
        reinterpret_cast<const byte*>(tag), sizeof(tag) - 1,
        key.data(), key.size());
    return id;
}


// -------- Authenticated encryption --------
ZkStatus encrypt_blob( // XChaCha20-Poly1305-IETF, fresh nonce per call
    const SecureKey& key,
    const byte* plaintext,
    size_t plen,
    EncryptedBlob& out
)
{
    if (plen > 0 && !plaintext) {
        audit_log_level(LogLevel::ERROR,
            "encrypt_blob: non-zero length but plaintext null",
            "crypto_module",
            "failure");
        return ZkStatus::INTERNAL_ERROR;
    }

    if (plen > MAX_CONTENT_LEN) {
        audit_log_level(LogLevel::WARN,
            "encrypt_blob: plaintext too large",
            "crypto_module",
            "failure");
        return ZkStatus::VALIDATION_FAILURE;
    }

    EncryptedBlob blob;
    blob.iv = random_bytes(NONCE_LEN);
    blob.ciphertext.resize(plen);
    blob.tag.resize(TAG_LEN);
    blob.key_id = key_id_of(key);

    byte empty = 0;
    byte* ct = plen ? blob.ciphertext.data() : &empty;
    const byte* pt = plen ? plaintext : &empty;

    unsigned long long tag_len = 0;
    if (crypto_aead_xchacha20poly1305_ietf_encrypt_detached(
        ct,
        blob.tag.data(),
        &tag_len,
        pt,
        plen,
        nullptr,          // additional data - none
        0,
        nullptr,          // nsec - not used
        blob.iv.data(),
        key.data()) != 0 || tag_len != TAG_LEN)
    {
        audit_log_level(LogLevel::ERROR,
            "encrypt_blob: crypto_aead_xchacha20poly1305_ietf_encrypt_detached failed",
            "crypto_module",
            "failure");
        return ZkStatus::INTERNAL_ERROR;
    }

    out = std::move(blob);
    return ZkStatus::OK;
}

ZkStatus decrypt_blob(
    const SecureKey& key,
    const EncryptedBlob& in,
    SecureBuffer& out
)
{
    if (in.algorithm != CipherAlg::XCHACHA20_POLY1305 ||
        in.iv.size() != NONCE_LEN || in.tag.size() != TAG_LEN) {
        audit_log_level(LogLevel::WARN,
            "decrypt_blob: malformed blob",
            "crypto_module",
            "failure");
        return ZkStatus::INTEGRITY_FAILURE;
    }

    Bytes expected_id = key_id_of(key);
    if (in.key_id.size() != expected_id.size() ||
        sodium_memcmp(in.key_id.data(), expected_id.data(), expected_id.size()) != 0) {
        return ZkStatus::AUTHENTICATION_FAILURE;
    }

    SecureBuffer plain(in.ciphertext.size());
    byte empty = 0;
    byte* pt = plain.size() ? plain.data() : &empty;
    const byte* ct = in.ciphertext.empty() ? &empty : in.ciphertext.data();

    if (crypto_aead_xchacha20poly1305_ietf_decrypt_detached(
        pt,
        nullptr,      // nsec - not used
        ct,
        in.ciphertext.size(),
        in.tag.data(),
        nullptr,      // additional data - none
        0,
        in.iv.data(),
        key.data()) != 0)
    {
        // right key id, so the bytes were altered
        audit_log_level(LogLevel::WARN,
            "decrypt_blob: authentication tag mismatch",
            "crypto_module",
            "failure");
        return ZkStatus::INTEGRITY_FAILURE;
    }

    out = std::move(plain);
    return ZkStatus::OK;
}

ZkStatus encrypt_text(const SecureKey& key, const std::string& text, EncryptedBlob& out) {
    return encrypt_blob(key,
        reinterpret_cast<const byte*>(text.data()),
        text.size(),
        out);
}

ZkStatus decrypt_text(const SecureKey& key, const EncryptedBlob& in, std::string& out) {
    SecureBuffer plain;
    ZkStatus st = decrypt_blob(key, in, plain);
    if (!ok(st)) return st;
    out = plain.str();
    return ZkStatus::OK;
}
