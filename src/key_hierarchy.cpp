#include "key_hierarchy.hpp"

// crypto_kdf context, exactly crypto_kdf_CONTEXTBYTES long
static const char WRAP_CONTEXT[] = "zkn_wrap";
static constexpr uint64_t WRAP_ENC_SUBKEY = 1;
static constexpr uint64_t WRAP_SIV_SUBKEY = 2;

bool valid_secret(const SecureBuffer& password) {
    if (password.empty() || password.size() > MAX_PASS_LEN) return false;
    const byte* p = password.data();
    for (size_t i = 0; i < password.size(); ++i) {
        if (!std::isspace(p[i])) return true;
    }
    return false; // whitespace-only
}


// -------- Derivation --------
ZkStatus derive_master_key(
    const SecureBuffer& password,
    const Bytes& salt,
    uint32_t iterations,
    MasterKey& out
)
{
    if (!valid_secret(password)) {
        audit_log_level(LogLevel::WARN,
            "derive_master_key: invalid password length",
            "key_module",
            "failure");
        return ZkStatus::VALIDATION_FAILURE;
    }
    if (salt.size() < 16 || iterations < PBKDF2_ITERATIONS) {
        audit_log_level(LogLevel::WARN,
            "derive_master_key: weak derivation parameters rejected",
            "key_module",
            "failure");
        return ZkStatus::VALIDATION_FAILURE;
    }

    MasterKey key;
    if (!pbkdf2_sha256(password.data(), password.size(),
        salt.data(), salt.size(),
        iterations,
        key.data(), key.size())) {
        return ZkStatus::INTERNAL_ERROR;
    }
    out = std::move(key);
    return ZkStatus::OK;
}

ZkStatus derive_kek(const MasterKey& master, const std::string& label, Kek& out) {
    if (label.empty()) return ZkStatus::VALIDATION_FAILURE;
    Kek kek;
    if (!hkdf_sha256(master.data(), master.size(), label, kek.data(), kek.size())) {
        return ZkStatus::INTERNAL_ERROR;
    }
    out = std::move(kek);
    return ZkStatus::OK;
}

ZkStatus derive_kek_from_password(
    const SecureBuffer& password,
    const Bytes& salt,
    uint32_t iterations,
    const std::string& label,
    Kek& out
)
{
    MasterKey master;
    ZkStatus st = derive_master_key(password, salt, iterations, master);
    if (!ok(st)) return st;
    return derive_kek(master, label, out);
}

ZkStatus derive_subkey(const Kek& kek, const std::string& label, SecureKey& out) {
    SecureKey sub;
    if (!hkdf_sha256(kek.data(), kek.size(), label, sub.data(), sub.size())) {
        return ZkStatus::INTERNAL_ERROR;
    }
    out = std::move(sub);
    return ZkStatus::OK;
}


// -------- DEKs --------
Dek generate_dek() {
    Dek dek;
    randombytes_buf(dek.data(), dek.size());
    return dek;
}

static void wrap_subkeys(const Kek& kek, SecureKey& enc, SecureKey& siv) {
    crypto_kdf_derive_from_key(enc.data(), enc.size(), WRAP_ENC_SUBKEY, WRAP_CONTEXT, kek.data());
    crypto_kdf_derive_from_key(siv.data(), siv.size(), WRAP_SIV_SUBKEY, WRAP_CONTEXT, kek.data());
}

static void synthetic_iv(const SecureKey& siv_key, const byte* dek, byte iv[NONCE_LEN]) {
    crypto_generichash(iv, NONCE_LEN, dek, KEY_LEN, siv_key.data(), siv_key.size());
}

ZkStatus wrap_dek(const Dek& dek, const Kek& kek, WrappedKey& out) {
    SecureKey enc, siv;
    wrap_subkeys(kek, enc, siv);

    WrappedKey wk;
    wk.wrapped.resize(WRAPPED_KEY_LEN);
    wk.key_id = key_id_of(kek);

    byte* iv = wk.wrapped.data();
    byte* ct = iv + NONCE_LEN;
    synthetic_iv(siv, dek.data(), iv);

    unsigned long long ct_len = 0;
    if (crypto_aead_xchacha20poly1305_ietf_encrypt(
        ct, &ct_len,
        dek.data(), dek.size(),
        nullptr, 0,
        nullptr,
        iv,
        enc.data()) != 0 || ct_len != KEY_LEN + TAG_LEN)
    {
        audit_log_level(LogLevel::ERROR,
            "wrap_dek: aead encrypt failed",
            "key_module",
            "failure");
        return ZkStatus::INTERNAL_ERROR;
    }

    out = std::move(wk);
    return ZkStatus::OK;
}

ZkStatus unwrap_dek(const WrappedKey& in, const Kek& kek, Dek& out) {
    if (in.algorithm != WrapAlg::XCHACHA20_POLY1305_SIV || in.wrapped.size() != WRAPPED_KEY_LEN) {
        audit_log_level(LogLevel::WARN,
            "unwrap_dek: malformed wrapped key",
            "key_module",
            "failure");
        return ZkStatus::INTEGRITY_FAILURE;
    }

    Bytes expected_id = key_id_of(kek);
    if (in.key_id.size() != expected_id.size() ||
        sodium_memcmp(in.key_id.data(), expected_id.data(), expected_id.size()) != 0) {
        return ZkStatus::AUTHENTICATION_FAILURE;
    }

    SecureKey enc, siv;
    wrap_subkeys(kek, enc, siv);

    const byte* iv = in.wrapped.data();
    const byte* ct = iv + NONCE_LEN;

    // right wrapping key from here on: any failure means altered bytes
    Dek dek;
    unsigned long long pt_len = 0;
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(
        dek.data(), &pt_len,
        nullptr,
        ct, KEY_LEN + TAG_LEN,
        nullptr, 0,
        iv,
        enc.data()) != 0 || pt_len != KEY_LEN)
    {
        return ZkStatus::INTEGRITY_FAILURE;
    }

    byte check[NONCE_LEN];
    synthetic_iv(siv, dek.data(), check);
    if (sodium_memcmp(check, iv, NONCE_LEN) != 0) {
        return ZkStatus::INTEGRITY_FAILURE;
    }

    out = std::move(dek);
    return ZkStatus::OK;
}

ZkStatus rewrap_dek(
    const WrappedKey& in,
    const Kek& old_kek,
    const Kek& new_kek,
    WrappedKey& out
)
{
    Dek dek;
    ZkStatus st = unwrap_dek(in, old_kek, dek);
    if (!ok(st)) return st;
    return wrap_dek(dek, new_kek, out);
}

ZkStatus rewrap_all(
    const std::vector<RewrapItem>& in,
    const Kek& old_kek,
    const Kek& new_kek,
    std::vector<RewrapItem>& out
)
{
    std::vector<RewrapItem> staged;
    staged.reserve(in.size());

    for (const auto& item : in) {
        RewrapItem next;
        next.id = item.id;
        ZkStatus st = rewrap_dek(item.wrapped, old_kek, new_kek, next.wrapped);
        if (!ok(st)) {
            audit_log_level(LogLevel::ERROR,
                "rewrap_all: aborted, entity " + item.id + " did not unwrap",
                "key_module",
                "failure");
            return st;
        }
        staged.push_back(std::move(next));
    }

    out = std::move(staged);
    return ZkStatus::OK;
}
