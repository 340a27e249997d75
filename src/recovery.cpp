#include "recovery.hpp"

RecoveryKey generate_recovery_key(int64_t now_ms) {
    RecoveryKey rk;
    rk.words.reserve(RECOVERY_WORD_COUNT);
    // uniform draw with replacement
    for (size_t i = 0; i < RECOVERY_WORD_COUNT; ++i) {
        uint32_t idx = randombytes_uniform(static_cast<uint32_t>(recovery_wordlist_size()));
        rk.words.emplace_back(recovery_word_at(idx));
    }
    rk.created_at = now_ms;
    return rk;
}

ZkStatus validate_recovery_words(const std::vector<std::string>& words) {
    if (words.size() != RECOVERY_WORD_COUNT) {
        audit_log_level(LogLevel::WARN,
            "Recovery phrase rejected: wrong word count",
            "recovery_module",
            "failure");
        return ZkStatus::VALIDATION_FAILURE;
    }
    for (const auto& w : words) {
        if (!is_recovery_word(w)) {
            audit_log_level(LogLevel::WARN,
                "Recovery phrase rejected: unlisted word",
                "recovery_module",
                "failure");
            return ZkStatus::VALIDATION_FAILURE;
        }
    }
    return ZkStatus::OK;
}

std::string normalize_recovery_phrase(const std::vector<std::string>& words) {
    std::string phrase;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i) phrase.push_back(' ');
        phrase += to_lower(words[i]);
    }
    return phrase;
}

std::string hash_recovery_key(const std::vector<std::string>& words) {
    std::string phrase = normalize_recovery_phrase(words);
    std::string h = sha256_hex(phrase);
    sodium_memzero(&phrase[0], phrase.size());
    return h;
}

bool verify_recovery_key(const std::vector<std::string>& words, const std::string& expected_hash) {
    std::string actual = hash_recovery_key(words);
    return actual.size() == expected_hash.size() &&
        sodium_memcmp(actual.data(), expected_hash.data(), actual.size()) == 0;
}

ZkStatus derive_key_from_recovery_words(
    const std::vector<std::string>& words,
    RecoveryKeyMaterial& out
)
{
    ZkStatus st = validate_recovery_words(words);
    if (!ok(st)) return st;

    std::string phrase = normalize_recovery_phrase(words);
    SecureBuffer secret = SecureBuffer::from_string(phrase);
    sodium_memzero(&phrase[0], phrase.size());

    // fixed salt: nothing per-user is known before authentication
    const std::string salt = RECOVERY_SALT;

    RecoveryKeyMaterial key;
    if (!pbkdf2_sha256(secret.data(), secret.size(),
        reinterpret_cast<const byte*>(salt.data()), salt.size(),
        PBKDF2_ITERATIONS,
        key.data(), key.size())) {
        return ZkStatus::INTERNAL_ERROR;
    }
    out = std::move(key);
    return ZkStatus::OK;
}

ZkStatus recovery_keypair(const RecoveryKeyMaterial& key, RecoveryKeyPair& out) {
    static_assert(crypto_box_SEEDBYTES == KEY_LEN, "recovery key must seed X25519");
    RecoveryKeyPair pair;
    pair.public_key.resize(crypto_box_PUBLICKEYBYTES);
    pair.secret_key = SecureBuffer(crypto_box_SECRETKEYBYTES);
    if (crypto_box_seed_keypair(pair.public_key.data(), pair.secret_key.data(), key.data()) != 0) {
        audit_log_level(LogLevel::ERROR,
            "recovery_keypair: crypto_box_seed_keypair failed",
            "recovery_module",
            "failure");
        return ZkStatus::INTERNAL_ERROR;
    }
    out = std::move(pair);
    return ZkStatus::OK;
}

ZkStatus seal_key(const SecureKey& key, const Bytes& recipient_pk, SealedKey& out) {
    if (recipient_pk.size() != crypto_box_PUBLICKEYBYTES) {
        return ZkStatus::VALIDATION_FAILURE;
    }
    SealedKey sk;
    sk.sealed.resize(crypto_box_SEALBYTES + key.size());
    if (crypto_box_seal(sk.sealed.data(), key.data(), key.size(), recipient_pk.data()) != 0) {
        audit_log_level(LogLevel::ERROR,
            "seal_key: crypto_box_seal failed",
            "recovery_module",
            "failure");
        return ZkStatus::INTERNAL_ERROR;
    }
    out = std::move(sk);
    return ZkStatus::OK;
}

ZkStatus open_sealed_raw(const SealedKey& in, const RecoveryKeyPair& pair, SecureBuffer& out) {
    if (in.algorithm != SealAlg::X25519_SEALED_BOX || in.sealed.size() <= crypto_box_SEALBYTES) {
        return ZkStatus::INTEGRITY_FAILURE;
    }
    SecureBuffer raw(in.sealed.size() - crypto_box_SEALBYTES);
    if (crypto_box_seal_open(raw.data(),
        in.sealed.data(), in.sealed.size(),
        pair.public_key.data(), pair.secret_key.data()) != 0) {
        return ZkStatus::AUTHENTICATION_FAILURE;
    }
    out = std::move(raw);
    return ZkStatus::OK;
}
