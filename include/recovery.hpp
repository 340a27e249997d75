#pragma once
#include "crypto.hpp"
#include "util.hpp"

// Shown to the user once at registration; only its hash is kept
struct RecoveryKey {
    std::vector<std::string> words;
    int64_t created_at = 0;
};

// X25519 pair seeded from the recovery key. The public half is stored
// with the account, the secret half exists only while recovering.
struct RecoveryKeyPair {
    Bytes public_key;
    SecureBuffer secret_key;
};

// -------- Wordlist --------
size_t recovery_wordlist_size();
const char* recovery_word_at(size_t index);
bool is_recovery_word(const std::string& word); // case-insensitive

// -------- Phrase handling --------
RecoveryKey generate_recovery_key(int64_t now_ms);

// VALIDATION_FAILURE unless exactly 24 listed words
ZkStatus validate_recovery_words(const std::vector<std::string>& words);

std::string normalize_recovery_phrase(const std::vector<std::string>& words);
std::string hash_recovery_key(const std::vector<std::string>& words);
bool verify_recovery_key(const std::vector<std::string>& words, const std::string& expected_hash);

// Same PBKDF2 as the account password, over the normalized phrase with a
// fixed public salt. Validates before deriving.
ZkStatus derive_key_from_recovery_words(
    const std::vector<std::string>& words,
    RecoveryKeyMaterial& out
);

ZkStatus recovery_keypair(const RecoveryKeyMaterial& key, RecoveryKeyPair& out);

// -------- Sealed copies of keys --------
ZkStatus seal_key(const SecureKey& key, const Bytes& recipient_pk, SealedKey& out);
ZkStatus open_sealed_raw(const SealedKey& in, const RecoveryKeyPair& pair, SecureBuffer& out);

template <typename K>
ZkStatus open_sealed_key(const SealedKey& in, const RecoveryKeyPair& pair, K& out) {
    SecureBuffer raw;
    ZkStatus st = open_sealed_raw(in, pair, raw);
    if (!ok(st)) return st;
    if (raw.size() != KEY_LEN) return ZkStatus::INTEGRITY_FAILURE;
    out = K(raw.data(), raw.size());
    return ZkStatus::OK;
}
