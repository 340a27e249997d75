#pragma once
#include "crypto.hpp"

// -------- Derivation --------

// password + salt -> master key (PBKDF2-HMAC-SHA256, >= 600k rounds)
ZkStatus derive_master_key(
    const SecureBuffer& password,
    const Bytes& salt,
    uint32_t iterations,
    MasterKey& out
);

// master key -> KEK, domain separated by label (HKDF-SHA256)
ZkStatus derive_kek(const MasterKey& master, const std::string& label, Kek& out);

// Both steps at once: what the account and every note password go through
ZkStatus derive_kek_from_password(
    const SecureBuffer& password,
    const Bytes& salt,
    uint32_t iterations,
    const std::string& label,
    Kek& out
);

// Purpose-bound key below a KEK (salt sealing, verifier)
ZkStatus derive_subkey(const Kek& kek, const std::string& label, SecureKey& out);

// -------- DEKs --------
Dek generate_dek();

// Deterministic SIV wrap: same DEK + KEK always gives the same bytes
ZkStatus wrap_dek(const Dek& dek, const Kek& kek, WrappedKey& out);

// Fails closed: AUTHENTICATION_FAILURE unless kek is the wrapping key
ZkStatus unwrap_dek(const WrappedKey& in, const Kek& kek, Dek& out);

ZkStatus rewrap_dek(
    const WrappedKey& in,
    const Kek& old_kek,
    const Kek& new_kek,
    WrappedKey& out
);

struct RewrapItem {
    std::string id;
    WrappedKey wrapped;
};

// All-or-nothing rewrap of many DEKs. On any failure `out` is left
// untouched and the failing status is returned.
ZkStatus rewrap_all(
    const std::vector<RewrapItem>& in,
    const Kek& old_kek,
    const Kek& new_kek,
    std::vector<RewrapItem>& out
);

bool valid_secret(const SecureBuffer& password);
