#pragma once
#include "key_hierarchy.hpp"
#include "entities.hpp"
#include "lockout.hpp"

// -------- Protection salt (sealed under the account) --------
ZkStatus seal_protection_salt(const Kek& account_kek, const Bytes& salt, EncryptedBlob& out);
ZkStatus open_protection_salt(const Kek& account_kek, const EncryptedBlob& in, Bytes& salt);

// Same two-step pipeline as the account password, separate label
ZkStatus derive_password_kek(const SecureBuffer& password, const Bytes& salt, Kek& out);

// Fresh salt + password KEK for a new protection. The salt is sealed
// under the account KEK; the DEK copy for recovery is sealed to
// recovery_pk when one is given.
ZkStatus begin_protection(
    const Kek& account_kek,
    const SecureBuffer& password,
    const Bytes& recovery_pk,
    const Dek& dek,
    Kek& password_kek,
    Protection& out
);

// Both secrets are needed: the account KEK opens the salt, the password
// re-derives the KEK that unwraps the DEK. Lockout is checked first and
// only a wrong password counts as a failed attempt.
ZkStatus unlock_protected_dek(
    const Kek& account_kek,
    const Protection& protection,
    const WrappedKey& wrapped,
    const SecureBuffer& password,
    LockoutState& lockout,
    int64_t now_ms,
    Dek& out,
    Kek* password_kek_out = nullptr
);

// -------- Account key changes --------

// true if the entity's account-bound material was made under kek
bool bound_to_account_kek(const Note& n, const Kek& kek);
bool bound_to_account_kek(const Folder& f, const Kek& kek);

// Rewraps account-wrapped DEKs and re-seals protection salts from one
// account KEK to another. All-or-nothing: on failure the inputs are
// untouched. Content ciphertext is never modified.
ZkStatus rekey_entities(
    std::vector<Note>& notes,
    std::vector<Folder>& folders,
    const Kek& from,
    const Kek& to
);
