#include "protection.hpp"
#include "recovery.hpp"

static ZkStatus salt_seal_key(const Kek& account_kek, SecureKey& out) {
    return derive_subkey(account_kek, SALT_SEAL_LABEL, out);
}

ZkStatus seal_protection_salt(const Kek& account_kek, const Bytes& salt, EncryptedBlob& out) {
    SecureKey k;
    ZkStatus st = salt_seal_key(account_kek, k);
    if (!ok(st)) return st;
    return encrypt_blob(k, salt.data(), salt.size(), out);
}

ZkStatus open_protection_salt(const Kek& account_kek, const EncryptedBlob& in, Bytes& salt) {
    SecureKey k;
    ZkStatus st = salt_seal_key(account_kek, k);
    if (!ok(st)) return st;

    SecureBuffer raw;
    st = decrypt_blob(k, in, raw);
    if (!ok(st)) return st;
    if (raw.size() != SALT_LEN) return ZkStatus::INTEGRITY_FAILURE;
    salt.assign(raw.data(), raw.data() + raw.size());
    return ZkStatus::OK;
}

ZkStatus derive_password_kek(const SecureBuffer& password, const Bytes& salt, Kek& out) {
    return derive_kek_from_password(password, salt, PBKDF2_ITERATIONS, NOTE_PASSWORD_KEK_LABEL, out);
}

ZkStatus begin_protection(
    const Kek& account_kek,
    const SecureBuffer& password,
    const Bytes& recovery_pk,
    const Dek& dek,
    Kek& password_kek,
    Protection& out
)
{
    if (!valid_secret(password)) return ZkStatus::VALIDATION_FAILURE;

    Bytes salt = generate_salt();
    Protection p;
    ZkStatus st = seal_protection_salt(account_kek, salt, p.encrypted_salt);
    if (!ok(st)) return st;

    Kek kek;
    st = derive_password_kek(password, salt, kek);
    if (!ok(st)) return st;

    if (!recovery_pk.empty()) {
        st = seal_key(dek, recovery_pk, p.recovery_dek);
        if (!ok(st)) return st;
    }

    password_kek = std::move(kek);
    out = std::move(p);
    return ZkStatus::OK;
}

ZkStatus unlock_protected_dek(
    const Kek& account_kek,
    const Protection& protection,
    const WrappedKey& wrapped,
    const SecureBuffer& password,
    LockoutState& lockout,
    int64_t now_ms,
    Dek& out,
    Kek* password_kek_out
)
{
    ZkStatus st = lockout_check(lockout, now_ms);
    if (!ok(st)) {
        audit_log_level(LogLevel::WARN,
            "Unlock rejected during lockout",
            "protection",
            "locked");
        return st;
    }

    Bytes salt;
    st = open_protection_salt(account_kek, protection.encrypted_salt, salt);
    if (!ok(st)) {
        audit_log_level(LogLevel::ERROR,
            "Unlock failed",
            "protection",
            "failure");
        return st;
    }

    Kek kek;
    st = derive_password_kek(password, salt, kek);
    if (!ok(st)) {
        if (st == ZkStatus::VALIDATION_FAILURE) {
            lockout_record_failure(lockout, now_ms);
            return ZkStatus::AUTHENTICATION_FAILURE;
        }
        return st;
    }

    Dek dek;
    st = unwrap_dek(wrapped, kek, dek);
    if (!ok(st)) {
        if (st == ZkStatus::AUTHENTICATION_FAILURE) lockout_record_failure(lockout, now_ms);
        audit_log_level(LogLevel::WARN,
            "Unlock failed",
            "protection",
            "failure");
        return st;
    }

    lockout_record_success(lockout);
    out = std::move(dek);
    if (password_kek_out) *password_kek_out = std::move(kek);
    return ZkStatus::OK;
}


// -------- Account key changes --------
static bool salt_bound_to(const Protection& p, const Kek& kek) {
    SecureKey k;
    if (!ok(salt_seal_key(kek, k))) return false;
    return p.encrypted_salt.key_id == key_id_of(k);
}

bool bound_to_account_kek(const Note& n, const Kek& kek) {
    if (n.has_password) return salt_bound_to(n.protection, kek);
    return n.encrypted_dek.key_id == key_id_of(kek);
}

bool bound_to_account_kek(const Folder& f, const Kek& kek) {
    if (f.has_password) return salt_bound_to(f.protection, kek);
    return f.encrypted_dek.key_id == key_id_of(kek);
}

static ZkStatus reseal_salt(Protection& p, const Kek& from, const Kek& to) {
    Bytes salt;
    ZkStatus st = open_protection_salt(from, p.encrypted_salt, salt);
    if (!ok(st)) return st;
    EncryptedBlob sealed;
    st = seal_protection_salt(to, salt, sealed);
    sodium_memzero(salt.data(), salt.size());
    if (!ok(st)) return st;
    p.encrypted_salt = std::move(sealed);
    return ZkStatus::OK;
}

ZkStatus rekey_entities(
    std::vector<Note>& notes,
    std::vector<Folder>& folders,
    const Kek& from,
    const Kek& to
)
{
    std::vector<Note> new_notes = notes;
    std::vector<Folder> new_folders = folders;

    // account-wrapped DEKs go through one all-or-nothing rewrap
    std::vector<RewrapItem> items;
    for (const auto& n : new_notes) {
        if (!n.has_password) items.push_back({ "n:" + n.id, n.encrypted_dek });
    }
    for (const auto& f : new_folders) {
        if (!f.has_password) items.push_back({ "f:" + f.id, f.encrypted_dek });
    }

    std::vector<RewrapItem> rewrapped;
    ZkStatus st = rewrap_all(items, from, to, rewrapped);
    if (!ok(st)) return st;

    std::map<std::string, WrappedKey> by_id;
    for (auto& r : rewrapped) by_id[r.id] = std::move(r.wrapped);

    for (auto& n : new_notes) {
        if (n.has_password) {
            st = reseal_salt(n.protection, from, to);
            if (!ok(st)) return st;
        }
        else {
            n.encrypted_dek = by_id.at("n:" + n.id);
        }
    }
    for (auto& f : new_folders) {
        if (f.has_password) {
            st = reseal_salt(f.protection, from, to);
            if (!ok(st)) return st;
        }
        else {
            f.encrypted_dek = by_id.at("f:" + f.id);
        }
    }

    notes = std::move(new_notes);
    folders = std::move(new_folders);
    return ZkStatus::OK;
}
