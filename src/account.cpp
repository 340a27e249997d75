#include "account.hpp"

static const char VERIFIER_MARKER[] = "zknotes-kek-verifier-v1";

ZkStatus make_kek_verifier(const Kek& kek, EncryptedBlob& out) {
    SecureKey k;
    ZkStatus st = derive_subkey(kek, VERIFIER_LABEL, k);
    if (!ok(st)) return st;
    return encrypt_blob(k,
        reinterpret_cast<const byte*>(VERIFIER_MARKER), sizeof(VERIFIER_MARKER) - 1,
        out);
}

ZkStatus check_kek_verifier(const Kek& kek, const EncryptedBlob& verifier) {
    SecureKey k;
    ZkStatus st = derive_subkey(kek, VERIFIER_LABEL, k);
    if (!ok(st)) return st;

    SecureBuffer plain;
    st = decrypt_blob(k, verifier, plain);
    if (!ok(st)) return st;

    if (plain.size() != sizeof(VERIFIER_MARKER) - 1 ||
        sodium_memcmp(plain.data(), VERIFIER_MARKER, plain.size()) != 0) {
        return ZkStatus::INTEGRITY_FAILURE;
    }
    return ZkStatus::OK;
}

ZkStatus unlock_key_store(const KeyStore& ks, const SecureBuffer& password, Kek& out) {
    Kek kek;
    ZkStatus st = derive_kek_from_password(password, ks.salt, ks.iterations, ACCOUNT_KEK_LABEL, kek);
    if (!ok(st)) {
        return st == ZkStatus::VALIDATION_FAILURE ? ZkStatus::AUTHENTICATION_FAILURE : st;
    }
    st = check_kek_verifier(kek, ks.kek_verifier);
    if (!ok(st)) return st;
    out = std::move(kek);
    return ZkStatus::OK;
}


Account::Account(LocalStore& store, std::string device_id, Clock clock)
    : store_(store), device_id_(std::move(device_id)), clock_(std::move(clock))
{
}

bool Account::registered() const {
    KeyStore ks;
    return store_.get_key_store(ks);
}

ZkStatus Account::register_account(
    const std::string& user_id,
    const SecureBuffer& password,
    SessionContext& session,
    RecoveryKey& recovery_out
)
{
    if (registered()) {
        audit_log_level(LogLevel::WARN,
            "Registration refused: account already exists",
            "account",
            "failure");
        return ZkStatus::VALIDATION_FAILURE;
    }
    if (user_id.empty() || !valid_profile_name(user_id) || !valid_secret(password)) {
        return ZkStatus::VALIDATION_FAILURE;
    }

    const int64_t now = clock_();
    KeyStore ks;
    ks.user_id = user_id;
    ks.salt = generate_salt();
    ks.iterations = PBKDF2_ITERATIONS;
    ks.key_epoch = 1;
    ks.created_at = now;
    ks.updated_at = now;

    Kek kek;
    ZkStatus st = derive_kek_from_password(password, ks.salt, ks.iterations, ACCOUNT_KEK_LABEL, kek);
    if (!ok(st)) return st;
    st = make_kek_verifier(kek, ks.kek_verifier);
    if (!ok(st)) return st;

    RecoveryKey recovery = generate_recovery_key(now);
    RecoveryKeyMaterial rkm;
    st = derive_key_from_recovery_words(recovery.words, rkm);
    if (!ok(st)) return st;
    RecoveryKeyPair pair;
    st = recovery_keypair(rkm, pair);
    if (!ok(st)) return st;

    ks.recovery_hash = hash_recovery_key(recovery.words);
    ks.recovery_public_key = pair.public_key;
    st = seal_key(kek, ks.recovery_public_key, ks.kek_escrow);
    if (!ok(st)) return st;

    StoreBatch batch;
    batch.key_store = ks;
    SyncState sync = store_.sync_state();
    sync.key_store_dirty = true;
    batch.sync_state = sync;
    st = store_.apply(batch);
    if (!ok(st)) return st;

    set_log_user(user_id);
    session.open(user_id, std::move(kek), ks.key_epoch);
    recovery_out = std::move(recovery);

    audit_log_level(LogLevel::INFO,
        "Account registered",
        "account_register",
        "success");
    return ZkStatus::OK;
}

ZkStatus Account::login(const SecureBuffer& password, SessionContext& session) {
    KeyStore ks;
    if (!store_.get_key_store(ks)) return ZkStatus::NOT_FOUND;

    Kek kek;
    ZkStatus st = unlock_key_store(ks, password, kek);
    if (!ok(st)) {
        audit_log_level(LogLevel::WARN,
            "Login failed",
            "login",
            "failure");
        return st;
    }

    set_log_user(ks.user_id);
    session.open(ks.user_id, std::move(kek), ks.key_epoch);
    audit_log_level(LogLevel::INFO,
        "Login successful",
        "login",
        "success");
    return ZkStatus::OK;
}

void Account::logout(SessionContext& session) {
    session.wipe();
    audit_log_level(LogLevel::INFO,
        "Session closed, keys wiped",
        "logout",
        "success");
}

ZkStatus Account::rekey(
    const KeyStore& current,
    const Kek& old_kek,
    const SecureBuffer& new_password,
    Kek& new_kek_out
)
{
    const int64_t now = clock_();

    KeyStore next = current;
    next.salt = generate_salt();
    next.iterations = PBKDF2_ITERATIONS;

    Kek new_kek;
    ZkStatus st = derive_kek_from_password(new_password, next.salt, next.iterations,
        ACCOUNT_KEK_LABEL, new_kek);
    if (!ok(st)) return st;

    std::vector<Note> notes;
    std::vector<Folder> folders;
    for (const auto& ln : store_.all_notes()) {
        if (bound_to_account_kek(ln.note, old_kek)) notes.push_back(ln.note);
    }
    for (const auto& lf : store_.all_folders()) {
        if (bound_to_account_kek(lf.folder, old_kek)) folders.push_back(lf.folder);
    }

    st = rekey_entities(notes, folders, old_kek, new_kek);
    if (!ok(st)) {
        audit_log_level(LogLevel::ERROR,
            "Account rekey aborted, nothing changed",
            "account_rekey",
            "failure");
        return st;
    }

    st = make_kek_verifier(new_kek, next.kek_verifier);
    if (!ok(st)) return st;
    st = seal_key(new_kek, next.recovery_public_key, next.kek_escrow);
    if (!ok(st)) return st;
    next.key_epoch = current.key_epoch + 1;
    next.updated_at = now;

    StoreBatch batch;
    for (auto& n : notes) {
        LocalNote ln;
        store_.get_note(n.id, ln);
        ln.note = std::move(n);
        mark_rewrapped(ln, now);
        batch.put_notes.push_back(std::move(ln));
    }
    for (auto& f : folders) {
        LocalFolder lf;
        store_.get_folder(f.id, lf);
        lf.folder = std::move(f);
        mark_rewrapped(lf, now);
        batch.put_folders.push_back(std::move(lf));
    }
    batch.key_store = next;
    SyncState sync = store_.sync_state();
    sync.key_store_dirty = true;
    batch.sync_state = sync;

    st = store_.apply(batch);
    if (!ok(st)) return st;

    audit_log_level(LogLevel::INFO,
        "Account key rotated, " + std::to_string(batch.put_notes.size() + batch.put_folders.size()) +
        " entities rewrapped",
        "account_rekey",
        "success");
    new_kek_out = std::move(new_kek);
    return ZkStatus::OK;
}

ZkStatus Account::change_password(
    SessionContext& session,
    const SecureBuffer& old_password,
    const SecureBuffer& new_password
)
{
    ZkStatus st = session.require_open();
    if (!ok(st)) return st;
    if (!valid_secret(new_password)) return ZkStatus::VALIDATION_FAILURE;

    KeyStore ks;
    if (!store_.get_key_store(ks)) return ZkStatus::NOT_FOUND;

    Kek old_kek;
    st = unlock_key_store(ks, old_password, old_kek);
    if (!ok(st)) {
        audit_log_level(LogLevel::WARN,
            "Password change refused: current password incorrect",
            "password_change",
            "failure");
        return st;
    }
    if (!old_kek.equals(session.kek())) return ZkStatus::AUTHENTICATION_FAILURE;

    Kek new_kek;
    st = rekey(ks, old_kek, new_password, new_kek);
    if (!ok(st)) return st;

    session.rotate(std::move(new_kek), ks.key_epoch + 1);
    audit_log_level(LogLevel::INFO,
        "Account password changed",
        "password_change",
        "success");
    return ZkStatus::OK;
}

ZkStatus Account::recover(
    const std::vector<std::string>& words,
    const SecureBuffer& new_password,
    SessionContext& session
)
{
    ZkStatus st = validate_recovery_words(words);
    if (!ok(st)) return st;
    if (!valid_secret(new_password)) return ZkStatus::VALIDATION_FAILURE;

    KeyStore ks;
    if (!store_.get_key_store(ks)) return ZkStatus::NOT_FOUND;

    if (!verify_recovery_key(words, ks.recovery_hash)) {
        audit_log_level(LogLevel::WARN,
            "Account recovery refused: phrase does not match",
            "account_recover",
            "failure");
        return ZkStatus::AUTHENTICATION_FAILURE;
    }

    RecoveryKeyMaterial rkm;
    st = derive_key_from_recovery_words(words, rkm);
    if (!ok(st)) return st;
    RecoveryKeyPair pair;
    st = recovery_keypair(rkm, pair);
    if (!ok(st)) return st;
    if (pair.public_key != ks.recovery_public_key) return ZkStatus::AUTHENTICATION_FAILURE;

    Kek old_kek;
    st = open_sealed_key(ks.kek_escrow, pair, old_kek);
    if (!ok(st)) return st;
    st = check_kek_verifier(old_kek, ks.kek_verifier);
    if (!ok(st)) return st;

    Kek new_kek;
    st = rekey(ks, old_kek, new_password, new_kek);
    if (!ok(st)) return st;

    set_log_user(ks.user_id);
    session.open(ks.user_id, std::move(old_kek), ks.key_epoch);
    session.rotate(std::move(new_kek), ks.key_epoch + 1);
    audit_log_level(LogLevel::ALERT,
        "Account recovered with recovery phrase, password reset",
        "account_recover",
        "success");
    return ZkStatus::OK;
}

ZkStatus Account::adopt_remote_key_store(
    const KeyStore& remote,
    const SecureBuffer& password,
    SessionContext& session
)
{
    ZkStatus st = session.require_open();
    if (!ok(st)) return st;
    if (remote.user_id != session.user_id()) return ZkStatus::VALIDATION_FAILURE;

    Kek new_kek;
    st = unlock_key_store(remote, password, new_kek);
    if (!ok(st)) {
        audit_log_level(LogLevel::WARN,
            "Remote key store not unlocked",
            "key_adopt",
            "failure");
        return st;
    }

    // anything still bound to a KEK this session holds moves to the new one
    std::vector<const Kek*> olds{ &session.kek() };
    if (session.previous_kek()) olds.push_back(session.previous_kek());

    const int64_t now = clock_();
    StoreBatch batch;
    for (const Kek* old : olds) {
        if (old->equals(new_kek)) continue;

        std::vector<Note> notes;
        std::vector<Folder> folders;
        for (const auto& ln : store_.all_notes()) {
            if (bound_to_account_kek(ln.note, *old)) notes.push_back(ln.note);
        }
        for (const auto& lf : store_.all_folders()) {
            if (bound_to_account_kek(lf.folder, *old)) folders.push_back(lf.folder);
        }
        st = rekey_entities(notes, folders, *old, new_kek);
        if (!ok(st)) return st;

        for (auto& n : notes) {
            LocalNote ln;
            store_.get_note(n.id, ln);
            ln.note = std::move(n);
            mark_rewrapped(ln, now);
            batch.put_notes.push_back(std::move(ln));
        }
        for (auto& f : folders) {
            LocalFolder lf;
            store_.get_folder(f.id, lf);
            lf.folder = std::move(f);
            mark_rewrapped(lf, now);
            batch.put_folders.push_back(std::move(lf));
        }
    }

    batch.key_store = remote;
    SyncState sync = store_.sync_state();
    sync.key_store_dirty = false;
    batch.sync_state = sync;
    st = store_.apply(batch);
    if (!ok(st)) return st;

    session.open(remote.user_id, std::move(new_kek), remote.key_epoch);
    audit_log_level(LogLevel::INFO,
        "Adopted account key epoch " + std::to_string(remote.key_epoch),
        "key_adopt",
        "success");
    return ZkStatus::OK;
}
