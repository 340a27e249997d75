#pragma once
#include "zknotes_common.hpp"
#include "envelope.hpp"

#include <nlohmann/json_fwd.hpp>

// Secondary-password material. Present when has_password is set.
struct Protection {
    EncryptedBlob encrypted_salt;   // password salt, sealed under the account
    SealedKey recovery_dek;         // DEK sealed to the recovery public key
    std::string source_folder_id;   // folder whose password applies, when inherited
};

struct Note {
    std::string id;
    EncryptedBlob encrypted_title;
    EncryptedBlob encrypted_content;
    WrappedKey encrypted_dek;
    std::string folder_id;          // empty: top level
    bool is_pinned = false;
    int64_t pinned_at = 0;
    bool has_password = false;
    bool password_inherited = false;
    Protection protection;
    std::vector<std::string> tags;
    uint64_t sync_version = 0;      // last server-accepted version
    uint64_t change_seq = 0;        // server sequence at last accepted change
    std::string last_modified_device_id;
    int64_t created_at = 0;
    int64_t updated_at = 0;
    bool is_deleted = false;
    int64_t deleted_at = 0;
};

struct Folder {
    std::string id;
    EncryptedBlob encrypted_name;
    WrappedKey encrypted_dek;
    std::string parent_id;          // empty: top level
    int order = 0;
    bool has_password = false;
    bool password_inherited = false;
    Protection protection;
    uint64_t sync_version = 0;
    uint64_t change_seq = 0;
    std::string last_modified_device_id;
    int64_t created_at = 0;
    int64_t updated_at = 0;
    bool is_deleted = false;
    int64_t deleted_at = 0;
};

// One retained copy of a note body, kept on the device. Encrypted under
// the note's current DEK; purged whenever that DEK is replaced.
struct NoteVersion {
    std::string id;
    std::string note_id;
    EncryptedBlob encrypted_title;
    EncryptedBlob encrypted_content;
    size_t size = 0;
    int64_t created_at = 0;
};

// Per-account key material. Holds nothing that decrypts without a secret.
struct KeyStore {
    std::string user_id;
    Bytes salt;
    uint32_t iterations = PBKDF2_ITERATIONS;
    EncryptedBlob kek_verifier;
    std::string recovery_hash;
    Bytes recovery_public_key;
    SealedKey kek_escrow;
    uint64_t key_epoch = 0;
    int64_t created_at = 0;
    int64_t updated_at = 0;
};

// Failed-verification counter, persisted with the entity on this device
struct LockoutState {
    int attempts = 0;
    int64_t locked_until = 0;
};

struct LocalNote {
    Note note;
    bool dirty = false;
    bool rewrap_only = false;       // dirty for a new account key wrap, content untouched
    int64_t dirty_since = 0;
    LockoutState lockout;
};

struct LocalFolder {
    Folder folder;
    bool dirty = false;
    bool rewrap_only = false;
    int64_t dirty_since = 0;
    LockoutState lockout;
};

// Queues an entry whose DEK was moved to another account KEK. Neither
// updated_at nor a pending edit of its own is touched.
template <typename L>
void mark_rewrapped(L& local, int64_t now) {
    if (local.dirty) return;
    local.dirty = true;
    local.rewrap_only = true;
    local.dirty_since = now;
}

struct SyncState {
    uint64_t last_sync_version = 0;
    int64_t last_sync_at = 0;
    bool key_store_dirty = false;
};

// -------- JSON --------
void to_json(nlohmann::json& j, const Protection& p);
void from_json(const nlohmann::json& j, Protection& p);
void to_json(nlohmann::json& j, const Note& n);
void from_json(const nlohmann::json& j, Note& n);
void to_json(nlohmann::json& j, const Folder& f);
void from_json(const nlohmann::json& j, Folder& f);
void to_json(nlohmann::json& j, const NoteVersion& v);
void from_json(const nlohmann::json& j, NoteVersion& v);
void to_json(nlohmann::json& j, const KeyStore& k);
void from_json(const nlohmann::json& j, KeyStore& k);
void to_json(nlohmann::json& j, const LockoutState& l);
void from_json(const nlohmann::json& j, LockoutState& l);
void to_json(nlohmann::json& j, const LocalNote& n);
void from_json(const nlohmann::json& j, LocalNote& n);
void to_json(nlohmann::json& j, const LocalFolder& f);
void from_json(const nlohmann::json& j, LocalFolder& f);
void to_json(nlohmann::json& j, const SyncState& s);
void from_json(const nlohmann::json& j, SyncState& s);
