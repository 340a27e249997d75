#include "entities.hpp"
#include "encoding.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

static Bytes b64_at(const json& j, const char* name) {
    Bytes out;
    if (!from_base64(j.at(name).get<std::string>(), out)) {
        throw std::invalid_argument(std::string("bad base64 in field ") + name);
    }
    return out;
}

// empty blobs are stored as null
template <typename T>
static json opt_envelope(const T& v) {
    return v.empty() ? json(nullptr) : json(v);
}

template <typename T>
static void get_opt_envelope(const json& j, const char* name, T& out) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        out = T{};
        return;
    }
    it->get_to(out);
}


// -------- Protection --------
void to_json(json& j, const Protection& p) {
    j = json{
        {"encryptedSalt", opt_envelope(p.encrypted_salt)},
        {"recoveryDEK", opt_envelope(p.recovery_dek)},
        {"sourceFolderId", p.source_folder_id}
    };
}

void from_json(const json& j, Protection& p) {
    get_opt_envelope(j, "encryptedSalt", p.encrypted_salt);
    get_opt_envelope(j, "recoveryDEK", p.recovery_dek);
    p.source_folder_id = j.value("sourceFolderId", "");
}


// -------- Note --------
void to_json(json& j, const Note& n) {
    j = json{
        {"id", n.id},
        {"encryptedTitle", n.encrypted_title},
        {"encryptedContent", n.encrypted_content},
        {"encryptedDEK", n.encrypted_dek},
        {"folderId", n.folder_id},
        {"isPinned", n.is_pinned},
        {"pinnedAt", n.pinned_at},
        {"hasPassword", n.has_password},
        {"passwordInherited", n.password_inherited},
        {"protection", n.has_password ? json(n.protection) : json(nullptr)},
        {"tags", n.tags},
        {"syncVersion", n.sync_version},
        {"changeSeq", n.change_seq},
        {"lastModifiedDeviceId", n.last_modified_device_id},
        {"createdAt", n.created_at},
        {"updatedAt", n.updated_at},
        {"isDeleted", n.is_deleted},
        {"deletedAt", n.deleted_at}
    };
}

void from_json(const json& j, Note& n) {
    j.at("id").get_to(n.id);
    j.at("encryptedTitle").get_to(n.encrypted_title);
    j.at("encryptedContent").get_to(n.encrypted_content);
    j.at("encryptedDEK").get_to(n.encrypted_dek);
    n.folder_id = j.value("folderId", "");
    n.is_pinned = j.value("isPinned", false);
    n.pinned_at = j.value("pinnedAt", int64_t(0));
    n.has_password = j.value("hasPassword", false);
    n.password_inherited = j.value("passwordInherited", false);
    n.protection = Protection{};
    if (n.has_password) j.at("protection").get_to(n.protection);
    n.tags = j.value("tags", std::vector<std::string>{});
    j.at("syncVersion").get_to(n.sync_version);
    n.change_seq = j.value("changeSeq", uint64_t(0));
    n.last_modified_device_id = j.value("lastModifiedDeviceId", "");
    j.at("createdAt").get_to(n.created_at);
    j.at("updatedAt").get_to(n.updated_at);
    n.is_deleted = j.value("isDeleted", false);
    n.deleted_at = j.value("deletedAt", int64_t(0));
}


// -------- Folder --------
void to_json(json& j, const Folder& f) {
    j = json{
        {"id", f.id},
        {"encryptedName", f.encrypted_name},
        {"encryptedDEK", f.encrypted_dek},
        {"parentId", f.parent_id},
        {"order", f.order},
        {"hasPassword", f.has_password},
        {"passwordInherited", f.password_inherited},
        {"protection", f.has_password ? json(f.protection) : json(nullptr)},
        {"syncVersion", f.sync_version},
        {"changeSeq", f.change_seq},
        {"lastModifiedDeviceId", f.last_modified_device_id},
        {"createdAt", f.created_at},
        {"updatedAt", f.updated_at},
        {"isDeleted", f.is_deleted},
        {"deletedAt", f.deleted_at}
    };
}

void from_json(const json& j, Folder& f) {
    j.at("id").get_to(f.id);
    j.at("encryptedName").get_to(f.encrypted_name);
    j.at("encryptedDEK").get_to(f.encrypted_dek);
    f.parent_id = j.value("parentId", "");
    f.order = j.value("order", 0);
    f.has_password = j.value("hasPassword", false);
    f.password_inherited = j.value("passwordInherited", false);
    f.protection = Protection{};
    if (f.has_password) j.at("protection").get_to(f.protection);
    j.at("syncVersion").get_to(f.sync_version);
    f.change_seq = j.value("changeSeq", uint64_t(0));
    f.last_modified_device_id = j.value("lastModifiedDeviceId", "");
    j.at("createdAt").get_to(f.created_at);
    j.at("updatedAt").get_to(f.updated_at);
    f.is_deleted = j.value("isDeleted", false);
    f.deleted_at = j.value("deletedAt", int64_t(0));
}


// -------- NoteVersion --------
void to_json(json& j, const NoteVersion& v) {
    j = json{
        {"id", v.id},
        {"noteId", v.note_id},
        {"encryptedTitle", v.encrypted_title},
        {"encryptedContent", v.encrypted_content},
        {"size", v.size},
        {"createdAt", v.created_at}
    };
}

void from_json(const json& j, NoteVersion& v) {
    j.at("id").get_to(v.id);
    j.at("noteId").get_to(v.note_id);
    j.at("encryptedTitle").get_to(v.encrypted_title);
    j.at("encryptedContent").get_to(v.encrypted_content);
    j.at("size").get_to(v.size);
    j.at("createdAt").get_to(v.created_at);
}


// -------- KeyStore --------
void to_json(json& j, const KeyStore& k) {
    j = json{
        {"userId", k.user_id},
        {"salt", to_base64(k.salt)},
        {"iterations", k.iterations},
        {"kekVerifier", k.kek_verifier},
        {"recoveryKeyHash", k.recovery_hash},
        {"recoveryPublicKey", to_base64(k.recovery_public_key)},
        {"kekEscrow", k.kek_escrow},
        {"keyEpoch", k.key_epoch},
        {"createdAt", k.created_at},
        {"updatedAt", k.updated_at}
    };
}

void from_json(const json& j, KeyStore& k) {
    j.at("userId").get_to(k.user_id);
    k.salt = b64_at(j, "salt");
    j.at("iterations").get_to(k.iterations);
    j.at("kekVerifier").get_to(k.kek_verifier);
    j.at("recoveryKeyHash").get_to(k.recovery_hash);
    k.recovery_public_key = b64_at(j, "recoveryPublicKey");
    j.at("kekEscrow").get_to(k.kek_escrow);
    j.at("keyEpoch").get_to(k.key_epoch);
    j.at("createdAt").get_to(k.created_at);
    j.at("updatedAt").get_to(k.updated_at);
}


// -------- local wrappers --------
void to_json(json& j, const LockoutState& l) {
    j = json{ {"attempts", l.attempts}, {"lockedUntil", l.locked_until} };
}

void from_json(const json& j, LockoutState& l) {
    l.attempts = j.value("attempts", 0);
    l.locked_until = j.value("lockedUntil", int64_t(0));
}

void to_json(json& j, const LocalNote& n) {
    j = json{
        {"note", n.note},
        {"dirty", n.dirty},
        {"rewrapOnly", n.rewrap_only},
        {"dirtySince", n.dirty_since},
        {"lockout", n.lockout}
    };
}

void from_json(const json& j, LocalNote& n) {
    j.at("note").get_to(n.note);
    n.dirty = j.value("dirty", false);
    n.rewrap_only = j.value("rewrapOnly", false);
    n.dirty_since = j.value("dirtySince", int64_t(0));
    n.lockout = j.value("lockout", LockoutState{});
}

void to_json(json& j, const LocalFolder& f) {
    j = json{
        {"folder", f.folder},
        {"dirty", f.dirty},
        {"rewrapOnly", f.rewrap_only},
        {"dirtySince", f.dirty_since},
        {"lockout", f.lockout}
    };
}

void from_json(const json& j, LocalFolder& f) {
    j.at("folder").get_to(f.folder);
    f.dirty = j.value("dirty", false);
    f.rewrap_only = j.value("rewrapOnly", false);
    f.dirty_since = j.value("dirtySince", int64_t(0));
    f.lockout = j.value("lockout", LockoutState{});
}

void to_json(json& j, const SyncState& s) {
    j = json{
        {"lastSyncVersion", s.last_sync_version},
        {"lastSyncAt", s.last_sync_at},
        {"keyStoreDirty", s.key_store_dirty}
    };
}

void from_json(const json& j, SyncState& s) {
    s.last_sync_version = j.value("lastSyncVersion", uint64_t(0));
    s.last_sync_at = j.value("lastSyncAt", int64_t(0));
    s.key_store_dirty = j.value("keyStoreDirty", false);
}
