#include "notebook.hpp"

// ---------- Helpers ----------
static ZkStatus check_note_input(const std::string& title, const std::string& content) {
    if (!valid_title(title) || content.size() > MAX_CONTENT_LEN) {
        audit_log_level(LogLevel::WARN,
            "Note input rejected",
            "notebook",
            "failure");
        return ZkStatus::VALIDATION_FAILURE;
    }
    return ZkStatus::OK;
}

static ZkStatus check_folder_name(const std::string& name) {
    std::string t = name;
    trim_spaces(t);
    if (t.empty() || !valid_title(name)) return ZkStatus::VALIDATION_FAILURE;
    return ZkStatus::OK;
}

static ZkStatus seal_body(const Dek& dek, const std::string& title, const std::string& content, Note& n) {
    ZkStatus st = encrypt_text(dek, title, n.encrypted_title);
    if (!ok(st)) return st;
    return encrypt_text(dek, content, n.encrypted_content);
}

static ZkStatus open_body(
    const Dek& dek,
    const EncryptedBlob& title,
    const EncryptedBlob& content,
    NotePlain& out
)
{
    NotePlain plain;
    ZkStatus st = decrypt_text(dek, title, plain.title);
    if (!ok(st)) return st;
    st = decrypt_text(dek, content, plain.content);
    if (!ok(st)) return st;
    out = std::move(plain);
    return ZkStatus::OK;
}

static void drop_protection(Note& n) {
    n.has_password = false;
    n.password_inherited = false;
    n.protection = Protection{};
}

static void drop_protection(Folder& f) {
    f.has_password = false;
    f.password_inherited = false;
    f.protection = Protection{};
}

static bool lockout_changed(const LockoutState& a, const LockoutState& b) {
    return a.attempts != b.attempts || a.locked_until != b.locked_until;
}


Notebook::Notebook(LocalStore& store, std::string device_id, Clock clock)
    : store_(store), device_id_(std::move(device_id)), clock_(std::move(clock))
{
}

ZkStatus Notebook::live_note(const std::string& id, LocalNote& out) const {
    if (!store_.get_note(id, out) || out.note.is_deleted) return ZkStatus::NOT_FOUND;
    return ZkStatus::OK;
}

ZkStatus Notebook::live_folder(const std::string& id, LocalFolder& out) const {
    if (!store_.get_folder(id, out) || out.folder.is_deleted) return ZkStatus::NOT_FOUND;
    return ZkStatus::OK;
}

FolderTree Notebook::tree() const {
    std::vector<Folder> folders;
    for (auto& lf : store_.all_folders()) folders.push_back(std::move(lf.folder));
    std::vector<Note> notes;
    for (auto& ln : store_.all_notes()) notes.push_back(std::move(ln.note));
    return FolderTree(folders, notes);
}

Bytes Notebook::recovery_public_key() const {
    KeyStore ks;
    if (!store_.get_key_store(ks)) return {};
    return ks.recovery_public_key;
}

void Notebook::stamp(Note& n, int64_t now) const {
    n.updated_at = now;
    n.last_modified_device_id = device_id_;
}

void Notebook::stamp(Folder& f, int64_t now) const {
    f.updated_at = now;
    f.last_modified_device_id = device_id_;
}

void Notebook::put_dirty(StoreBatch& batch, LocalNote ln, int64_t now) const {
    stamp(ln.note, now);
    if (!ln.dirty) ln.dirty_since = now;
    ln.dirty = true;
    ln.rewrap_only = false;
    batch.put_notes.push_back(std::move(ln));
}

void Notebook::put_dirty(StoreBatch& batch, LocalFolder lf, int64_t now) const {
    stamp(lf.folder, now);
    if (!lf.dirty) lf.dirty_since = now;
    lf.dirty = true;
    lf.rewrap_only = false;
    batch.put_folders.push_back(std::move(lf));
}

void Notebook::record_version(StoreBatch& batch, const Note& n, int64_t now) const {
    NoteVersion v;
    v.id = generate_entity_id();
    v.note_id = n.id;
    v.encrypted_title = n.encrypted_title;
    v.encrypted_content = n.encrypted_content;
    v.size = n.encrypted_content.ciphertext.size();
    v.created_at = now;

    // oldest first; evict until the new one fits
    std::vector<NoteVersion> existing = store_.versions_of(n.id);
    size_t total = existing.size() + 1;
    for (size_t i = 0; i < existing.size() && total > MAX_NOTE_VERSIONS; ++i, --total) {
        batch.delete_versions.push_back(existing[i].id);
    }
    batch.put_versions.push_back(std::move(v));
}

ZkStatus Notebook::commit(const StoreBatch& batch, int64_t now) {
    ZkStatus st = store_.apply(batch);
    if (!ok(st)) return st;
    if (scheduler_) scheduler_->mark_dirty(now);
    return ZkStatus::OK;
}

ZkStatus Notebook::note_dek(
    const SessionContext& s,
    LocalNote& ln,
    const SecureBuffer* password,
    Dek& out,
    Kek* password_kek_out
)
{
    if (!ln.note.has_password) return unwrap_dek(ln.note.encrypted_dek, s.kek(), out);
    if (!password) return ZkStatus::PASSWORD_REQUIRED;

    LockoutState before = ln.lockout;
    ZkStatus st = unlock_protected_dek(s.kek(), ln.note.protection, ln.note.encrypted_dek,
        *password, ln.lockout, clock_(), out, password_kek_out);
    if (lockout_changed(before, ln.lockout)) {
        StoreBatch b;
        b.put_notes.push_back(ln);
        ZkStatus pst = store_.apply(b);
        if (!ok(pst)) return pst;
    }
    return st;
}

ZkStatus Notebook::folder_dek(
    const SessionContext& s,
    LocalFolder& lf,
    const SecureBuffer* password,
    Dek& out,
    Kek* password_kek_out
)
{
    if (!lf.folder.has_password) return unwrap_dek(lf.folder.encrypted_dek, s.kek(), out);
    if (!password) return ZkStatus::PASSWORD_REQUIRED;

    LockoutState before = lf.lockout;
    ZkStatus st = unlock_protected_dek(s.kek(), lf.folder.protection, lf.folder.encrypted_dek,
        *password, lf.lockout, clock_(), out, password_kek_out);
    if (lockout_changed(before, lf.lockout)) {
        StoreBatch b;
        b.put_folders.push_back(lf);
        ZkStatus pst = store_.apply(b);
        if (!ok(pst)) return pst;
    }
    return st;
}


// -------- Folders --------
ZkStatus Notebook::create_folder(
    const SessionContext& s,
    const std::string& name,
    const std::string& parent_id,
    std::string& out_id
)
{
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;
    st = check_folder_name(name);
    if (!ok(st)) return st;
    st = tree().check_create(parent_id);
    if (!ok(st)) return st;

    const int64_t now = clock_();
    LocalFolder lf;
    Folder& f = lf.folder;
    f.id = generate_entity_id();
    f.parent_id = parent_id;
    f.order = static_cast<int>(store_.child_folders(parent_id).size());
    f.created_at = now;

    Dek dek = generate_dek();
    st = encrypt_text(dek, name, f.encrypted_name);
    if (!ok(st)) return st;
    st = wrap_dek(dek, s.kek(), f.encrypted_dek);
    if (!ok(st)) return st;

    StoreBatch batch;
    put_dirty(batch, std::move(lf), now);
    st = commit(batch, now);
    if (!ok(st)) return st;

    out_id = batch.put_folders.front().folder.id;
    audit_log_level(LogLevel::INFO,
        "Folder created",
        "folder_create",
        "success");
    return ZkStatus::OK;
}

ZkStatus Notebook::rename_folder(const SessionContext& s, const std::string& id, const std::string& name) {
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;
    st = check_folder_name(name);
    if (!ok(st)) return st;

    LocalFolder lf;
    st = live_folder(id, lf);
    if (!ok(st)) return st;
    if (lf.folder.has_password) return ZkStatus::PASSWORD_REQUIRED;

    Dek dek;
    st = folder_dek(s, lf, nullptr, dek);
    if (!ok(st)) return st;
    st = encrypt_text(dek, name, lf.folder.encrypted_name);
    if (!ok(st)) return st;

    const int64_t now = clock_();
    StoreBatch batch;
    put_dirty(batch, std::move(lf), now);
    return commit(batch, now);
}

ZkStatus Notebook::move_folder(const SessionContext& s, const std::string& id, const std::string& new_parent_id) {
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    LocalFolder lf;
    st = live_folder(id, lf);
    if (!ok(st)) return st;
    st = tree().check_move(id, new_parent_id);
    if (!ok(st)) return st;

    const int64_t now = clock_();
    lf.folder.parent_id = new_parent_id;
    StoreBatch batch;
    put_dirty(batch, std::move(lf), now);
    return commit(batch, now);
}

ZkStatus Notebook::set_folder_order(const SessionContext& s, const std::string& id, int order) {
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;
    if (order < 0) return ZkStatus::VALIDATION_FAILURE;

    LocalFolder lf;
    st = live_folder(id, lf);
    if (!ok(st)) return st;

    const int64_t now = clock_();
    lf.folder.order = order;
    StoreBatch batch;
    put_dirty(batch, std::move(lf), now);
    return commit(batch, now);
}

ZkStatus Notebook::delete_folder(const SessionContext& s, const std::string& id) {
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    LocalFolder root;
    st = live_folder(id, root);
    if (!ok(st)) return st;

    const int64_t now = clock_();
    FolderTree t = tree();
    std::vector<std::string> folder_ids = t.descendant_folders(id);
    folder_ids.insert(folder_ids.begin(), id);

    StoreBatch batch;
    for (const auto& fid : folder_ids) {
        LocalFolder lf;
        if (!store_.get_folder(fid, lf)) continue;
        lf.folder.is_deleted = true;
        lf.folder.deleted_at = now;
        put_dirty(batch, std::move(lf), now);

        for (const auto& nid : t.notes_in(fid)) {
            LocalNote ln;
            if (!store_.get_note(nid, ln)) continue;
            ln.note.is_deleted = true;
            ln.note.deleted_at = now;
            put_dirty(batch, std::move(ln), now);
            batch.purge_versions_of.push_back(nid);
        }
    }

    st = commit(batch, now);
    if (!ok(st)) return st;
    audit_log_level(LogLevel::INFO,
        "Folder deleted with " + std::to_string(batch.put_notes.size()) + " notes",
        "folder_delete",
        "success");
    return ZkStatus::OK;
}

ZkStatus Notebook::read_folder_name(const SessionContext& s, const std::string& id, std::string& out) {
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    LocalFolder lf;
    st = live_folder(id, lf);
    if (!ok(st)) return st;

    Dek dek;
    st = folder_dek(s, lf, nullptr, dek);
    if (!ok(st)) return st;
    return decrypt_text(dek, lf.folder.encrypted_name, out);
}

ZkStatus Notebook::list_folders(
    const SessionContext& s,
    const std::string& parent_id,
    std::vector<FolderSummary>& out
)
{
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    std::vector<FolderSummary> result;
    for (auto& lf : store_.child_folders(parent_id)) {
        if (lf.folder.is_deleted) continue;
        FolderSummary fs;
        fs.id = lf.folder.id;
        fs.parent_id = lf.folder.parent_id;
        fs.has_password = lf.folder.has_password;
        fs.password_inherited = lf.folder.password_inherited;
        fs.order = lf.folder.order;
        if (!lf.folder.has_password) {
            Dek dek;
            st = folder_dek(s, lf, nullptr, dek);
            if (ok(st)) st = decrypt_text(dek, lf.folder.encrypted_name, fs.name);
            if (!ok(st)) return st;
        }
        result.push_back(std::move(fs));
    }
    std::sort(result.begin(), result.end(), [](const FolderSummary& a, const FolderSummary& b) {
        return a.order < b.order;
        });
    out = std::move(result);
    return ZkStatus::OK;
}


// -------- Notes --------
ZkStatus Notebook::create_note(
    const SessionContext& s,
    const std::string& title,
    const std::string& content,
    const std::string& folder_id,
    std::string& out_id
)
{
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;
    st = check_note_input(title, content);
    if (!ok(st)) return st;
    if (!folder_id.empty()) {
        LocalFolder lf;
        st = live_folder(folder_id, lf);
        if (!ok(st)) return st;
    }

    const int64_t now = clock_();
    LocalNote ln;
    Note& n = ln.note;
    n.id = generate_entity_id();
    n.folder_id = folder_id;
    n.created_at = now;

    Dek dek = generate_dek();
    st = seal_body(dek, title, content, n);
    if (!ok(st)) return st;
    st = wrap_dek(dek, s.kek(), n.encrypted_dek);
    if (!ok(st)) return st;

    StoreBatch batch;
    put_dirty(batch, std::move(ln), now);
    st = commit(batch, now);
    if (!ok(st)) return st;

    out_id = batch.put_notes.front().note.id;
    audit_log_level(LogLevel::INFO,
        "Note created",
        "note_create",
        "success");
    return ZkStatus::OK;
}

ZkStatus Notebook::read_note(const SessionContext& s, const std::string& id, NotePlain& out) {
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    LocalNote ln;
    st = live_note(id, ln);
    if (!ok(st)) return st;

    Dek dek;
    st = note_dek(s, ln, nullptr, dek);
    if (!ok(st)) return st;
    st = open_body(dek, ln.note.encrypted_title, ln.note.encrypted_content, out);
    if (!ok(st)) {
        audit_log_level(LogLevel::ERROR,
            "Note failed to decrypt",
            "note_read",
            "failure");
    }
    return st;
}

ZkStatus Notebook::update_note(
    const SessionContext& s,
    const std::string& id,
    const std::string& title,
    const std::string& content,
    const SecureBuffer* password
)
{
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;
    st = check_note_input(title, content);
    if (!ok(st)) return st;

    LocalNote ln;
    st = live_note(id, ln);
    if (!ok(st)) return st;

    Dek dek;
    st = note_dek(s, ln, password, dek);
    if (!ok(st)) return st;

    const int64_t now = clock_();
    StoreBatch batch;
    record_version(batch, ln.note, now);

    st = seal_body(dek, title, content, ln.note);
    if (!ok(st)) return st;

    put_dirty(batch, std::move(ln), now);
    st = commit(batch, now);
    if (!ok(st)) return st;

    audit_log_level(LogLevel::INFO,
        "Note updated",
        "note_update",
        "success");
    return ZkStatus::OK;
}

ZkStatus Notebook::move_note(const SessionContext& s, const std::string& id, const std::string& folder_id) {
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    LocalNote ln;
    st = live_note(id, ln);
    if (!ok(st)) return st;
    if (!folder_id.empty()) {
        LocalFolder lf;
        st = live_folder(folder_id, lf);
        if (!ok(st)) return st;
    }

    const int64_t now = clock_();
    ln.note.folder_id = folder_id;
    StoreBatch batch;
    put_dirty(batch, std::move(ln), now);
    return commit(batch, now);
}

ZkStatus Notebook::delete_note(const SessionContext& s, const std::string& id) {
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    LocalNote ln;
    st = live_note(id, ln);
    if (!ok(st)) return st;

    const int64_t now = clock_();
    ln.note.is_deleted = true;
    ln.note.deleted_at = now;
    StoreBatch batch;
    put_dirty(batch, std::move(ln), now);
    batch.purge_versions_of.push_back(id);
    st = commit(batch, now);
    if (!ok(st)) return st;

    audit_log_level(LogLevel::INFO,
        "Note deleted",
        "note_delete",
        "success");
    return ZkStatus::OK;
}

ZkStatus Notebook::set_pinned(const SessionContext& s, const std::string& id, bool pinned) {
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    LocalNote ln;
    st = live_note(id, ln);
    if (!ok(st)) return st;
    if (ln.note.is_pinned == pinned) return ZkStatus::OK;

    const int64_t now = clock_();
    ln.note.is_pinned = pinned;
    ln.note.pinned_at = pinned ? now : 0;
    StoreBatch batch;
    put_dirty(batch, std::move(ln), now);
    return commit(batch, now);
}

ZkStatus Notebook::set_tags(const SessionContext& s, const std::string& id, const std::vector<std::string>& tags) {
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;
    if (tags.size() > MAX_TAGS) return ZkStatus::VALIDATION_FAILURE;

    std::vector<std::string> clean;
    for (const auto& t : tags) {
        if (!valid_tag(t)) return ZkStatus::VALIDATION_FAILURE;
        if (std::find(clean.begin(), clean.end(), t) == clean.end()) clean.push_back(t);
    }

    LocalNote ln;
    st = live_note(id, ln);
    if (!ok(st)) return st;

    const int64_t now = clock_();
    ln.note.tags = std::move(clean);
    StoreBatch batch;
    put_dirty(batch, std::move(ln), now);
    return commit(batch, now);
}

ZkStatus Notebook::list_notes(
    const SessionContext& s,
    const std::string& folder_id,
    std::vector<NoteSummary>& out
)
{
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    std::vector<NoteSummary> result;
    for (auto& ln : store_.notes_in_folder(folder_id)) {
        if (ln.note.is_deleted) continue;
        NoteSummary ns;
        ns.id = ln.note.id;
        ns.folder_id = ln.note.folder_id;
        ns.has_password = ln.note.has_password;
        ns.password_inherited = ln.note.password_inherited;
        ns.is_pinned = ln.note.is_pinned;
        ns.pinned_at = ln.note.pinned_at;
        ns.tags = ln.note.tags;
        ns.updated_at = ln.note.updated_at;
        if (!ln.note.has_password) {
            Dek dek;
            st = note_dek(s, ln, nullptr, dek);
            if (ok(st)) st = decrypt_text(dek, ln.note.encrypted_title, ns.title);
            if (!ok(st)) return st;
        }
        result.push_back(std::move(ns));
    }

    std::sort(result.begin(), result.end(), [](const NoteSummary& a, const NoteSummary& b) {
        if (a.is_pinned != b.is_pinned) return a.is_pinned;
        if (a.is_pinned && a.pinned_at != b.pinned_at) return a.pinned_at > b.pinned_at;
        return a.updated_at > b.updated_at;
        });
    out = std::move(result);
    return ZkStatus::OK;
}


// -------- History --------
std::vector<NoteVersion> Notebook::versions(const std::string& note_id) const {
    return store_.versions_of(note_id);
}

ZkStatus Notebook::read_version(
    const SessionContext& s,
    const std::string& version_id,
    NotePlain& out,
    const SecureBuffer* password
)
{
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    NoteVersion v;
    if (!store_.get_version(version_id, v)) return ZkStatus::NOT_FOUND;
    LocalNote ln;
    st = live_note(v.note_id, ln);
    if (!ok(st)) return st;

    Dek dek;
    st = note_dek(s, ln, password, dek);
    if (!ok(st)) return st;
    return open_body(dek, v.encrypted_title, v.encrypted_content, out);
}

ZkStatus Notebook::restore_version(
    const SessionContext& s,
    const std::string& note_id,
    const std::string& version_id,
    const SecureBuffer* password
)
{
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    NoteVersion v;
    if (!store_.get_version(version_id, v) || v.note_id != note_id) return ZkStatus::NOT_FOUND;
    LocalNote ln;
    st = live_note(note_id, ln);
    if (!ok(st)) return st;

    // the version must open under the note's current key before it replaces anything
    Dek dek;
    st = note_dek(s, ln, password, dek);
    if (!ok(st)) return st;
    NotePlain check;
    st = open_body(dek, v.encrypted_title, v.encrypted_content, check);
    if (!ok(st)) return st;

    const int64_t now = clock_();
    StoreBatch batch;
    record_version(batch, ln.note, now);
    ln.note.encrypted_title = v.encrypted_title;
    ln.note.encrypted_content = v.encrypted_content;
    put_dirty(batch, std::move(ln), now);
    st = commit(batch, now);
    if (!ok(st)) return st;

    audit_log_level(LogLevel::INFO,
        "Note restored from history",
        "note_restore",
        "success");
    return ZkStatus::OK;
}


// -------- Secondary passwords --------
ZkStatus Notebook::set_note_password(const SessionContext& s, const std::string& id, const SecureBuffer& password) {
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;
    if (!valid_secret(password)) return ZkStatus::VALIDATION_FAILURE;

    LocalNote ln;
    st = live_note(id, ln);
    if (!ok(st)) return st;
    if (ln.note.has_password) return ZkStatus::VALIDATION_FAILURE;

    Dek old_dek;
    st = note_dek(s, ln, nullptr, old_dek);
    if (!ok(st)) return st;
    NotePlain plain;
    st = open_body(old_dek, ln.note.encrypted_title, ln.note.encrypted_content, plain);
    if (!ok(st)) return st;

    Dek dek = generate_dek();
    Kek password_kek;
    Protection prot;
    st = begin_protection(s.kek(), password, recovery_public_key(), dek, password_kek, prot);
    if (!ok(st)) return st;

    Note& n = ln.note;
    st = seal_body(dek, plain.title, plain.content, n);
    if (!ok(st)) return st;
    st = wrap_dek(dek, password_kek, n.encrypted_dek);
    if (!ok(st)) return st;
    n.has_password = true;
    n.password_inherited = false;
    n.protection = std::move(prot);
    lockout_record_success(ln.lockout);

    const int64_t now = clock_();
    StoreBatch batch;
    put_dirty(batch, std::move(ln), now);
    batch.purge_versions_of.push_back(id);
    st = commit(batch, now);
    if (!ok(st)) return st;

    audit_log_level(LogLevel::INFO,
        "Note password set",
        "note_protect",
        "success");
    return ZkStatus::OK;
}

ZkStatus Notebook::unlock_note(
    const SessionContext& s,
    const std::string& id,
    const SecureBuffer& password,
    NotePlain& out
)
{
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    LocalNote ln;
    st = live_note(id, ln);
    if (!ok(st)) return st;

    Dek dek;
    st = note_dek(s, ln, &password, dek);
    if (!ok(st)) return st;
    return open_body(dek, ln.note.encrypted_title, ln.note.encrypted_content, out);
}

ZkStatus Notebook::remove_note_password(const SessionContext& s, const std::string& id, const SecureBuffer& password) {
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    LocalNote ln;
    st = live_note(id, ln);
    if (!ok(st)) return st;
    if (!ln.note.has_password || ln.note.password_inherited) return ZkStatus::VALIDATION_FAILURE;

    Dek old_dek;
    st = note_dek(s, ln, &password, old_dek);
    if (!ok(st)) return st;
    NotePlain plain;
    st = open_body(old_dek, ln.note.encrypted_title, ln.note.encrypted_content, plain);
    if (!ok(st)) return st;

    // brand-new DEK: nothing made under the password stays usable
    Dek dek = generate_dek();
    Note& n = ln.note;
    st = seal_body(dek, plain.title, plain.content, n);
    if (!ok(st)) return st;
    st = wrap_dek(dek, s.kek(), n.encrypted_dek);
    if (!ok(st)) return st;
    drop_protection(n);

    const int64_t now = clock_();
    StoreBatch batch;
    put_dirty(batch, std::move(ln), now);
    batch.purge_versions_of.push_back(id);
    st = commit(batch, now);
    if (!ok(st)) return st;

    audit_log_level(LogLevel::INFO,
        "Note password removed",
        "note_unprotect",
        "success");
    return ZkStatus::OK;
}

ZkStatus Notebook::set_folder_password(
    const SessionContext& s,
    const std::string& id,
    const SecureBuffer& password,
    bool inherit
)
{
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;
    if (!valid_secret(password)) return ZkStatus::VALIDATION_FAILURE;

    LocalFolder lf;
    st = live_folder(id, lf);
    if (!ok(st)) return st;
    if (lf.folder.has_password) return ZkStatus::VALIDATION_FAILURE;

    Dek old_dek;
    st = folder_dek(s, lf, nullptr, old_dek);
    if (!ok(st)) return st;
    std::string name;
    st = decrypt_text(old_dek, lf.folder.encrypted_name, name);
    if (!ok(st)) return st;

    const Bytes recovery_pk = recovery_public_key();
    Dek dek = generate_dek();
    Kek password_kek;
    Protection prot;
    st = begin_protection(s.kek(), password, recovery_pk, dek, password_kek, prot);
    if (!ok(st)) return st;

    st = encrypt_text(dek, name, lf.folder.encrypted_name);
    if (!ok(st)) return st;
    st = wrap_dek(dek, password_kek, lf.folder.encrypted_dek);
    if (!ok(st)) return st;
    lf.folder.has_password = true;
    lf.folder.password_inherited = false;
    lf.folder.protection = prot;
    lockout_record_success(lf.lockout);

    const int64_t now = clock_();
    StoreBatch batch;
    put_dirty(batch, std::move(lf), now);

    // children share the folder's salt, so one derivation covers the subtree
    CascadePlan plan = tree().cascade_plan(id, inherit);
    for (const auto& nid : plan.note_ids) {
        LocalNote ln;
        if (!store_.get_note(nid, ln)) continue;
        Dek child_old;
        st = unwrap_dek(ln.note.encrypted_dek, s.kek(), child_old);
        if (!ok(st)) return st;
        NotePlain plain;
        st = open_body(child_old, ln.note.encrypted_title, ln.note.encrypted_content, plain);
        if (!ok(st)) return st;

        Dek child = generate_dek();
        Note& n = ln.note;
        st = seal_body(child, plain.title, plain.content, n);
        if (!ok(st)) return st;
        st = wrap_dek(child, password_kek, n.encrypted_dek);
        if (!ok(st)) return st;
        n.has_password = true;
        n.password_inherited = true;
        n.protection = Protection{};
        n.protection.encrypted_salt = prot.encrypted_salt;
        n.protection.source_folder_id = id;
        if (!recovery_pk.empty()) {
            st = seal_key(child, recovery_pk, n.protection.recovery_dek);
            if (!ok(st)) return st;
        }
        put_dirty(batch, std::move(ln), now);
        batch.purge_versions_of.push_back(nid);
    }
    for (const auto& fid : plan.folder_ids) {
        LocalFolder child_folder;
        if (!store_.get_folder(fid, child_folder)) continue;
        Dek child_old;
        st = unwrap_dek(child_folder.folder.encrypted_dek, s.kek(), child_old);
        if (!ok(st)) return st;
        std::string child_name;
        st = decrypt_text(child_old, child_folder.folder.encrypted_name, child_name);
        if (!ok(st)) return st;

        Dek child = generate_dek();
        Folder& f = child_folder.folder;
        st = encrypt_text(child, child_name, f.encrypted_name);
        if (!ok(st)) return st;
        st = wrap_dek(child, password_kek, f.encrypted_dek);
        if (!ok(st)) return st;
        f.has_password = true;
        f.password_inherited = true;
        f.protection = Protection{};
        f.protection.encrypted_salt = prot.encrypted_salt;
        f.protection.source_folder_id = id;
        put_dirty(batch, std::move(child_folder), now);
    }

    st = commit(batch, now);
    if (!ok(st)) return st;

    audit_log_level(LogLevel::INFO,
        "Folder password set, " + std::to_string(plan.note_ids.size()) + " notes and " +
        std::to_string(plan.folder_ids.size()) + " folders inherit it",
        "folder_protect",
        "success");
    return ZkStatus::OK;
}

ZkStatus Notebook::unlock_folder(
    const SessionContext& s,
    const std::string& id,
    const SecureBuffer& password,
    std::string& name
)
{
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    LocalFolder lf;
    st = live_folder(id, lf);
    if (!ok(st)) return st;

    Dek dek;
    st = folder_dek(s, lf, &password, dek);
    if (!ok(st)) return st;
    return decrypt_text(dek, lf.folder.encrypted_name, name);
}

ZkStatus Notebook::remove_folder_password(const SessionContext& s, const std::string& id, const SecureBuffer& password) {
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    LocalFolder lf;
    st = live_folder(id, lf);
    if (!ok(st)) return st;
    if (!lf.folder.has_password || lf.folder.password_inherited) return ZkStatus::VALIDATION_FAILURE;

    Dek old_dek;
    Kek password_kek;
    st = folder_dek(s, lf, &password, old_dek, &password_kek);
    if (!ok(st)) return st;
    std::string name;
    st = decrypt_text(old_dek, lf.folder.encrypted_name, name);
    if (!ok(st)) return st;

    Dek dek = generate_dek();
    st = encrypt_text(dek, name, lf.folder.encrypted_name);
    if (!ok(st)) return st;
    st = wrap_dek(dek, s.kek(), lf.folder.encrypted_dek);
    if (!ok(st)) return st;
    drop_protection(lf.folder);

    const int64_t now = clock_();
    StoreBatch batch;
    put_dirty(batch, std::move(lf), now);

    // independently protected children are not in the plan
    CascadePlan plan = tree().inherited_from(id);
    for (const auto& nid : plan.note_ids) {
        LocalNote ln;
        if (!store_.get_note(nid, ln)) continue;
        Dek child_old;
        st = unwrap_dek(ln.note.encrypted_dek, password_kek, child_old);
        if (!ok(st)) return st;
        NotePlain plain;
        st = open_body(child_old, ln.note.encrypted_title, ln.note.encrypted_content, plain);
        if (!ok(st)) return st;

        Dek child = generate_dek();
        st = seal_body(child, plain.title, plain.content, ln.note);
        if (!ok(st)) return st;
        st = wrap_dek(child, s.kek(), ln.note.encrypted_dek);
        if (!ok(st)) return st;
        drop_protection(ln.note);
        put_dirty(batch, std::move(ln), now);
        batch.purge_versions_of.push_back(nid);
    }
    for (const auto& fid : plan.folder_ids) {
        LocalFolder child_folder;
        if (!store_.get_folder(fid, child_folder)) continue;
        Dek child_old;
        st = unwrap_dek(child_folder.folder.encrypted_dek, password_kek, child_old);
        if (!ok(st)) return st;
        std::string child_name;
        st = decrypt_text(child_old, child_folder.folder.encrypted_name, child_name);
        if (!ok(st)) return st;

        Dek child = generate_dek();
        st = encrypt_text(child, child_name, child_folder.folder.encrypted_name);
        if (!ok(st)) return st;
        st = wrap_dek(child, s.kek(), child_folder.folder.encrypted_dek);
        if (!ok(st)) return st;
        drop_protection(child_folder.folder);
        put_dirty(batch, std::move(child_folder), now);
    }

    st = commit(batch, now);
    if (!ok(st)) return st;

    audit_log_level(LogLevel::INFO,
        "Folder password removed",
        "folder_unprotect",
        "success");
    return ZkStatus::OK;
}

LockoutState Notebook::lockout_of(const std::string& id) const {
    LocalNote ln;
    if (store_.get_note(id, ln)) return ln.lockout;
    LocalFolder lf;
    if (store_.get_folder(id, lf)) return lf.lockout;
    return LockoutState{};
}


// -------- Recovery of protected notes --------
ZkStatus Notebook::recovery_dek(const std::vector<std::string>& words, const Note& n, Dek& out) {
    ZkStatus st = validate_recovery_words(words);
    if (!ok(st)) return st;

    KeyStore ks;
    if (!store_.get_key_store(ks)) return ZkStatus::NOT_FOUND;
    if (!verify_recovery_key(words, ks.recovery_hash)) {
        audit_log_level(LogLevel::WARN,
            "Recovery phrase does not match account",
            "note_recover",
            "failure");
        return ZkStatus::AUTHENTICATION_FAILURE;
    }
    if (!n.has_password || n.protection.recovery_dek.empty()) return ZkStatus::NOT_FOUND;

    RecoveryKeyMaterial rkm;
    st = derive_key_from_recovery_words(words, rkm);
    if (!ok(st)) return st;
    RecoveryKeyPair pair;
    st = recovery_keypair(rkm, pair);
    if (!ok(st)) return st;
    return open_sealed_key(n.protection.recovery_dek, pair, out);
}

ZkStatus Notebook::recover_protected_note(
    const SessionContext& s,
    const std::vector<std::string>& words,
    const std::string& id,
    NotePlain& out
)
{
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;

    LocalNote ln;
    st = live_note(id, ln);
    if (!ok(st)) return st;

    Dek dek;
    st = recovery_dek(words, ln.note, dek);
    if (!ok(st)) return st;
    st = open_body(dek, ln.note.encrypted_title, ln.note.encrypted_content, out);
    if (!ok(st)) return st;

    audit_log_level(LogLevel::ALERT,
        "Protected note opened with recovery phrase",
        "note_recover",
        "success");
    return ZkStatus::OK;
}

ZkStatus Notebook::reset_note_password_with_recovery(
    const SessionContext& s,
    const std::vector<std::string>& words,
    const std::string& id,
    const SecureBuffer& new_password
)
{
    ZkStatus st = s.require_open();
    if (!ok(st)) return st;
    if (!valid_secret(new_password)) return ZkStatus::VALIDATION_FAILURE;

    LocalNote ln;
    st = live_note(id, ln);
    if (!ok(st)) return st;

    Dek dek;
    st = recovery_dek(words, ln.note, dek);
    if (!ok(st)) return st;

    // same DEK under a new password: content stays as it is
    Kek password_kek;
    Protection prot;
    st = begin_protection(s.kek(), new_password, recovery_public_key(), dek, password_kek, prot);
    if (!ok(st)) return st;
    st = wrap_dek(dek, password_kek, ln.note.encrypted_dek);
    if (!ok(st)) return st;
    ln.note.password_inherited = false;
    ln.note.protection = std::move(prot);
    lockout_record_success(ln.lockout);

    const int64_t now = clock_();
    StoreBatch batch;
    put_dirty(batch, std::move(ln), now);
    st = commit(batch, now);
    if (!ok(st)) return st;

    audit_log_level(LogLevel::ALERT,
        "Note password reset with recovery phrase",
        "note_recover",
        "success");
    return ZkStatus::OK;
}
