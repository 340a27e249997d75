#pragma once
#include "folder_tree.hpp"
#include "local_store.hpp"
#include "protection.hpp"
#include "recovery.hpp"
#include "scheduler.hpp"
#include "session.hpp"

struct NotePlain {
    std::string title;
    std::string content;
};

struct NoteSummary {
    std::string id;
    std::string folder_id;
    std::string title;          // empty while protected
    bool has_password = false;
    bool password_inherited = false;
    bool is_pinned = false;
    int64_t pinned_at = 0;
    std::vector<std::string> tags;
    int64_t updated_at = 0;
};

struct FolderSummary {
    std::string id;
    std::string parent_id;
    std::string name;           // empty while protected
    bool has_password = false;
    bool password_inherited = false;
    int order = 0;
};

// Client-side operations on notes and folders. Every call that touches
// content takes the session explicitly; every mutation stamps the entity,
// marks it dirty and tells the scheduler.
class Notebook {
public:
    Notebook(LocalStore& store, std::string device_id, Clock clock = system_now_ms);

    void set_scheduler(SyncScheduler* scheduler) { scheduler_ = scheduler; }

    // -------- Folders --------
    ZkStatus create_folder(
        const SessionContext& s,
        const std::string& name,
        const std::string& parent_id,
        std::string& out_id
    );
    ZkStatus rename_folder(const SessionContext& s, const std::string& id, const std::string& name);
    ZkStatus move_folder(const SessionContext& s, const std::string& id, const std::string& new_parent_id);
    ZkStatus set_folder_order(const SessionContext& s, const std::string& id, int order);

    // Tombstones the folder, every folder below it, and their notes
    ZkStatus delete_folder(const SessionContext& s, const std::string& id);

    // PASSWORD_REQUIRED for a protected folder
    ZkStatus read_folder_name(const SessionContext& s, const std::string& id, std::string& out);
    ZkStatus list_folders(
        const SessionContext& s,
        const std::string& parent_id,
        std::vector<FolderSummary>& out
    );

    // -------- Notes --------
    ZkStatus create_note(
        const SessionContext& s,
        const std::string& title,
        const std::string& content,
        const std::string& folder_id,
        std::string& out_id
    );

    // PASSWORD_REQUIRED for a protected note
    ZkStatus read_note(const SessionContext& s, const std::string& id, NotePlain& out);

    // The previous body goes to history. Protected notes need their password.
    ZkStatus update_note(
        const SessionContext& s,
        const std::string& id,
        const std::string& title,
        const std::string& content,
        const SecureBuffer* password = nullptr
    );
    ZkStatus move_note(const SessionContext& s, const std::string& id, const std::string& folder_id);
    ZkStatus delete_note(const SessionContext& s, const std::string& id);
    ZkStatus set_pinned(const SessionContext& s, const std::string& id, bool pinned);
    ZkStatus set_tags(const SessionContext& s, const std::string& id, const std::vector<std::string>& tags);

    // Pinned first (latest pin first), then most recently updated
    ZkStatus list_notes(
        const SessionContext& s,
        const std::string& folder_id,
        std::vector<NoteSummary>& out
    );

    // -------- History --------
    std::vector<NoteVersion> versions(const std::string& note_id) const;
    ZkStatus read_version(
        const SessionContext& s,
        const std::string& version_id,
        NotePlain& out,
        const SecureBuffer* password = nullptr
    );
    ZkStatus restore_version(
        const SessionContext& s,
        const std::string& note_id,
        const std::string& version_id,
        const SecureBuffer* password = nullptr
    );

    // -------- Secondary passwords --------
    ZkStatus set_note_password(const SessionContext& s, const std::string& id, const SecureBuffer& password);
    ZkStatus unlock_note(
        const SessionContext& s,
        const std::string& id,
        const SecureBuffer& password,
        NotePlain& out
    );
    ZkStatus remove_note_password(const SessionContext& s, const std::string& id, const SecureBuffer& password);

    // inherit=true carries the password to every unprotected entity below
    ZkStatus set_folder_password(
        const SessionContext& s,
        const std::string& id,
        const SecureBuffer& password,
        bool inherit
    );
    ZkStatus unlock_folder(
        const SessionContext& s,
        const std::string& id,
        const SecureBuffer& password,
        std::string& name
    );

    // Clears the folder's own password and only what it handed down
    ZkStatus remove_folder_password(const SessionContext& s, const std::string& id, const SecureBuffer& password);

    LockoutState lockout_of(const std::string& id) const;

    // -------- Recovery of protected notes --------
    ZkStatus recover_protected_note(
        const SessionContext& s,
        const std::vector<std::string>& words,
        const std::string& id,
        NotePlain& out
    );
    ZkStatus reset_note_password_with_recovery(
        const SessionContext& s,
        const std::vector<std::string>& words,
        const std::string& id,
        const SecureBuffer& new_password
    );

private:
    ZkStatus live_note(const std::string& id, LocalNote& out) const;
    ZkStatus live_folder(const std::string& id, LocalFolder& out) const;

    // DEK of an entity: account KEK, or both secrets when protected.
    // A changed lockout state is persisted before returning.
    ZkStatus note_dek(
        const SessionContext& s,
        LocalNote& ln,
        const SecureBuffer* password,
        Dek& out,
        Kek* password_kek_out = nullptr
    );
    ZkStatus folder_dek(
        const SessionContext& s,
        LocalFolder& lf,
        const SecureBuffer* password,
        Dek& out,
        Kek* password_kek_out = nullptr
    );

    ZkStatus recovery_dek(const std::vector<std::string>& words, const Note& n, Dek& out);

    void stamp(Note& n, int64_t now) const;
    void stamp(Folder& f, int64_t now) const;
    void put_dirty(StoreBatch& batch, LocalNote ln, int64_t now) const;
    void put_dirty(StoreBatch& batch, LocalFolder lf, int64_t now) const;
    void record_version(StoreBatch& batch, const Note& n, int64_t now) const;
    ZkStatus commit(const StoreBatch& batch, int64_t now);

    FolderTree tree() const;
    Bytes recovery_public_key() const;

    LocalStore& store_;
    std::string device_id_;
    Clock clock_;
    SyncScheduler* scheduler_ = nullptr;
};
