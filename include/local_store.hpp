#pragma once
#include "entities.hpp"
#include "status.hpp"

#include <optional>

// One atomic unit of change to the device store
struct StoreBatch {
    std::vector<LocalNote> put_notes;
    std::vector<LocalFolder> put_folders;
    std::vector<NoteVersion> put_versions;
    std::vector<std::string> delete_versions;
    std::vector<std::string> purge_versions_of;     // note ids
    std::optional<KeyStore> key_store;
    std::optional<SyncState> sync_state;

    bool empty() const {
        return put_notes.empty() && put_folders.empty() && put_versions.empty() &&
            delete_versions.empty() && purge_versions_of.empty() &&
            !key_store && !sync_state;
    }
};

// Per-device durable store. Holds ciphertext, wrapped keys and metadata only.
class LocalStore {
public:
    virtual ~LocalStore() = default;

    virtual bool get_note(const std::string& id, LocalNote& out) const = 0;
    virtual bool get_folder(const std::string& id, LocalFolder& out) const = 0;
    virtual std::vector<LocalNote> all_notes() const = 0;
    virtual std::vector<LocalFolder> all_folders() const = 0;
    virtual std::vector<LocalNote> notes_in_folder(const std::string& folder_id) const = 0;
    virtual std::vector<LocalFolder> child_folders(const std::string& parent_id) const = 0;
    virtual std::vector<LocalNote> dirty_notes() const = 0;
    virtual std::vector<LocalFolder> dirty_folders() const = 0;

    // oldest first
    virtual std::vector<NoteVersion> versions_of(const std::string& note_id) const = 0;
    virtual bool get_version(const std::string& id, NoteVersion& out) const = 0;

    virtual bool get_key_store(KeyStore& out) const = 0;
    virtual SyncState sync_state() const = 0;

    // All-or-nothing: on failure nothing in the batch is visible
    virtual ZkStatus apply(const StoreBatch& batch) = 0;
};

// In-memory store; the base of the file-backed one
class MemoryLocalStore : public LocalStore {
public:
    MemoryLocalStore() = default;

    bool get_note(const std::string& id, LocalNote& out) const override;
    bool get_folder(const std::string& id, LocalFolder& out) const override;
    std::vector<LocalNote> all_notes() const override;
    std::vector<LocalFolder> all_folders() const override;
    std::vector<LocalNote> notes_in_folder(const std::string& folder_id) const override;
    std::vector<LocalFolder> child_folders(const std::string& parent_id) const override;
    std::vector<LocalNote> dirty_notes() const override;
    std::vector<LocalFolder> dirty_folders() const override;
    std::vector<NoteVersion> versions_of(const std::string& note_id) const override;
    bool get_version(const std::string& id, NoteVersion& out) const override;
    bool get_key_store(KeyStore& out) const override;
    SyncState sync_state() const override;

    ZkStatus apply(const StoreBatch& batch) override;

protected:
    struct State {
        std::map<std::string, LocalNote> notes;
        std::map<std::string, LocalFolder> folders;
        std::map<std::string, NoteVersion> versions;
        std::optional<KeyStore> key_store;
        SyncState sync;
    };

    // Persist the state about to become current
    virtual ZkStatus commit(const State& next);

    State state_;
};

// JSON document at `path`, rewritten atomically on every batch
class FileLocalStore : public MemoryLocalStore {
public:
    explicit FileLocalStore(std::string path);

    // Missing file: empty store
    ZkStatus load();

    const std::string& path() const { return path_; }

protected:
    ZkStatus commit(const State& next) override;

private:
    std::string path_;
};
