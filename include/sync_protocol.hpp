#pragma once
#include "entities.hpp"
#include "status.hpp"

#include <optional>

struct PullResponse {
    std::vector<Note> notes;
    std::vector<Folder> folders;
    uint64_t current_sync_version = 0;     // server change sequence
    std::optional<KeyStore> key_store;
};

struct PushRequest {
    std::string device_id;
    uint64_t key_epoch = 0;     // epoch the entities are wrapped under
    uint64_t base_seq = 0;      // last sequence the client has merged
    std::vector<Note> notes;
    std::vector<Folder> folders;
    std::optional<KeyStore> key_store;     // set after a password change
};

template <typename T>
struct EntityResults {
    std::vector<T> created;     // server copies, as stored
    std::vector<T> updated;
    std::vector<T> conflicts;   // client lost; the server copy it lost to
    std::vector<std::string> conflicts_won;   // client's later write applied
};

struct PushResult {
    EntityResults<Note> notes;
    EntityResults<Folder> folders;
    uint64_t current_sync_version = 0;
    bool caught_up = false;     // no foreign change between base_seq and this push
    bool key_store_accepted = false;
};

// Server-side state for one account and the only place conflicts are
// decided. Callers serialize access (mutex or file lock).
class RemoteState {
public:
    PullResponse pull(uint64_t since) const;

    // Whole batch rejected with KEY_EPOCH_MISMATCH when the client is on
    // a stale key epoch or proposes a key store it cannot have built on
    // the current state.
    ZkStatus push(const PushRequest& req, PushResult& out);

    uint64_t sequence() const { return seq_; }
    const std::optional<KeyStore>& key_store() const { return key_store_; }
    size_t note_count() const { return notes_.size(); }
    size_t folder_count() const { return folders_.size(); }
    bool get_note(const std::string& id, Note& out) const;

    friend void to_json(nlohmann::json& j, const RemoteState& s);
    friend void from_json(const nlohmann::json& j, RemoteState& s);

private:
    template <typename T>
    void apply_entity(
        const T& incoming,
        const std::string& device_id,
        std::map<std::string, T>& table,
        EntityResults<T>& results
    );

    std::map<std::string, Note> notes_;
    std::map<std::string, Folder> folders_;
    std::optional<KeyStore> key_store_;
    uint64_t seq_ = 0;
};

// -------- JSON (wire and file forms) --------
void to_json(nlohmann::json& j, const PullResponse& r);
void from_json(const nlohmann::json& j, PullResponse& r);
void to_json(nlohmann::json& j, const PushRequest& r);
void from_json(const nlohmann::json& j, PushRequest& r);
void to_json(nlohmann::json& j, const PushResult& r);
void from_json(const nlohmann::json& j, PushResult& r);
