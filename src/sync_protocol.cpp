#include "sync_protocol.hpp"
#include "logging.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// -------- Arbiter --------
PullResponse RemoteState::pull(uint64_t since) const {
    PullResponse r;
    for (const auto& kv : notes_) {
        if (kv.second.change_seq > since) r.notes.push_back(kv.second);
    }
    for (const auto& kv : folders_) {
        if (kv.second.change_seq > since) r.folders.push_back(kv.second);
    }
    r.current_sync_version = seq_;
    r.key_store = key_store_;
    return r;
}

bool RemoteState::get_note(const std::string& id, Note& out) const {
    auto it = notes_.find(id);
    if (it == notes_.end()) return false;
    out = it->second;
    return true;
}

template <typename T>
void RemoteState::apply_entity(
    const T& incoming,
    const std::string& device_id,
    std::map<std::string, T>& table,
    EntityResults<T>& results
)
{
    auto it = table.find(incoming.id);
    if (it == table.end()) {
        T stored = incoming;
        stored.sync_version = 1;
        stored.change_seq = ++seq_;
        stored.last_modified_device_id = device_id;
        table[stored.id] = stored;
        results.created.push_back(stored);
        return;
    }

    const T& current = it->second;
    if (current.sync_version > incoming.sync_version &&
        current.last_modified_device_id != device_id) {
        // someone else wrote since this client last saw the entity:
        // strictly later wall-clock write wins, no field merge
        if (incoming.updated_at <= current.updated_at) {
            results.conflicts.push_back(current);
            return;
        }
        results.conflicts_won.push_back(incoming.id);
    }

    T stored = incoming;
    stored.sync_version = current.sync_version + 1;
    stored.change_seq = ++seq_;
    stored.last_modified_device_id = device_id;
    it->second = stored;
    results.updated.push_back(stored);
}

ZkStatus RemoteState::push(const PushRequest& req, PushResult& out) {
    const uint64_t server_epoch = key_store_ ? key_store_->key_epoch : 0;
    const uint64_t seq_before = seq_;

    if (req.key_store) {
        // first key store, or exactly one rotation built on everything we hold
        bool fresh = !key_store_ && req.key_store->key_epoch >= 1;
        bool next = key_store_ && req.key_store->key_epoch == server_epoch + 1 &&
            req.base_seq == seq_;
        if ((!fresh && !next) || req.key_epoch != req.key_store->key_epoch) {
            audit_log_level(LogLevel::WARN,
                "Push rejected: key store update out of order",
                "sync_server",
                "failure");
            return ZkStatus::KEY_EPOCH_MISMATCH;
        }
        if (key_store_ && req.key_store->user_id != key_store_->user_id) {
            return ZkStatus::VALIDATION_FAILURE;
        }
    }
    else if (key_store_ && req.key_epoch != server_epoch) {
        audit_log_level(LogLevel::WARN,
            "Push rejected: stale key epoch",
            "sync_server",
            "failure");
        return ZkStatus::KEY_EPOCH_MISMATCH;
    }

    PushResult result;
    if (req.key_store) {
        key_store_ = req.key_store;
        result.key_store_accepted = true;
    }
    for (const auto& n : req.notes) apply_entity(n, req.device_id, notes_, result.notes);
    for (const auto& f : req.folders) apply_entity(f, req.device_id, folders_, result.folders);

    result.current_sync_version = seq_;
    result.caught_up = (req.base_seq == seq_before);
    out = std::move(result);
    return ZkStatus::OK;
}


// -------- JSON --------
template <typename T>
static void results_to_json(json& j, const EntityResults<T>& r) {
    j = json{
        {"created", r.created},
        {"updated", r.updated},
        {"conflicts", r.conflicts},
        {"conflictsWon", r.conflicts_won}
    };
}

template <typename T>
static void results_from_json(const json& j, EntityResults<T>& r) {
    j.at("created").get_to(r.created);
    j.at("updated").get_to(r.updated);
    j.at("conflicts").get_to(r.conflicts);
    r.conflicts_won = j.value("conflictsWon", std::vector<std::string>{});
}

static json opt_key_store(const std::optional<KeyStore>& ks) {
    return ks ? json(*ks) : json(nullptr);
}

static std::optional<KeyStore> get_opt_key_store(const json& j) {
    auto it = j.find("keyStore");
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<KeyStore>();
}

void to_json(json& j, const PullResponse& r) {
    j = json{
        {"notes", r.notes},
        {"folders", r.folders},
        {"currentSyncVersion", r.current_sync_version},
        {"keyStore", opt_key_store(r.key_store)}
    };
}

void from_json(const json& j, PullResponse& r) {
    j.at("notes").get_to(r.notes);
    j.at("folders").get_to(r.folders);
    j.at("currentSyncVersion").get_to(r.current_sync_version);
    r.key_store = get_opt_key_store(j);
}

void to_json(json& j, const PushRequest& r) {
    j = json{
        {"deviceId", r.device_id},
        {"keyEpoch", r.key_epoch},
        {"baseSeq", r.base_seq},
        {"notes", r.notes},
        {"folders", r.folders},
        {"keyStore", opt_key_store(r.key_store)}
    };
}

void from_json(const json& j, PushRequest& r) {
    j.at("deviceId").get_to(r.device_id);
    j.at("keyEpoch").get_to(r.key_epoch);
    j.at("baseSeq").get_to(r.base_seq);
    j.at("notes").get_to(r.notes);
    j.at("folders").get_to(r.folders);
    r.key_store = get_opt_key_store(j);
}

void to_json(json& j, const PushResult& r) {
    json notes, folders;
    results_to_json(notes, r.notes);
    results_to_json(folders, r.folders);
    j = json{
        {"results", { {"notes", notes}, {"folders", folders} }},
        {"currentSyncVersion", r.current_sync_version},
        {"caughtUp", r.caught_up},
        {"keyStoreAccepted", r.key_store_accepted}
    };
}

void from_json(const json& j, PushResult& r) {
    const json& res = j.at("results");
    results_from_json(res.at("notes"), r.notes);
    results_from_json(res.at("folders"), r.folders);
    j.at("currentSyncVersion").get_to(r.current_sync_version);
    r.caught_up = j.value("caughtUp", false);
    r.key_store_accepted = j.value("keyStoreAccepted", false);
}

void to_json(json& j, const RemoteState& s) {
    json notes = json::array();
    for (const auto& kv : s.notes_) notes.push_back(kv.second);
    json folders = json::array();
    for (const auto& kv : s.folders_) folders.push_back(kv.second);
    j = json{
        {"seq", s.seq_},
        {"notes", notes},
        {"folders", folders},
        {"keyStore", opt_key_store(s.key_store_)}
    };
}

void from_json(const json& j, RemoteState& s) {
    RemoteState loaded;
    j.at("seq").get_to(loaded.seq_);
    for (const auto& jn : j.at("notes")) {
        Note n = jn.get<Note>();
        loaded.notes_[n.id] = n;
    }
    for (const auto& jf : j.at("folders")) {
        Folder f = jf.get<Folder>();
        loaded.folders_[f.id] = f;
    }
    loaded.key_store_ = get_opt_key_store(j);
    s = std::move(loaded);
}
