#include "local_store.hpp"
#include "io.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// -------- MemoryLocalStore --------
bool MemoryLocalStore::get_note(const std::string& id, LocalNote& out) const {
    auto it = state_.notes.find(id);
    if (it == state_.notes.end()) return false;
    out = it->second;
    return true;
}

bool MemoryLocalStore::get_folder(const std::string& id, LocalFolder& out) const {
    auto it = state_.folders.find(id);
    if (it == state_.folders.end()) return false;
    out = it->second;
    return true;
}

std::vector<LocalNote> MemoryLocalStore::all_notes() const {
    std::vector<LocalNote> out;
    out.reserve(state_.notes.size());
    for (const auto& kv : state_.notes) out.push_back(kv.second);
    return out;
}

std::vector<LocalFolder> MemoryLocalStore::all_folders() const {
    std::vector<LocalFolder> out;
    out.reserve(state_.folders.size());
    for (const auto& kv : state_.folders) out.push_back(kv.second);
    return out;
}

std::vector<LocalNote> MemoryLocalStore::notes_in_folder(const std::string& folder_id) const {
    std::vector<LocalNote> out;
    for (const auto& kv : state_.notes) {
        if (kv.second.note.folder_id == folder_id) out.push_back(kv.second);
    }
    return out;
}

std::vector<LocalFolder> MemoryLocalStore::child_folders(const std::string& parent_id) const {
    std::vector<LocalFolder> out;
    for (const auto& kv : state_.folders) {
        if (kv.second.folder.parent_id == parent_id) out.push_back(kv.second);
    }
    return out;
}

std::vector<LocalNote> MemoryLocalStore::dirty_notes() const {
    std::vector<LocalNote> out;
    for (const auto& kv : state_.notes) {
        if (kv.second.dirty) out.push_back(kv.second);
    }
    return out;
}

std::vector<LocalFolder> MemoryLocalStore::dirty_folders() const {
    std::vector<LocalFolder> out;
    for (const auto& kv : state_.folders) {
        if (kv.second.dirty) out.push_back(kv.second);
    }
    return out;
}

std::vector<NoteVersion> MemoryLocalStore::versions_of(const std::string& note_id) const {
    std::vector<NoteVersion> out;
    for (const auto& kv : state_.versions) {
        if (kv.second.note_id == note_id) out.push_back(kv.second);
    }
    std::stable_sort(out.begin(), out.end(), [](const NoteVersion& a, const NoteVersion& b) {
        return a.created_at < b.created_at;
        });
    return out;
}

bool MemoryLocalStore::get_version(const std::string& id, NoteVersion& out) const {
    auto it = state_.versions.find(id);
    if (it == state_.versions.end()) return false;
    out = it->second;
    return true;
}

bool MemoryLocalStore::get_key_store(KeyStore& out) const {
    if (!state_.key_store) return false;
    out = *state_.key_store;
    return true;
}

SyncState MemoryLocalStore::sync_state() const {
    return state_.sync;
}

ZkStatus MemoryLocalStore::apply(const StoreBatch& batch) {
    if (batch.empty()) return ZkStatus::OK;

    State next = state_;
    for (const auto& n : batch.put_notes) next.notes[n.note.id] = n;
    for (const auto& f : batch.put_folders) next.folders[f.folder.id] = f;
    for (const auto& note_id : batch.purge_versions_of) {
        for (auto it = next.versions.begin(); it != next.versions.end();) {
            if (it->second.note_id == note_id) it = next.versions.erase(it);
            else ++it;
        }
    }
    for (const auto& id : batch.delete_versions) next.versions.erase(id);
    for (const auto& v : batch.put_versions) next.versions[v.id] = v;
    if (batch.key_store) next.key_store = batch.key_store;
    if (batch.sync_state) next.sync = *batch.sync_state;

    ZkStatus st = commit(next);
    if (!ok(st)) return st;

    state_ = std::move(next);
    return ZkStatus::OK;
}

ZkStatus MemoryLocalStore::commit(const State&) {
    return ZkStatus::OK;
}


// -------- FileLocalStore --------
FileLocalStore::FileLocalStore(std::string path)
    : path_(std::move(path))
{
}

ZkStatus FileLocalStore::load() {
    std::string text;
    bool missing = false;
    if (!read_file(path_, text, missing)) {
        return ZkStatus::STORAGE_FAILURE;
    }
    if (missing) {
        state_ = State{};
        return ZkStatus::OK;
    }

    try {
        json j = json::parse(text);
        State loaded;
        for (const auto& jn : j.at("notes")) {
            LocalNote n = jn.get<LocalNote>();
            loaded.notes[n.note.id] = n;
        }
        for (const auto& jf : j.at("folders")) {
            LocalFolder f = jf.get<LocalFolder>();
            loaded.folders[f.folder.id] = f;
        }
        for (const auto& jv : j.value("versions", json::array())) {
            NoteVersion v = jv.get<NoteVersion>();
            loaded.versions[v.id] = v;
        }
        auto ks = j.find("keyStore");
        if (ks != j.end() && !ks->is_null()) {
            loaded.key_store = ks->get<KeyStore>();
        }
        loaded.sync = j.value("sync", SyncState{});
        state_ = std::move(loaded);
    }
    catch (const std::exception& e) {
        audit_log_level(LogLevel::ERROR,
            std::string("Local store unreadable: ") + e.what(),
            "local_store",
            "failure");
        return ZkStatus::STORAGE_FAILURE;
    }
    return ZkStatus::OK;
}

ZkStatus FileLocalStore::commit(const State& next) {
    json j;
    j["notes"] = json::array();
    for (const auto& kv : next.notes) j["notes"].push_back(kv.second);
    j["folders"] = json::array();
    for (const auto& kv : next.folders) j["folders"].push_back(kv.second);
    j["versions"] = json::array();
    for (const auto& kv : next.versions) j["versions"].push_back(kv.second);
    j["keyStore"] = next.key_store ? json(*next.key_store) : json(nullptr);
    j["sync"] = next.sync;

    if (!atomic_write_text(path_, j.dump())) {
        audit_log_level(LogLevel::ERROR,
            "Local store write failed",
            "local_store",
            "failure");
        return ZkStatus::STORAGE_FAILURE;
    }
    return ZkStatus::OK;
}
