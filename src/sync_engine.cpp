#include "sync_engine.hpp"
#include "protection.hpp"

// ---------- Local entry accessors ----------
static Note& entity_of(LocalNote& l) { return l.note; }
static Folder& entity_of(LocalFolder& l) { return l.folder; }

static bool get_local(const LocalStore& s, const std::string& id, LocalNote& out) {
    return s.get_note(id, out);
}
static bool get_local(const LocalStore& s, const std::string& id, LocalFolder& out) {
    return s.get_folder(id, out);
}

static void put_local(StoreBatch& b, LocalNote l) { b.put_notes.push_back(std::move(l)); }
static void put_local(StoreBatch& b, LocalFolder l) { b.put_folders.push_back(std::move(l)); }

static ZkStatus rekey_one(Note& n, const Kek& from, const Kek& to) {
    std::vector<Note> notes{ n };
    std::vector<Folder> folders;
    ZkStatus st = rekey_entities(notes, folders, from, to);
    if (ok(st)) n = std::move(notes.front());
    return st;
}

static ZkStatus rekey_one(Folder& f, const Kek& from, const Kek& to) {
    std::vector<Note> notes;
    std::vector<Folder> folders{ f };
    ZkStatus st = rekey_entities(notes, folders, from, to);
    if (ok(st)) f = std::move(folders.front());
    return st;
}

// history is encrypted under the note's DEK; a new DEK makes it garbage
static void purge_if_new_dek(StoreBatch& b, const LocalNote& local, const Note& incoming) {
    if (local.note.encrypted_content.key_id != incoming.encrypted_content.key_id) {
        b.purge_versions_of.push_back(incoming.id);
    }
}
static void purge_if_new_dek(StoreBatch&, const LocalFolder&, const Folder&) {}

struct InProgressGuard {
    std::atomic<bool>& flag;
    ~InProgressGuard() { flag = false; }
};


SyncEngine::SyncEngine(LocalStore& store, SyncAdapter& adapter, std::string device_id, Clock clock)
    : store_(store), adapter_(adapter), device_id_(std::move(device_id)), clock_(std::move(clock))
{
}

template <typename L, typename T>
ZkStatus SyncEngine::merge_remote(
    const T& remote,
    const SessionContext* session,
    bool respect_dirty,
    StoreBatch& batch,
    SyncStats& stats
)
{
    L local;
    const bool have = get_local(store_, remote.id, local);

    // a pending local edit survives unless the remote one is strictly newer;
    // a pending rewrap gives way to any change the server accepted since
    if (have && respect_dirty && local.dirty) {
        const bool remote_wins = local.rewrap_only
            ? remote.sync_version > entity_of(local).sync_version
            : remote.updated_at > entity_of(local).updated_at;
        if (!remote_wins) {
            stats.kept_local++;
            return ZkStatus::OK;
        }
    }

    L next;
    if (have) {
        next.lockout = local.lockout;
        purge_if_new_dek(batch, local, remote);
    }
    entity_of(next) = remote;

    // written under the KEK this device just retired: move it along
    if (session && session->is_open() && session->previous_kek() &&
        bound_to_account_kek(remote, *session->previous_kek())) {
        ZkStatus st = rekey_one(entity_of(next), *session->previous_kek(), session->kek());
        if (!ok(st)) return st;
        mark_rewrapped(next, clock_());
        stats.rewrapped++;
    }

    put_local(batch, std::move(next));
    stats.merged++;
    return ZkStatus::OK;
}

template <typename L, typename T>
void SyncEngine::accept_pushed(const T& stored, StoreBatch& batch) {
    L local;
    get_local(store_, stored.id, local);
    entity_of(local) = stored;
    local.dirty = false;
    local.rewrap_only = false;
    local.dirty_since = 0;
    put_local(batch, std::move(local));
}

ZkStatus SyncEngine::pull_and_merge(const SessionContext* session, SyncStats& stats) {
    SyncState sync = store_.sync_state();

    PullResponse resp;
    ZkStatus st = adapter_.pull_changes(sync.last_sync_version, resp);
    if (!ok(st)) {
        audit_log_level(LogLevel::WARN,
            std::string("Pull failed: ") + status_str(st),
            "sync_pull",
            "failure");
        return st;
    }

    StoreBatch batch;

    KeyStore local_ks;
    const bool have_ks = store_.get_key_store(local_ks);
    if (resp.key_store) {
        const KeyStore& remote = *resp.key_store;
        if (!have_ks) {
            batch.key_store = remote;
        }
        else if (remote.key_epoch > local_ks.key_epoch ||
            (remote.key_epoch == local_ks.key_epoch && remote.salt != local_ks.salt)) {
            pending_key_store_ = remote;
            stats.key_rotation_required = true;
            audit_log_level(LogLevel::WARN,
                "Account key changed on another device",
                "sync_pull",
                "rotation_required");
        }
    }

    for (const auto& n : resp.notes) {
        st = merge_remote<LocalNote>(n, session, true, batch, stats);
        if (!ok(st)) return st;
    }
    for (const auto& f : resp.folders) {
        st = merge_remote<LocalFolder>(f, session, true, batch, stats);
        if (!ok(st)) return st;
    }
    stats.pulled = resp.notes.size() + resp.folders.size();

    sync.last_sync_version = resp.current_sync_version;
    batch.sync_state = sync;
    stats.server_version = resp.current_sync_version;

    return store_.apply(batch);
}

ZkStatus SyncEngine::push_dirty(SessionContext& session, SyncStats& stats) {
    SyncState sync = store_.sync_state();
    KeyStore ks;
    if (!store_.get_key_store(ks)) return ZkStatus::NOT_FOUND;

    PushRequest req;
    req.device_id = device_id_;
    req.key_epoch = ks.key_epoch;
    req.base_seq = sync.last_sync_version;
    for (auto& ln : store_.dirty_notes()) req.notes.push_back(std::move(ln.note));
    for (auto& lf : store_.dirty_folders()) req.folders.push_back(std::move(lf.folder));
    if (sync.key_store_dirty) req.key_store = ks;

    if (req.notes.empty() && req.folders.empty() && !req.key_store) return ZkStatus::OK;

    PushResult result;
    ZkStatus st = adapter_.push_changes(req, result);
    if (!ok(st)) {
        audit_log_level(LogLevel::WARN,
            std::string("Push failed, changes kept for retry: ") + status_str(st),
            "sync_push",
            "failure");
        return st;
    }

    StoreBatch batch;
    for (const auto& n : result.notes.created) accept_pushed<LocalNote>(n, batch);
    for (const auto& n : result.notes.updated) accept_pushed<LocalNote>(n, batch);
    for (const auto& f : result.folders.created) accept_pushed<LocalFolder>(f, batch);
    for (const auto& f : result.folders.updated) accept_pushed<LocalFolder>(f, batch);

    SyncStats scratch;
    for (const auto& n : result.notes.conflicts) {
        st = merge_remote<LocalNote>(n, &session, false, batch, scratch);
        if (!ok(st)) return st;
    }
    for (const auto& f : result.folders.conflicts) {
        st = merge_remote<LocalFolder>(f, &session, false, batch, scratch);
        if (!ok(st)) return st;
    }

    stats.created = result.notes.created.size() + result.folders.created.size();
    stats.updated = result.notes.updated.size() + result.folders.updated.size();
    stats.conflicts_lost = result.notes.conflicts.size() + result.folders.conflicts.size();
    stats.conflicts = stats.conflicts_lost +
        result.notes.conflicts_won.size() + result.folders.conflicts_won.size();
    stats.pushed = true;

    if (result.key_store_accepted) sync.key_store_dirty = false;
    if (result.caught_up) sync.last_sync_version = result.current_sync_version;
    stats.server_version = sync.last_sync_version;
    batch.sync_state = sync;

    st = store_.apply(batch);
    if (!ok(st)) return st;

    if (result.key_store_accepted) session.drop_previous_kek();
    if (stats.conflicts > 0) {
        audit_log_level(LogLevel::WARN,
            std::to_string(stats.conflicts) + " sync conflicts resolved, " +
            std::to_string(stats.conflicts_lost) + " local writes dropped",
            "sync_push",
            "conflict");
    }
    return ZkStatus::OK;
}

ZkStatus SyncEngine::sync(SessionContext& session, SyncStats& out) {
    if (in_progress_.exchange(true)) {
        audit_log_level(LogLevel::WARN,
            "Sync refused: a cycle is already running",
            "sync",
            "failure");
        return ZkStatus::SYNC_IN_PROGRESS;
    }
    InProgressGuard guard{ in_progress_ };

    ZkStatus st = session.require_open();
    if (!ok(st)) return st;

    SyncStats stats;
    st = pull_and_merge(&session, stats);
    if (!ok(st)) return st;

    if (pending_key_store_) {
        stats.key_rotation_required = true;
    }
    else {
        st = push_dirty(session, stats);
        if (!ok(st)) return st;
    }

    SyncState sync = store_.sync_state();
    sync.last_sync_at = clock_();
    StoreBatch batch;
    batch.sync_state = sync;
    st = store_.apply(batch);
    if (!ok(st)) return st;

    last_stats_ = stats;
    out = stats;
    audit_log_level(LogLevel::INFO,
        "Sync via " + std::string(adapter_.name()) + ": pulled " + std::to_string(stats.pulled) +
        ", pushed " + std::to_string(stats.created + stats.updated) +
        ", conflicts " + std::to_string(stats.conflicts),
        "sync",
        stats.key_rotation_required ? "rotation_required" : "success");
    return ZkStatus::OK;
}

ZkStatus SyncEngine::bootstrap() {
    if (in_progress_.exchange(true)) return ZkStatus::SYNC_IN_PROGRESS;
    InProgressGuard guard{ in_progress_ };

    KeyStore ks;
    if (store_.get_key_store(ks)) return ZkStatus::VALIDATION_FAILURE;

    SyncStats stats;
    ZkStatus st = pull_and_merge(nullptr, stats);
    if (!ok(st)) return st;
    if (!store_.get_key_store(ks)) {
        audit_log_level(LogLevel::WARN,
            "Remote has no account yet",
            "sync_bootstrap",
            "failure");
        return ZkStatus::NOT_FOUND;
    }
    last_stats_ = stats;
    audit_log_level(LogLevel::INFO,
        "Device bootstrapped with " + std::to_string(stats.pulled) + " entities",
        "sync_bootstrap",
        "success");
    return ZkStatus::OK;
}
