#pragma once
#include "local_store.hpp"
#include "session.hpp"
#include "sync_adapter.hpp"

#include <atomic>

struct SyncStats {
    size_t pulled = 0;
    size_t merged = 0;          // remote copies written locally
    size_t kept_local = 0;      // dirty local copies newer than the remote
    size_t rewrapped = 0;       // pulled entities moved off the previous KEK
    size_t created = 0;
    size_t updated = 0;
    size_t conflicts = 0;       // every server-side conflict, either outcome
    size_t conflicts_lost = 0;  // of which the server copy won
    uint64_t server_version = 0;
    bool pushed = false;
    bool key_rotation_required = false;
};

// One device's sync cycle: pull, merge, push. At most one cycle runs at a
// time; an overlapping call is refused, not queued. A cycle that does not
// complete leaves every dirty flag as it was.
class SyncEngine {
public:
    SyncEngine(LocalStore& store, SyncAdapter& adapter, std::string device_id, Clock clock = system_now_ms);

    ZkStatus sync(SessionContext& session, SyncStats& out);

    // New device: pull the key store and every entity before first login
    ZkStatus bootstrap();

    bool in_progress() const { return in_progress_.load(); }

    // Set when the remote key store is ahead; pushing stops until the
    // account adopts it
    bool key_rotation_required() const { return pending_key_store_.has_value(); }
    const std::optional<KeyStore>& pending_key_store() const { return pending_key_store_; }
    void clear_pending_key_store() { pending_key_store_.reset(); }

    const SyncStats& last_stats() const { return last_stats_; }

private:
    ZkStatus pull_and_merge(const SessionContext* session, SyncStats& stats);
    ZkStatus push_dirty(SessionContext& session, SyncStats& stats);

    template <typename L, typename T>
    ZkStatus merge_remote(
        const T& remote,
        const SessionContext* session,
        bool respect_dirty,
        StoreBatch& batch,
        SyncStats& stats
    );

    template <typename L, typename T>
    void accept_pushed(const T& stored, StoreBatch& batch);

    LocalStore& store_;
    SyncAdapter& adapter_;
    std::string device_id_;
    Clock clock_;
    std::atomic<bool> in_progress_{ false };
    std::optional<KeyStore> pending_key_store_;
    SyncStats last_stats_;
};
