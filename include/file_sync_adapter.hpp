#pragma once
#include "sync_adapter.hpp"

// Remote kept as a shared directory: <dir>/sync-state.json, every
// request serialized by an flock on <dir>/sync.lock. The arbiter is the
// same RemoteState the server runs.
class FileSyncAdapter : public SyncAdapter {
public:
    explicit FileSyncAdapter(std::string dir);

    ZkStatus test_connection() override;
    ZkStatus pull_changes(uint64_t since, PullResponse& out) override;
    ZkStatus push_changes(const PushRequest& req, PushResult& out) override;
    const char* name() const override { return "file"; }

private:
    ZkStatus load(RemoteState& out) const;
    ZkStatus save(const RemoteState& state) const;

    std::string dir_;
    std::string state_path_;
    std::string lock_path_;
};
