#pragma once
#include "config.hpp"
#include "sync_protocol.hpp"

#include <memory>

// Transport seen by the sync engine. Any failure to reach the remote is
// TRANSPORT_FAILURE; the engine then leaves every dirty flag alone.
class SyncAdapter {
public:
    virtual ~SyncAdapter() = default;

    virtual ZkStatus test_connection() = 0;
    virtual ZkStatus pull_changes(uint64_t since, PullResponse& out) = 0;
    virtual ZkStatus push_changes(const PushRequest& req, PushResult& out) = 0;

    virtual const char* name() const = 0;
};

// Adapter for the configured target; nullptr for SyncTarget::NONE
std::unique_ptr<SyncAdapter> make_sync_adapter(const SyncConfig& cfg);
