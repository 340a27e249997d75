#pragma once
#include "sync_adapter.hpp"

#include <atomic>
#include <mutex>

// In-process sync arbiter for many accounts. Every pull or push holds the
// account's mutex, so two devices never receive the same version number.
class SyncServer {
public:
    SyncServer() = default;
    SyncServer(const SyncServer&) = delete;
    SyncServer& operator=(const SyncServer&) = delete;

    ZkStatus pull(const std::string& account, uint64_t since, PullResponse& out);
    ZkStatus push(const std::string& account, const PushRequest& req, PushResult& out);
    ZkStatus heartbeat(const std::string& account);

    // Test hook: refuse every request until cleared
    void set_offline(bool offline) { offline_ = offline; }

    uint64_t sequence(const std::string& account);

private:
    struct Account {
        std::mutex mtx;
        RemoteState state;
    };

    Account& account(const std::string& name);

    std::mutex accounts_mtx_;
    std::map<std::string, std::unique_ptr<Account>> accounts_;
    std::atomic<bool> offline_{ false };
};

// Binds one device's engine to a SyncServer account
class LocalServerAdapter : public SyncAdapter {
public:
    LocalServerAdapter(SyncServer& server, std::string account);

    ZkStatus test_connection() override;
    ZkStatus pull_changes(uint64_t since, PullResponse& out) override;
    ZkStatus push_changes(const PushRequest& req, PushResult& out) override;
    const char* name() const override { return "local-server"; }

private:
    SyncServer& server_;
    std::string account_;
};
