#pragma once
#include "sync_adapter.hpp"

#include <curl/curl.h>

// HTTP transport (libcurl):
//   GET  {base}/api/sync/changes?since=N
//   POST {base}/api/sync/push
//   POST {base}/api/sync/heartbeat
// Authorization: Bearer <credentials>
class ServerSyncAdapter : public SyncAdapter {
public:
    ServerSyncAdapter(std::string base_url, std::string credentials);
    ~ServerSyncAdapter() override;

    ServerSyncAdapter(const ServerSyncAdapter&) = delete;
    ServerSyncAdapter& operator=(const ServerSyncAdapter&) = delete;

    ZkStatus test_connection() override;
    ZkStatus pull_changes(uint64_t since, PullResponse& out) override;
    ZkStatus push_changes(const PushRequest& req, PushResult& out) override;
    const char* name() const override { return "server"; }

private:
    // non-2xx or any curl error -> TRANSPORT_FAILURE; 409 -> KEY_EPOCH_MISMATCH
    ZkStatus request(const std::string& path, const std::string* body, std::string& response);

    std::string base_url_;
    std::string credentials_;
    CURL* curl_ = nullptr;
};
