#include "sync_server.hpp"
#include "logging.hpp"

SyncServer::Account& SyncServer::account(const std::string& name) {
    std::lock_guard<std::mutex> lock(accounts_mtx_);
    auto& slot = accounts_[name];
    if (!slot) slot = std::make_unique<Account>();
    return *slot;
}

ZkStatus SyncServer::pull(const std::string& account_name, uint64_t since, PullResponse& out) {
    if (offline_) return ZkStatus::TRANSPORT_FAILURE;
    Account& acc = account(account_name);
    std::lock_guard<std::mutex> lock(acc.mtx);
    out = acc.state.pull(since);
    return ZkStatus::OK;
}

ZkStatus SyncServer::push(const std::string& account_name, const PushRequest& req, PushResult& out) {
    if (offline_) return ZkStatus::TRANSPORT_FAILURE;
    Account& acc = account(account_name);
    std::lock_guard<std::mutex> lock(acc.mtx);
    return acc.state.push(req, out);
}

ZkStatus SyncServer::heartbeat(const std::string&) {
    return offline_ ? ZkStatus::TRANSPORT_FAILURE : ZkStatus::OK;
}

uint64_t SyncServer::sequence(const std::string& account_name) {
    Account& acc = account(account_name);
    std::lock_guard<std::mutex> lock(acc.mtx);
    return acc.state.sequence();
}


LocalServerAdapter::LocalServerAdapter(SyncServer& server, std::string account)
    : server_(server), account_(std::move(account))
{
}

ZkStatus LocalServerAdapter::test_connection() {
    return server_.heartbeat(account_);
}

ZkStatus LocalServerAdapter::pull_changes(uint64_t since, PullResponse& out) {
    return server_.pull(account_, since, out);
}

ZkStatus LocalServerAdapter::push_changes(const PushRequest& req, PushResult& out) {
    return server_.push(account_, req, out);
}
