#include "file_sync_adapter.hpp"
#include "io.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

FileSyncAdapter::FileSyncAdapter(std::string dir)
    : dir_(std::move(dir)),
    state_path_(dir_ + "/" + SYNC_STATE_FILENAME),
    lock_path_(dir_ + "/" + SYNC_LOCK_FILENAME)
{
}

ZkStatus FileSyncAdapter::test_connection() {
    struct stat st;
    if (stat(dir_.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        audit_log_level(LogLevel::WARN,
            "Sync directory not reachable",
            "file_sync",
            "failure");
        return ZkStatus::TRANSPORT_FAILURE;
    }
    if (access(dir_.c_str(), R_OK | W_OK) != 0) return ZkStatus::TRANSPORT_FAILURE;
    return ZkStatus::OK;
}

ZkStatus FileSyncAdapter::load(RemoteState& out) const {
    std::string text;
    bool missing = false;
    if (!read_file(state_path_, text, missing)) return ZkStatus::TRANSPORT_FAILURE;
    if (missing) {
        out = RemoteState{};
        return ZkStatus::OK;
    }
    try {
        json::parse(text).get_to(out);
    }
    catch (const std::exception& e) {
        audit_log_level(LogLevel::ERROR,
            std::string("Sync state unreadable: ") + e.what(),
            "file_sync",
            "failure");
        return ZkStatus::TRANSPORT_FAILURE;
    }
    return ZkStatus::OK;
}

ZkStatus FileSyncAdapter::save(const RemoteState& state) const {
    json j = state;
    if (!atomic_write_text(state_path_, j.dump())) return ZkStatus::TRANSPORT_FAILURE;
    return ZkStatus::OK;
}

ZkStatus FileSyncAdapter::pull_changes(uint64_t since, PullResponse& out) {
    ZkStatus st = test_connection();
    if (!ok(st)) return st;

    FileLock lock(lock_path_);
    if (!lock.locked()) return ZkStatus::TRANSPORT_FAILURE;

    RemoteState state;
    st = load(state);
    if (!ok(st)) return st;
    out = state.pull(since);
    return ZkStatus::OK;
}

ZkStatus FileSyncAdapter::push_changes(const PushRequest& req, PushResult& out) {
    ZkStatus st = test_connection();
    if (!ok(st)) return st;

    FileLock lock(lock_path_);
    if (!lock.locked()) return ZkStatus::TRANSPORT_FAILURE;

    RemoteState state;
    st = load(state);
    if (!ok(st)) return st;

    PushResult result;
    st = state.push(req, result);
    if (!ok(st)) return st;

    st = save(state);
    if (!ok(st)) return st;
    out = std::move(result);
    return ZkStatus::OK;
}
