#include "sync_adapter.hpp"
#include "file_sync_adapter.hpp"
#include "server_sync_adapter.hpp"

std::unique_ptr<SyncAdapter> make_sync_adapter(const SyncConfig& cfg) {
    switch (cfg.target) {
    case SyncTarget::SERVER:
        return std::make_unique<ServerSyncAdapter>(cfg.remote_url, cfg.credentials);
    case SyncTarget::FILE:
        return std::make_unique<FileSyncAdapter>(cfg.remote_url);
    case SyncTarget::NONE:
        break;
    }
    return nullptr;
}
