#pragma once
#include "zknotes_common.hpp"
#include "status.hpp"

enum class SyncTarget { NONE, SERVER, FILE };

struct SyncConfig {
    SyncTarget target = SyncTarget::NONE;
    int interval_minutes = 5;
    std::string remote_url;     // base URL (server) or directory (file)
    std::string credentials;    // bearer token (server)
    std::string device_id;
    int quiet_period_seconds = 3;
};

const char* sync_target_str(SyncTarget t);
bool parse_sync_target(const std::string& s, SyncTarget& out);

bool valid_sync_interval(int minutes);   // 1, 2, 3, 5, 10, 30, 60

ZkStatus validate_config(const SyncConfig& cfg);

// key = value lines; '#' at line start or after whitespace starts a comment
ZkStatus parse_config(const std::string& text, SyncConfig& out);
std::string serialize_config(const SyncConfig& cfg);

// Creates the file with a fresh device id when missing
ZkStatus load_or_create_config(const std::string& path, SyncConfig& out);
ZkStatus save_config(const std::string& path, const SyncConfig& cfg);
