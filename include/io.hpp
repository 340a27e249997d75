#pragma once
#include "zknotes_common.hpp"
#include "logging.hpp"

// -------- Per-profile data paths --------
extern std::string g_data_root;
extern std::string g_data_dir;
extern std::string g_config_path;
extern std::string g_store_path;

// ~/.zknotes/<profile> (or <root_override>/<profile>), created 0700
bool init_data_paths(const std::string& profile, const std::string& root_override = "");

// -------- Filesystem helpers --------
bool ensure_dir_exists(const std::string& path, mode_t mode);
bool check_dir_ownership_and_perms(const std::string& path);
bool check_file_ownership_and_perms(const std::string& path, bool allow_missing);

// temp file + fchmod 0600 + fsync + rename
bool atomic_write_file(const std::string& path, const byte* buf, size_t len);
bool atomic_write_text(const std::string& path, const std::string& text);

// Reads a whole file. A missing file is success with `missing` set.
bool read_file(const std::string& path, std::string& out, bool& missing);

// Exclusive advisory lock (flock) held for the object's lifetime
class FileLock {
public:
    explicit FileLock(const std::string& path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};
