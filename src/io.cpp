#include "io.hpp"
#include "util.hpp"

#include <pwd.h>
#include <sys/file.h>

// -------- Global data paths --------
std::string g_data_root;
std::string g_data_dir;
std::string g_config_path;
std::string g_store_path;

// ---------- Path helpers ----------
static std::string get_user_home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        struct passwd* pw = getpwuid(geteuid());
        if (pw && pw->pw_dir) {
            home = pw->pw_dir;
        }
    }
    if (!home || !*home) return ".";
    return std::string(home);
}

bool ensure_dir_exists(const std::string& path, mode_t mode) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            std::cerr << path << " exists but is not a directory\n";
            return false;
        }
        if ((st.st_mode & 0777) != mode) {
            chmod(path.c_str(), mode);
        }
        return true;
    }
    if (mkdir(path.c_str(), mode) != 0) {
        if (errno != EEXIST) {
            std::cerr << "Failed to create directory " << path << ": " << strerror(errno) << "\n";
            return false;
        }
    }
    return true;
}

// -------- Ownership and permission checks ----------
bool check_dir_ownership_and_perms(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        std::cerr << "Internal error: data directory check failed.\n";
        return false;
    }
    if (st.st_uid != geteuid()) {
        audit_log_level(LogLevel::ERROR,
            "Directory ownership violation: " + path,
            "io_module",
            "failure");
        std::cerr << "Internal error: data directory access check failed.\n";
        return false;
    }
    // No group/other access allowed
    if ((st.st_mode & 0077) != 0) {
        audit_log_level(LogLevel::ERROR,
            "Insecure directory permissions on: " + path,
            "io_module",
            "failure");
        std::cerr << "Internal error: data directory access check failed.\n";
        return false;
    }
    return true;
}

bool check_file_ownership_and_perms(const std::string& path, bool allow_missing) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT && allow_missing) return true;
        std::cerr << "Internal error: data file check failed.\n";
        return false;
    }
    if (st.st_uid != geteuid()) {
        audit_log_level(LogLevel::ERROR,
            "File ownership violation: " + path,
            "io_module",
            "failure");
        std::cerr << "Internal error: data file access check failed.\n";
        return false;
    }
    if ((st.st_mode & 0077) != 0) {
        audit_log_level(LogLevel::ERROR,
            "Insecure file permissions on: " + path,
            "io_module",
            "failure");
        std::cerr << "Internal error: data file access check failed.\n";
        return false;
    }
    return true;
}


// ---------- Profile initialization ----------
bool init_data_paths(const std::string& profile, const std::string& root_override) {
    if (!valid_profile_name(profile)) {
        audit_log_level(LogLevel::WARN,
            "Invalid profile name",
            "io_module",
            "failure");
        return false;
    }

    g_data_root = root_override.empty() ? get_user_home_dir() + "/.zknotes" : root_override;
    if (!ensure_dir_exists(g_data_root, S_IRWXU)) {
        return false;
    }

    g_data_dir = g_data_root + "/" + profile;
    if (!ensure_dir_exists(g_data_dir, S_IRWXU)) {
        return false;
    }

    g_config_path = g_data_dir + "/" + CONFIG_FILENAME;
    g_store_path = g_data_dir + "/" + STORE_FILENAME;
    std::string log_path = g_data_dir + "/" + AUDIT_LOG;

    if (!check_dir_ownership_and_perms(g_data_dir)) {
        return false;
    }
    if (!check_file_ownership_and_perms(g_config_path, true)) return false;
    if (!check_file_ownership_and_perms(g_store_path, true)) return false;
    if (!check_file_ownership_and_perms(log_path, true)) return false;

    set_audit_log_path(log_path);
    return true;
}


// -------- Atomic file write helper --------
bool atomic_write_file(const std::string& path, const byte* buf, size_t len) {
    if (!buf && len > 0) return false;
    if (len > MAX_STORE_SIZE) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: attempt to write huge file",
            "io_module",
            "failure");
        return false;
    }

    std::string tmpl = path + ".tmpXXXXXX";
    std::vector<char> temp(tmpl.begin(), tmpl.end());
    temp.push_back('\0');

    int fd = mkostemp(temp.data(), O_CLOEXEC);
    if (fd < 0) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: mkostemp failed",
            "io_module",
            "failure");
        return false;
    }
    if (fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        close(fd);
        unlink(temp.data());
        return false;
    }

    size_t off = 0;
    while (off < len) {
        ssize_t w = write(fd, buf + off, len - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            close(fd);
            unlink(temp.data());
            audit_log_level(LogLevel::ERROR,
                "atomic_write_file: write failed",
                "io_module",
                "failure");
            return false;
        }
        off += static_cast<size_t>(w);
    }

    if (fsync(fd) != 0 || close(fd) != 0) {
        unlink(temp.data());
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: fsync/close failed",
            "io_module",
            "failure");
        return false;
    }
    if (rename(temp.data(), path.c_str()) != 0) {
        unlink(temp.data());
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: rename failed",
            "io_module",
            "failure");
        return false;
    }
    return true;
}

bool atomic_write_text(const std::string& path, const std::string& text) {
    return atomic_write_file(path, reinterpret_cast<const byte*>(text.data()), text.size());
}


// -------- Whole-file read --------
bool read_file(const std::string& path, std::string& out, bool& missing) {
    out.clear();
    missing = false;

    FILE* f = fopen(path.c_str(), "rb");
    if (!f) {
        if (errno == ENOENT) {
            missing = true;
            return true;
        }
        audit_log_level(LogLevel::ERROR,
            "read_file: fopen failed",
            "io_module",
            "failure");
        return false;
    }

    if (fseek(f, 0, SEEK_END) != 0) {
        fclose(f);
        return false;
    }
    long sz = ftell(f);
    if (sz < 0 || (unsigned long)sz > MAX_STORE_SIZE) {
        fclose(f);
        audit_log_level(LogLevel::WARN,
            "read_file: file too large or unreadable",
            "io_module",
            "failure");
        return false;
    }
    if (fseek(f, 0, SEEK_SET) != 0) {
        fclose(f);
        return false;
    }

    out.resize(static_cast<size_t>(sz));
    if (sz > 0) {
        size_t r = fread(&out[0], 1, out.size(), f);
        if (r != out.size()) {
            fclose(f);
            out.clear();
            audit_log_level(LogLevel::ERROR,
                "read_file: fread failed",
                "io_module",
                "failure");
            return false;
        }
    }
    fclose(f);
    return true;
}


// -------- Advisory lock --------
FileLock::FileLock(const std::string& path) {
    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        audit_log_level(LogLevel::ERROR,
            "FileLock: open failed",
            "io_module",
            "failure");
        return;
    }
    if (flock(fd, LOCK_EX) != 0) {
        audit_log_level(LogLevel::ERROR,
            "FileLock: flock failed",
            "io_module",
            "failure");
        close(fd);
        return;
    }
    fd_ = fd;
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
    }
}
