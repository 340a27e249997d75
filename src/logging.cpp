#include "logging.hpp"
#include "util.hpp"

#include <pwd.h>
#include <mutex>

LogContext g_log_ctx;

static std::string g_audit_log_path;
static std::mutex g_log_mutex;


// ---------------- Get username ----------------
static std::string get_system_username() {
    uid_t uid = geteuid();
    struct passwd* pw = getpwuid(uid);
    if (pw && pw->pw_name) {
        return std::string(pw->pw_name);
    }
    const char* envUser = std::getenv("USER");
    if (envUser && *envUser) {
        return std::string(envUser);
    }
    return "unknown";
}


// ---------------- Global logging context init ----------------
void init_log_context(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_ctx.userId = get_system_username();
    g_log_ctx.deviceId = device_id.empty() ? "unknown" : device_id;
    g_log_ctx.sessionId = generate_session_id();
}

void set_log_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_ctx.userId = user_id;
}

void set_log_device(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_ctx.deviceId = device_id;
}

void set_audit_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_audit_log_path = path;
}

// caller holds g_log_mutex
static std::string current_log_path() {
    return g_audit_log_path.empty() ? std::string(AUDIT_LOG) : g_audit_log_path;
}

std::string audit_log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return current_log_path();
}


// ---------------- Logging (levels) ----------------
static const char* log_level_str(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::ALERT: return "ALERT";
    default:              return "UNKNOWN";
    }
}

void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event,
    const std::string& outcome
)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);

    const std::string path = current_log_path();

    FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
        std::fprintf(stderr, "[audit-fail] %s: %s\n",
            log_level_str(lvl),
            entry.c_str());
        return;
    }

    fchmod(fileno(f), S_IRUSR | S_IWUSR);

    // timestamp
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);

    char tbuf[64];
    if (std::strftime(tbuf, sizeof(tbuf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
        std::strncpy(tbuf, "0000-00-00 00:00:00", sizeof(tbuf));
        tbuf[sizeof(tbuf) - 1] = '\0';
    }

    // sanitize message fields to avoid newlines in log entries
    auto sanitize = [](const std::string& s) {
        std::string r = s;
        for (char& c : r) {
            if (c == '\n' || c == '\r') c = ' ';
        }
        return r;
        };

    std::string s_entry = sanitize(entry);
    std::string s_event = sanitize(event);
    std::string s_outcome = sanitize(outcome);

    // timestamp | level | user | device | session | event | outcome | message
    std::fprintf(
        f,
        "%s | %s | user=%s | device=%s | session=%s | event=%s | outcome=%s | %s\n",
        tbuf,
        log_level_str(lvl),
        g_log_ctx.userId.c_str(),
        g_log_ctx.deviceId.c_str(),
        g_log_ctx.sessionId.c_str(),
        s_event.c_str(),
        s_outcome.c_str(),
        s_entry.c_str()
    );

    std::fflush(f);
    fsync(fileno(f));
    std::fclose(f);
}
