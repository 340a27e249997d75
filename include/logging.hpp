#pragma once
#include "zknotes_common.hpp"

// -------- Logging (levels) --------
enum class LogLevel { INFO, WARN, ERROR, ALERT }; // levels

struct LogContext {
    std::string userId;
    std::string deviceId;
    std::string sessionId;
};

extern LogContext g_log_ctx;

// Initialize global logging context (system user, fresh session id)
void init_log_context(const std::string& device_id = "");

void set_log_user(const std::string& user_id);
void set_log_device(const std::string& device_id);

// Redirect the audit log; empty path restores the default AUDIT_LOG
void set_audit_log_path(const std::string& path);
std::string audit_log_path();

// Log with level, message, optional event + outcome
// audit_log_level(LogLevel::INFO, "Note created", "note_create", "success");
void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event = "",
    const std::string& outcome = ""
);
