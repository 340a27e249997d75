#include "lockout.hpp"
#include "logging.hpp"

bool lockout_is_locked(const LockoutState& s, int64_t now_ms) {
    return s.locked_until != 0 && now_ms < s.locked_until;
}

int64_t lockout_remaining_ms(const LockoutState& s, int64_t now_ms) {
    return lockout_is_locked(s, now_ms) ? s.locked_until - now_ms : 0;
}

int lockout_attempts_left(const LockoutState& s, int64_t now_ms) {
    if (lockout_is_locked(s, now_ms)) return 0;
    if (s.locked_until != 0) return MAX_PASSWORD_ATTEMPTS;  // expired
    return std::max(0, MAX_PASSWORD_ATTEMPTS - s.attempts);
}

ZkStatus lockout_check(LockoutState& s, int64_t now_ms) {
    if (lockout_is_locked(s, now_ms)) {
        return ZkStatus::LOCKOUT_ACTIVE;
    }
    if (s.locked_until != 0) {
        s.locked_until = 0;
        s.attempts = 0;
    }
    return ZkStatus::OK;
}

bool lockout_record_failure(LockoutState& s, int64_t now_ms) {
    if (lockout_is_locked(s, now_ms)) return false;
    if (s.locked_until != 0) {
        s.locked_until = 0;
        s.attempts = 0;
    }
    s.attempts++;
    if (s.attempts >= MAX_PASSWORD_ATTEMPTS) {
        s.attempts = 0;
        s.locked_until = now_ms + LOCKOUT_DURATION_MS;
        audit_log_level(LogLevel::ALERT,
            "Too many failed password attempts, entity locked",
            "lockout",
            "locked");
        return true;
    }
    return false;
}

void lockout_record_success(LockoutState& s) {
    s.attempts = 0;
    s.locked_until = 0;
}
