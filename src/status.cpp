#include "status.hpp"

const char* status_str(ZkStatus st) {
    switch (st) {
    case ZkStatus::OK:                     return "OK";
    case ZkStatus::AUTHENTICATION_FAILURE: return "AUTHENTICATION_FAILURE";
    case ZkStatus::INTEGRITY_FAILURE:      return "INTEGRITY_FAILURE";
    case ZkStatus::VALIDATION_FAILURE:     return "VALIDATION_FAILURE";
    case ZkStatus::SESSION_EXPIRED:        return "SESSION_EXPIRED";
    case ZkStatus::LOCKOUT_ACTIVE:         return "LOCKOUT_ACTIVE";
    case ZkStatus::PASSWORD_REQUIRED:      return "PASSWORD_REQUIRED";
    case ZkStatus::NOT_FOUND:              return "NOT_FOUND";
    case ZkStatus::TRANSPORT_FAILURE:      return "TRANSPORT_FAILURE";
    case ZkStatus::SYNC_IN_PROGRESS:       return "SYNC_IN_PROGRESS";
    case ZkStatus::KEY_EPOCH_MISMATCH:     return "KEY_EPOCH_MISMATCH";
    case ZkStatus::STORAGE_FAILURE:        return "STORAGE_FAILURE";
    case ZkStatus::INTERNAL_ERROR:         return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

const char* user_message(ZkStatus st) {
    switch (st) {
    case ZkStatus::OK:
        return "Done.";
    case ZkStatus::AUTHENTICATION_FAILURE:
    case ZkStatus::INTEGRITY_FAILURE:
        return "Incorrect password.";
    case ZkStatus::VALIDATION_FAILURE:
        return "Invalid input.";
    case ZkStatus::SESSION_EXPIRED:
        return "Session expired. Log in again.";
    case ZkStatus::LOCKOUT_ACTIVE:
        return "Too many failed attempts. Try again later.";
    case ZkStatus::PASSWORD_REQUIRED:
        return "This item is password protected.";
    case ZkStatus::NOT_FOUND:
        return "Not found.";
    case ZkStatus::TRANSPORT_FAILURE:
        return "Sync target unreachable. Changes will be retried.";
    case ZkStatus::SYNC_IN_PROGRESS:
        return "A sync is already running.";
    case ZkStatus::KEY_EPOCH_MISMATCH:
        return "Account password changed on another device. Log in again.";
    case ZkStatus::STORAGE_FAILURE:
    case ZkStatus::INTERNAL_ERROR:
        return "An unexpected error occurred. Check audit log.";
    }
    return "An unexpected error occurred. Check audit log.";
}
