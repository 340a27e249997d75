#pragma once

// -------- Operation outcome codes --------
enum class ZkStatus {
    OK,
    AUTHENTICATION_FAILURE, // wrong key on unwrap/decrypt, wrong password
    INTEGRITY_FAILURE,      // tag mismatch under the right key
    VALIDATION_FAILURE,     // rejected before any crypto ran
    SESSION_EXPIRED,        // no key material in the session
    LOCKOUT_ACTIVE,
    PASSWORD_REQUIRED,      // entity is protected, secondary password needed
    NOT_FOUND,
    TRANSPORT_FAILURE,
    SYNC_IN_PROGRESS,
    KEY_EPOCH_MISMATCH,
    STORAGE_FAILURE,
    INTERNAL_ERROR
};

const char* status_str(ZkStatus st);

// Text safe to show a user. Every unlock failure reads the same.
const char* user_message(ZkStatus st);

inline bool ok(ZkStatus st) { return st == ZkStatus::OK; }
