#pragma once

#include <sodium.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <fcntl.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <iostream>
#include <sstream>
#include <ctime>
#include <cerrno>
#include <cctype>
#include <limits>
#include <algorithm>
#include <chrono>

// -------- Configuration constants --------
inline constexpr const char* CONFIG_FILENAME = "zknotes.conf";
inline constexpr const char* STORE_FILENAME = "notes.json";
inline constexpr const char* AUDIT_LOG = "audit.log";
inline constexpr const char* SYNC_STATE_FILENAME = "sync-state.json";
inline constexpr const char* SYNC_LOCK_FILENAME = "sync.lock";

// -------- Key material sizes --------
inline constexpr size_t KEY_LEN = 32;  // every symmetric key is 256-bit
inline constexpr size_t SALT_LEN = 32;
inline constexpr size_t NONCE_LEN = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
inline constexpr size_t TAG_LEN = crypto_aead_xchacha20poly1305_ietf_ABYTES;
inline constexpr size_t KEY_ID_LEN = 8;
inline constexpr size_t WRAPPED_KEY_LEN = NONCE_LEN + KEY_LEN + TAG_LEN;

// PBKDF2-HMAC-SHA256 work factor, never lowered
inline constexpr uint32_t PBKDF2_ITERATIONS = 600000;

// -------- Domain labels (HKDF info strings) --------
inline constexpr const char* ACCOUNT_KEK_LABEL = "zknotes-account-kek";
inline constexpr const char* NOTE_PASSWORD_KEK_LABEL = "zknotes-note-password-kek";
inline constexpr const char* SALT_SEAL_LABEL = "zknotes-protection-salt";
inline constexpr const char* VERIFIER_LABEL = "zknotes-kek-verifier";
inline constexpr const char* RECOVERY_SALT = "zknotes-recovery-salt-v1";

// -------- Limits --------
inline constexpr size_t MAX_PASS_LEN = 1024;
inline constexpr size_t MAX_TITLE_LEN = 1024;
inline constexpr size_t MAX_CONTENT_LEN = 8 * 1024 * 1024;
inline constexpr size_t MAX_TAG_LEN = 64;
inline constexpr size_t MAX_TAGS = 32;
inline constexpr size_t MAX_PROFILE_NAME_LEN = 64;
inline constexpr size_t MAX_STORE_SIZE = 256 * 1024 * 1024;
inline constexpr int MAX_FOLDER_DEPTH = 10;
inline constexpr size_t MAX_NOTE_VERSIONS = 50;
inline constexpr size_t RECOVERY_WORD_COUNT = 24;

// -------- Lockout --------
inline constexpr int MAX_PASSWORD_ATTEMPTS = 5;
inline constexpr int64_t LOCKOUT_DURATION_MS = 5 * 60 * 1000;

using byte = unsigned char;
using Bytes = std::vector<byte>;

// milliseconds since the epoch; injected so tests can drive time
using Clock = std::function<int64_t()>;

inline int64_t system_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}
