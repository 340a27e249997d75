#pragma once
#include "local_store.hpp"
#include "protection.hpp"
#include "recovery.hpp"
#include "session.hpp"

// Account lifecycle on one device: key store creation, password checks,
// and every operation that replaces the account KEK.
class Account {
public:
    Account(LocalStore& store, std::string device_id, Clock clock = system_now_ms);

    bool registered() const;

    // Creates the key store and opens the session. The recovery words are
    // returned once and never stored.
    ZkStatus register_account(
        const std::string& user_id,
        const SecureBuffer& password,
        SessionContext& session,
        RecoveryKey& recovery_out
    );

    ZkStatus login(const SecureBuffer& password, SessionContext& session);
    void logout(SessionContext& session);

    // New salt, new KEK, every account-wrapped DEK rewrapped in one batch.
    // Content ciphertext is left as it is.
    ZkStatus change_password(
        SessionContext& session,
        const SecureBuffer& old_password,
        const SecureBuffer& new_password
    );

    // Phrase is validated (count, wordlist, hash) before any derivation;
    // the escrowed KEK then stands in for the forgotten password.
    ZkStatus recover(
        const std::vector<std::string>& words,
        const SecureBuffer& new_password,
        SessionContext& session
    );

    // Another device rotated the account key: take its key store and
    // move whatever is still under the old KEK.
    ZkStatus adopt_remote_key_store(
        const KeyStore& remote,
        const SecureBuffer& password,
        SessionContext& session
    );

private:
    ZkStatus rekey(
        const KeyStore& current,
        const Kek& old_kek,
        const SecureBuffer& new_password,
        Kek& new_kek_out
    );

    LocalStore& store_;
    std::string device_id_;
    Clock clock_;
};

// -------- Key store helpers --------
ZkStatus make_kek_verifier(const Kek& kek, EncryptedBlob& out);

// AUTHENTICATION_FAILURE if kek did not make the verifier
ZkStatus check_kek_verifier(const Kek& kek, const EncryptedBlob& verifier);

// password -> KEK, checked against the key store
ZkStatus unlock_key_store(const KeyStore& ks, const SecureBuffer& password, Kek& out);
