#pragma once
#include "secure_key.hpp"
#include "status.hpp"

#include <memory>

// Key material for one logged-in account. Passed explicitly to every
// operation that needs the account KEK; nothing here is ever persisted.
class SessionContext {
public:
    SessionContext() = default;

    SessionContext(const SessionContext&) = delete;
    SessionContext& operator=(const SessionContext&) = delete;
    SessionContext(SessionContext&&) noexcept = default;
    SessionContext& operator=(SessionContext&&) noexcept = default;

    ~SessionContext() { wipe(); }

    void open(const std::string& user_id, Kek kek, uint64_t key_epoch);

    // SESSION_EXPIRED when no account KEK is held
    ZkStatus require_open() const;
    bool is_open() const { return kek_ != nullptr; }

    const Kek& kek() const { return *kek_; }
    const std::string& user_id() const { return user_id_; }
    uint64_t key_epoch() const { return key_epoch_; }

    // Password change: keep the old KEK until the new key store is
    // accepted remotely, so entities pulled meanwhile can be rewrapped.
    void rotate(Kek new_kek, uint64_t new_epoch);
    const Kek* previous_kek() const { return previous_kek_.get(); }
    void drop_previous_kek();

    void wipe();

private:
    std::string user_id_;
    uint64_t key_epoch_ = 0;
    std::unique_ptr<Kek> kek_;
    std::unique_ptr<Kek> previous_kek_;
};
