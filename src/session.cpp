#include "session.hpp"
#include "logging.hpp"

void SessionContext::open(const std::string& user_id, Kek kek, uint64_t key_epoch) {
    wipe();
    user_id_ = user_id;
    key_epoch_ = key_epoch;
    kek_ = std::make_unique<Kek>(std::move(kek));
}

ZkStatus SessionContext::require_open() const {
    if (!kek_) {
        audit_log_level(LogLevel::WARN,
            "Operation attempted without session key",
            "session",
            "failure");
        return ZkStatus::SESSION_EXPIRED;
    }
    return ZkStatus::OK;
}

void SessionContext::rotate(Kek new_kek, uint64_t new_epoch) {
    previous_kek_ = std::move(kek_);
    kek_ = std::make_unique<Kek>(std::move(new_kek));
    key_epoch_ = new_epoch;
}

void SessionContext::drop_previous_kek() {
    if (previous_kek_) previous_kek_->wipe();
    previous_kek_.reset();
}

void SessionContext::wipe() {
    if (kek_) kek_->wipe();
    kek_.reset();
    drop_previous_kek();
    user_id_.clear();
    key_epoch_ = 0;
}
