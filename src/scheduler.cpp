#include "scheduler.hpp"

SyncScheduler::SyncScheduler(int interval_minutes, int64_t quiet_period_ms)
    : interval_ms_(static_cast<int64_t>(interval_minutes) * 60 * 1000),
    quiet_period_ms_(quiet_period_ms)
{
}

void SyncScheduler::start(int64_t now_ms) {
    next_interval_at_ = now_ms + interval_ms_;
}

void SyncScheduler::mark_dirty(int64_t now_ms) {
    if (dirty_since_ == 0) dirty_since_ = now_ms;
    flush_at_ = now_ms + quiet_period_ms_;
}

void SyncScheduler::cancel() {
    dirty_since_ = 0;
    flush_at_ = 0;
}

void SyncScheduler::request_now() {
    requested_ = true;
}

bool SyncScheduler::due(int64_t now_ms) const {
    if (requested_) return true;
    if (flush_at_ != 0 && now_ms >= flush_at_) return true;
    return next_interval_at_ != 0 && now_ms >= next_interval_at_;
}

void SyncScheduler::on_sync_done(int64_t now_ms) {
    requested_ = false;
    dirty_since_ = 0;
    flush_at_ = 0;
    next_interval_at_ = now_ms + interval_ms_;
}
