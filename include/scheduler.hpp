#pragma once
#include "zknotes_common.hpp"

// Decides when the next sync cycle runs. Polled from the main loop;
// never runs anything itself.
//   interval:  every interval_minutes after the last cycle
//   debounce:  dirty since T, flush at T' + quiet period where T' is the
//              latest edit
//   request:   wake-up hint, due immediately
class SyncScheduler {
public:
    SyncScheduler(int interval_minutes, int64_t quiet_period_ms);

    void start(int64_t now_ms);

    void mark_dirty(int64_t now_ms);
    void cancel();                  // drops a pending debounced flush
    void request_now();

    bool due(int64_t now_ms) const;
    void on_sync_done(int64_t now_ms);

    bool flush_pending() const { return flush_at_ != 0; }
    int64_t dirty_since() const { return dirty_since_; }
    int64_t next_interval_at() const { return next_interval_at_; }

private:
    int64_t interval_ms_;
    int64_t quiet_period_ms_;
    int64_t next_interval_at_ = 0;
    int64_t dirty_since_ = 0;
    int64_t flush_at_ = 0;
    bool requested_ = false;
};
