#include <catch2/catch.hpp>

#include "scheduler.hpp"

static constexpr int64_t T0 = 1700000000000;
static constexpr int64_t MINUTE = 60 * 1000;

TEST_CASE("Interval sync", "[scheduler]") {
    SyncScheduler s(5, 3000);
    CHECK_FALSE(s.due(T0));

    s.start(T0);
    CHECK(s.next_interval_at() == T0 + 5 * MINUTE);
    CHECK_FALSE(s.due(T0 + 5 * MINUTE - 1));
    CHECK(s.due(T0 + 5 * MINUTE));

    s.on_sync_done(T0 + 5 * MINUTE);
    CHECK_FALSE(s.due(T0 + 6 * MINUTE));
    CHECK(s.due(T0 + 10 * MINUTE));
}

TEST_CASE("Edits are debounced", "[scheduler]") {
    SyncScheduler s(60, 3000);
    s.start(T0);

    s.mark_dirty(T0 + 1000);
    CHECK(s.flush_pending());
    CHECK(s.dirty_since() == T0 + 1000);
    CHECK_FALSE(s.due(T0 + 3999));

    // a later edit pushes the flush back but keeps the first dirty time
    s.mark_dirty(T0 + 3000);
    CHECK(s.dirty_since() == T0 + 1000);
    CHECK_FALSE(s.due(T0 + 4000));
    CHECK(s.due(T0 + 6000));

    s.on_sync_done(T0 + 6000);
    CHECK_FALSE(s.flush_pending());
    CHECK(s.dirty_since() == 0);
    CHECK_FALSE(s.due(T0 + 7000));

    SECTION("cancel drops a pending flush") {
        s.mark_dirty(T0 + 8000);
        s.cancel();
        CHECK_FALSE(s.flush_pending());
        CHECK_FALSE(s.due(T0 + 20000));
    }
}

TEST_CASE("A request is due at once", "[scheduler]") {
    SyncScheduler s(60, 3000);
    s.start(T0);
    s.request_now();
    CHECK(s.due(T0));
    s.on_sync_done(T0);
    CHECK_FALSE(s.due(T0 + 1));
}
