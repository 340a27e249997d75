#include <catch2/catch.hpp>

#include "lockout.hpp"
#include "test_support.hpp"

TEST_CASE("Lockout state machine", "[lockout]") {
    const int64_t t0 = TEST_START_MS;
    LockoutState s;

    SECTION("four failures leave one attempt") {
        for (int i = 0; i < MAX_PASSWORD_ATTEMPTS - 1; ++i) {
            CHECK_FALSE(lockout_record_failure(s, t0));
        }
        CHECK(s.attempts == 4);
        CHECK_FALSE(lockout_is_locked(s, t0));
        CHECK(lockout_attempts_left(s, t0) == 1);
        CHECK(lockout_check(s, t0) == ZkStatus::OK);
    }

    SECTION("the fifth failure locks for five minutes") {
        for (int i = 0; i < MAX_PASSWORD_ATTEMPTS - 1; ++i) lockout_record_failure(s, t0);
        CHECK(lockout_record_failure(s, t0 + 10));
        CHECK(s.attempts == 0);
        CHECK(s.locked_until == t0 + 10 + LOCKOUT_DURATION_MS);

        CHECK(lockout_is_locked(s, t0 + 10));
        CHECK(lockout_check(s, t0 + 10) == ZkStatus::LOCKOUT_ACTIVE);
        CHECK(lockout_remaining_ms(s, t0 + 10 + 60000) == LOCKOUT_DURATION_MS - 60000);
        CHECK(lockout_attempts_left(s, t0 + 20) == 0);

        // failures while locked do not extend the lock
        CHECK_FALSE(lockout_record_failure(s, t0 + 20));
        CHECK(s.locked_until == t0 + 10 + LOCKOUT_DURATION_MS);

        const int64_t later = t0 + 10 + LOCKOUT_DURATION_MS;
        CHECK_FALSE(lockout_is_locked(s, later));
        CHECK(lockout_attempts_left(s, later) == MAX_PASSWORD_ATTEMPTS);
        CHECK(lockout_check(s, later) == ZkStatus::OK);
        CHECK(s.locked_until == 0);
        CHECK(s.attempts == 0);
    }

    SECTION("success resets the counter") {
        lockout_record_failure(s, t0);
        lockout_record_failure(s, t0);
        lockout_record_success(s);
        CHECK(s.attempts == 0);
        CHECK(lockout_attempts_left(s, t0) == MAX_PASSWORD_ATTEMPTS);
    }

    SECTION("a failure after an expired lock starts a new count") {
        s.locked_until = t0 - 1;
        CHECK_FALSE(lockout_record_failure(s, t0));
        CHECK(s.attempts == 1);
        CHECK(s.locked_until == 0);
    }
}

TEST_CASE("Protected note locks after five wrong passwords", "[lockout][protection]") {
    ManualClock clock;
    TestDevice dev(clock);
    REQUIRE(dev.register_as("alice", "account pw") == ZkStatus::OK);
    std::string id = dev.note("Diary", "dear diary");
    REQUIRE(dev.notebook.set_note_password(dev.session, id, secret("note pw")) == ZkStatus::OK);

    NotePlain out;
    for (int i = 1; i < MAX_PASSWORD_ATTEMPTS; ++i) {
        CHECK(dev.notebook.unlock_note(dev.session, id, secret("guess"), out) ==
            ZkStatus::AUTHENTICATION_FAILURE);
        CHECK(dev.notebook.lockout_of(id).attempts == i);
    }
    CHECK(dev.notebook.unlock_note(dev.session, id, secret("guess"), out) ==
        ZkStatus::AUTHENTICATION_FAILURE);

    LockoutState locked = dev.notebook.lockout_of(id);
    CHECK(locked.attempts == 0);
    CHECK(locked.locked_until == clock.now + LOCKOUT_DURATION_MS);

    // even the right password is refused while locked
    clock.advance(LOCKOUT_DURATION_MS - 1000);
    CHECK(dev.notebook.unlock_note(dev.session, id, secret("note pw"), out) ==
        ZkStatus::LOCKOUT_ACTIVE);

    clock.advance(1000);
    REQUIRE(dev.notebook.unlock_note(dev.session, id, secret("note pw"), out) == ZkStatus::OK);
    CHECK(out.content == "dear diary");
    CHECK(dev.notebook.lockout_of(id).locked_until == 0);

    // the counter lives on this device only and never marks the note dirty
    LocalNote ln;
    REQUIRE(dev.store.get_note(id, ln));
    CHECK(ln.note.updated_at < clock.now);
}
