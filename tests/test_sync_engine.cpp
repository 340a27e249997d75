#include <catch2/catch.hpp>

#include "file_sync_adapter.hpp"
#include "server_sync_adapter.hpp"
#include "sync_engine.hpp"
#include "sync_server.hpp"
#include "test_support.hpp"

// One device talking to an in-process server
struct Peer {
    Peer(ManualClock& clock, SyncServer& server, const std::string& account = "alice")
        : dev(clock),
        adapter(server, account),
        engine(dev.store, adapter, dev.device_id, clock.fn())
    {
    }

    ZkStatus sync() { return engine.sync(dev.session, stats); }

    TestDevice dev;
    LocalServerAdapter adapter;
    SyncEngine engine;
    SyncStats stats;
};

// Forwards to another adapter and runs a hook right after each pull
class HookAdapter : public SyncAdapter {
public:
    explicit HookAdapter(SyncAdapter& inner) : inner_(inner) {}

    ZkStatus test_connection() override { return inner_.test_connection(); }
    ZkStatus pull_changes(uint64_t since, PullResponse& out) override {
        ZkStatus st = inner_.pull_changes(since, out);
        if (ok(st) && after_pull) after_pull();
        return st;
    }
    ZkStatus push_changes(const PushRequest& req, PushResult& out) override {
        return inner_.push_changes(req, out);
    }
    const char* name() const override { return "hook"; }

    std::function<void()> after_pull;

private:
    SyncAdapter& inner_;
};

static bool is_dirty(TestDevice& dev, const std::string& id) {
    LocalNote ln;
    REQUIRE(dev.store.get_note(id, ln));
    return ln.dirty;
}

TEST_CASE("Two devices share notes through the server", "[sync][engine]") {
    ManualClock clock;
    SyncServer server;
    Peer a(clock, server);
    Peer b(clock, server);

    REQUIRE(a.dev.register_as("alice", "pw") == ZkStatus::OK);
    std::string id = a.dev.note("Shared", "from a");
    std::string folder = a.dev.folder("Inbox");

    clock.advance(1000);
    REQUIRE(a.sync() == ZkStatus::OK);
    CHECK(a.stats.pushed);
    CHECK(a.stats.created == 2);
    CHECK(a.stats.conflicts == 0);
    CHECK_FALSE(is_dirty(a.dev, id));
    CHECK_FALSE(a.dev.store.sync_state().key_store_dirty);
    CHECK(a.dev.store.sync_state().last_sync_version == server.sequence("alice"));
    CHECK(a.dev.store.sync_state().last_sync_at == clock.now);

    REQUIRE(b.engine.bootstrap() == ZkStatus::OK);
    CHECK(b.engine.last_stats().pulled == 2);
    CHECK(b.engine.bootstrap() == ZkStatus::VALIDATION_FAILURE);
    REQUIRE(b.dev.login("pw") == ZkStatus::OK);
    CHECK(b.dev.read(id).content == "from a");
    std::string name;
    REQUIRE(b.dev.notebook.read_folder_name(b.dev.session, folder, name) == ZkStatus::OK);
    CHECK(name == "Inbox");

    clock.advance(1000);
    REQUIRE(b.dev.notebook.update_note(b.dev.session, id, "Shared", "from b") == ZkStatus::OK);
    REQUIRE(b.sync() == ZkStatus::OK);
    CHECK(b.stats.updated == 1);

    clock.advance(1000);
    REQUIRE(a.sync() == ZkStatus::OK);
    CHECK(a.stats.pulled == 1);
    CHECK(a.dev.read(id).content == "from b");

    LocalNote ln;
    REQUIRE(a.dev.store.get_note(id, ln));
    CHECK(ln.note.sync_version == 2);
    CHECK(ln.note.last_modified_device_id == b.dev.device_id);

    SECTION("deletes travel as tombstones") {
        REQUIRE(a.dev.notebook.delete_note(a.dev.session, id) == ZkStatus::OK);
        REQUIRE(a.sync() == ZkStatus::OK);
        REQUIRE(b.sync() == ZkStatus::OK);
        NotePlain out;
        CHECK(b.dev.notebook.read_note(b.dev.session, id, out) == ZkStatus::NOT_FOUND);
    }
}

TEST_CASE("Bootstrap needs an existing account", "[sync][engine]") {
    ManualClock clock;
    SyncServer server;
    Peer fresh(clock, server, "nobody");
    CHECK(fresh.engine.bootstrap() == ZkStatus::NOT_FOUND);
    CHECK(fresh.sync() == ZkStatus::SESSION_EXPIRED);
}

TEST_CASE("Offline edits stay dirty until the server is back", "[sync][engine][offline]") {
    ManualClock clock;
    SyncServer server;
    Peer a(clock, server);
    REQUIRE(a.dev.register_as("alice", "pw") == ZkStatus::OK);
    REQUIRE(a.sync() == ZkStatus::OK);

    server.set_offline(true);
    std::string id = a.dev.note("Offline", "written on a plane");
    const uint64_t cursor = a.dev.store.sync_state().last_sync_version;
    CHECK(a.sync() == ZkStatus::TRANSPORT_FAILURE);
    CHECK(is_dirty(a.dev, id));
    CHECK(a.dev.store.sync_state().last_sync_version == cursor);
    CHECK_FALSE(a.engine.in_progress());

    server.set_offline(false);
    REQUIRE(a.sync() == ZkStatus::OK);
    CHECK_FALSE(is_dirty(a.dev, id));
    CHECK(a.stats.created == 1);
}

TEST_CASE("Concurrent edits resolve to the later write", "[sync][engine][conflict]") {
    ManualClock clock;
    SyncServer server;
    Peer a(clock, server);
    REQUIRE(a.dev.register_as("alice", "pw") == ZkStatus::OK);
    std::string id = a.dev.note("Plan", "v1");
    REQUIRE(a.sync() == ZkStatus::OK);

    TestDevice b_dev(clock);
    LocalServerAdapter b_server(server, "alice");
    HookAdapter b_adapter(b_server);
    SyncEngine b_engine(b_dev.store, b_adapter, b_dev.device_id, clock.fn());
    REQUIRE(b_engine.bootstrap() == ZkStatus::OK);
    REQUIRE(b_dev.login("pw") == ZkStatus::OK);

    SECTION("a later local edit wins over an earlier remote one") {
        clock.advance(1000);
        REQUIRE(a.dev.notebook.update_note(a.dev.session, id, "Plan", "a at T1") == ZkStatus::OK);
        clock.advance(1000);
        REQUIRE(b_dev.notebook.update_note(b_dev.session, id, "Plan", "b at T2") == ZkStatus::OK);
        REQUIRE(a.sync() == ZkStatus::OK);

        SyncStats stats;
        REQUIRE(b_engine.sync(b_dev.session, stats) == ZkStatus::OK);
        CHECK(stats.kept_local == 1);
        CHECK(stats.conflicts == 1);
        CHECK(stats.conflicts_lost == 0);
        CHECK(b_dev.read(id).content == "b at T2");

        REQUIRE(a.sync() == ZkStatus::OK);
        CHECK(a.dev.read(id).content == "b at T2");
    }

    SECTION("an earlier local edit gives way to a later remote one") {
        clock.advance(1000);
        REQUIRE(b_dev.notebook.update_note(b_dev.session, id, "Plan", "b at T1") == ZkStatus::OK);
        clock.advance(1000);
        REQUIRE(a.dev.notebook.update_note(a.dev.session, id, "Plan", "a at T2") == ZkStatus::OK);

        // A's push lands between B's pull and B's push
        bool raced = false;
        b_adapter.after_pull = [&]() {
            if (raced) return;
            raced = true;
            REQUIRE(a.sync() == ZkStatus::OK);
        };
        SyncStats stats;
        REQUIRE(b_engine.sync(b_dev.session, stats) == ZkStatus::OK);
        CHECK(stats.conflicts == 1);
        CHECK(stats.conflicts_lost == 1);
        CHECK(b_dev.read(id).content == "a at T2");
        CHECK_FALSE(is_dirty(b_dev, id));

        SyncStats again;
        REQUIRE(b_engine.sync(b_dev.session, again) == ZkStatus::OK);
        CHECK(b_dev.read(id).content == "a at T2");
    }
}

TEST_CASE("Only one sync cycle runs at a time", "[sync][engine]") {
    ManualClock clock;
    SyncServer server;
    TestDevice dev(clock);
    REQUIRE(dev.register_as("alice", "pw") == ZkStatus::OK);

    LocalServerAdapter inner(server, "alice");
    HookAdapter adapter(inner);
    SyncEngine engine(dev.store, adapter, dev.device_id, clock.fn());

    ZkStatus nested = ZkStatus::OK;
    bool seen_running = false;
    adapter.after_pull = [&]() {
        seen_running = engine.in_progress();
        SyncStats s;
        nested = engine.sync(dev.session, s);
    };

    SyncStats stats;
    REQUIRE(engine.sync(dev.session, stats) == ZkStatus::OK);
    CHECK(seen_running);
    CHECK(nested == ZkStatus::SYNC_IN_PROGRESS);
    CHECK_FALSE(engine.in_progress());
}

TEST_CASE("Password change on one device reaches the other", "[sync][engine][rotate]") {
    ManualClock clock;
    SyncServer server;
    Peer a(clock, server);
    Peer b(clock, server);

    REQUIRE(a.dev.register_as("alice", "old pw") == ZkStatus::OK);
    std::string id = a.dev.note("Shared", "hello");
    REQUIRE(a.sync() == ZkStatus::OK);
    REQUIRE(b.engine.bootstrap() == ZkStatus::OK);
    REQUIRE(b.dev.login("old pw") == ZkStatus::OK);

    clock.advance(1000);
    REQUIRE(a.dev.account.change_password(a.dev.session, secret("old pw"), secret("new pw")) == ZkStatus::OK);
    REQUIRE(a.sync() == ZkStatus::OK);
    CHECK(a.dev.session.previous_kek() == nullptr);
    CHECK_FALSE(a.dev.store.sync_state().key_store_dirty);

    // B wrote something under the old key before hearing about the change
    clock.advance(1000);
    std::string from_b = b.dev.note("From B", "still old key");

    REQUIRE(b.sync() == ZkStatus::OK);
    CHECK(b.stats.key_rotation_required);
    CHECK_FALSE(b.stats.pushed);
    REQUIRE(b.engine.key_rotation_required());
    CHECK(b.engine.pending_key_store()->key_epoch == 2);
    CHECK(is_dirty(b.dev, from_b));

    NotePlain out;
    CHECK(b.dev.notebook.read_note(b.dev.session, id, out) == ZkStatus::AUTHENTICATION_FAILURE);

    KeyStore pending = *b.engine.pending_key_store();
    CHECK(b.dev.account.adopt_remote_key_store(pending, secret("old pw"), b.dev.session) ==
        ZkStatus::AUTHENTICATION_FAILURE);
    REQUIRE(b.dev.account.adopt_remote_key_store(pending, secret("new pw"), b.dev.session) == ZkStatus::OK);
    b.engine.clear_pending_key_store();

    CHECK(b.dev.read(id).content == "hello");
    CHECK(b.dev.read(from_b).content == "still old key");
    KeyStore ks;
    REQUIRE(b.dev.store.get_key_store(ks));
    CHECK(ks.key_epoch == 2);

    REQUIRE(b.sync() == ZkStatus::OK);
    CHECK(b.stats.pushed);
    CHECK_FALSE(is_dirty(b.dev, from_b));

    REQUIRE(a.sync() == ZkStatus::OK);
    CHECK(a.dev.read(from_b).content == "still old key");
}

TEST_CASE("Entities pulled under the retired key are moved to the new one", "[sync][engine][rotate]") {
    ManualClock clock;
    SyncServer server;
    Peer a(clock, server);
    Peer b(clock, server);

    REQUIRE(a.dev.register_as("alice", "old pw") == ZkStatus::OK);
    REQUIRE(a.sync() == ZkStatus::OK);
    REQUIRE(b.engine.bootstrap() == ZkStatus::OK);
    REQUIRE(b.dev.login("old pw") == ZkStatus::OK);

    clock.advance(1000);
    std::string late = b.dev.note("Late", "pushed under the old key");
    REQUIRE(b.sync() == ZkStatus::OK);

    clock.advance(1000);
    REQUIRE(a.dev.account.change_password(a.dev.session, secret("old pw"), secret("new pw")) == ZkStatus::OK);
    REQUIRE(a.dev.session.previous_kek() != nullptr);

    clock.advance(1000);
    REQUIRE(a.sync() == ZkStatus::OK);
    CHECK(a.stats.rewrapped == 1);
    CHECK(a.dev.session.previous_kek() == nullptr);
    CHECK(a.dev.read(late).content == "pushed under the old key");

    LocalNote ln;
    REQUIRE(a.dev.store.get_note(late, ln));
    CHECK_FALSE(ln.dirty);
    CHECK(ln.note.encrypted_dek.key_id == key_id_of(a.dev.session.kek()));

    REQUIRE(b.sync() == ZkStatus::OK);
    CHECK(b.stats.key_rotation_required);
}

TEST_CASE("A password change never overrides another device's edit", "[sync][engine][rotate]") {
    ManualClock clock;
    SyncServer server;

    TestDevice a_dev(clock);
    LocalServerAdapter a_server(server, "alice");
    HookAdapter a_adapter(a_server);
    SyncEngine a_engine(a_dev.store, a_adapter, a_dev.device_id, clock.fn());

    REQUIRE(a_dev.register_as("alice", "old pw") == ZkStatus::OK);
    std::string id = a_dev.note("Plan", "written on a");
    SyncStats a_stats;
    REQUIRE(a_engine.sync(a_dev.session, a_stats) == ZkStatus::OK);

    Peer b(clock, server);
    REQUIRE(b.engine.bootstrap() == ZkStatus::OK);
    REQUIRE(b.dev.login("old pw") == ZkStatus::OK);

    SECTION("edit pulled after the rewrap") {
        clock.advance(1000);
        REQUIRE(b.dev.notebook.update_note(b.dev.session, id, "Plan", "edited on b") == ZkStatus::OK);
        REQUIRE(b.sync() == ZkStatus::OK);

        clock.advance(1000);
        REQUIRE(a_dev.account.change_password(a_dev.session, secret("old pw"), secret("new pw")) ==
            ZkStatus::OK);
        REQUIRE(a_engine.sync(a_dev.session, a_stats) == ZkStatus::OK);
        CHECK(a_stats.kept_local == 0);
        CHECK(a_stats.rewrapped == 1);
        CHECK(a_stats.conflicts == 0);
    }

    SECTION("edit pushed between the rewrapping device's pull and push") {
        clock.advance(1000);
        REQUIRE(a_dev.account.change_password(a_dev.session, secret("old pw"), secret("new pw")) ==
            ZkStatus::OK);

        bool raced = false;
        a_adapter.after_pull = [&]() {
            if (raced) return;
            raced = true;
            clock.advance(1000);
            REQUIRE(b.dev.notebook.update_note(b.dev.session, id, "Plan", "edited on b") == ZkStatus::OK);
            REQUIRE(b.sync() == ZkStatus::OK);
        };
        // the key store was computed before B's edit reached the server
        CHECK(a_engine.sync(a_dev.session, a_stats) == ZkStatus::KEY_EPOCH_MISMATCH);
        REQUIRE(a_dev.session.previous_kek() != nullptr);

        clock.advance(1000);
        REQUIRE(a_engine.sync(a_dev.session, a_stats) == ZkStatus::OK);
        CHECK(a_stats.rewrapped == 1);
    }

    CHECK(a_dev.read(id).content == "edited on b");
    CHECK_FALSE(is_dirty(a_dev, id));
    CHECK(a_dev.session.previous_kek() == nullptr);

    REQUIRE(b.sync() == ZkStatus::OK);
    REQUIRE(b.engine.key_rotation_required());
    KeyStore pending = *b.engine.pending_key_store();
    REQUIRE(b.dev.account.adopt_remote_key_store(pending, secret("new pw"), b.dev.session) == ZkStatus::OK);
    b.engine.clear_pending_key_store();
    CHECK(b.dev.read(id).content == "edited on b");
}

TEST_CASE("Shared directory as the remote", "[sync][file]") {
    const std::string dir = make_temp_dir();
    ManualClock clock;

    TestDevice a(clock);
    FileSyncAdapter a_adapter(dir);
    SyncEngine a_engine(a.store, a_adapter, a.device_id, clock.fn());
    REQUIRE(a_adapter.test_connection() == ZkStatus::OK);

    REQUIRE(a.register_as("alice", "pw") == ZkStatus::OK);
    std::string id = a.note("On disk", "synced through a folder");
    SyncStats stats;
    REQUIRE(a_engine.sync(a.session, stats) == ZkStatus::OK);
    CHECK(stats.created == 1);

    struct stat st;
    REQUIRE(stat((dir + "/" + SYNC_STATE_FILENAME).c_str(), &st) == 0);

    TestDevice b(clock);
    FileSyncAdapter b_adapter(dir);
    SyncEngine b_engine(b.store, b_adapter, b.device_id, clock.fn());
    REQUIRE(b_engine.bootstrap() == ZkStatus::OK);
    REQUIRE(b.login("pw") == ZkStatus::OK);
    CHECK(b.read(id).content == "synced through a folder");

    FileSyncAdapter gone(dir + "/does-not-exist");
    CHECK(gone.test_connection() == ZkStatus::TRANSPORT_FAILURE);
    PullResponse resp;
    CHECK(gone.pull_changes(0, resp) == ZkStatus::TRANSPORT_FAILURE);

    std::remove((dir + "/" + SYNC_STATE_FILENAME).c_str());
    std::remove((dir + "/" + SYNC_LOCK_FILENAME).c_str());
    rmdir(dir.c_str());
}

TEST_CASE("Unreachable server is a transport failure", "[sync][server]") {
    ManualClock clock;
    TestDevice dev(clock);
    REQUIRE(dev.register_as("alice", "pw") == ZkStatus::OK);
    std::string id = dev.note("Kept", "");

    ServerSyncAdapter adapter("http://127.0.0.1:1/", "token");
    CHECK(adapter.test_connection() == ZkStatus::TRANSPORT_FAILURE);

    SyncEngine engine(dev.store, adapter, dev.device_id, clock.fn());
    SyncStats stats;
    CHECK(engine.sync(dev.session, stats) == ZkStatus::TRANSPORT_FAILURE);
    CHECK(is_dirty(dev, id));
    CHECK(dev.store.sync_state().key_store_dirty);
}
