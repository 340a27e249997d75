#include <catch2/catch.hpp>

#include "notebook.hpp"
#include "test_support.hpp"

TEST_CASE("Notes are stored encrypted and read back", "[notebook][notes]") {
    ManualClock clock;
    TestDevice dev(clock);
    REQUIRE(dev.register_as("alice", "pw") == ZkStatus::OK);

    std::string id = dev.note("Groceries", "milk\neggs");
    NotePlain plain = dev.read(id);
    CHECK(plain.title == "Groceries");
    CHECK(plain.content == "milk\neggs");

    LocalNote ln;
    REQUIRE(dev.store.get_note(id, ln));
    CHECK(ln.dirty);
    CHECK(ln.dirty_since == clock.now);
    CHECK(ln.note.last_modified_device_id == dev.device_id);
    CHECK(ln.note.encrypted_dek.key_id == key_id_of(dev.session.kek()));
    std::string stored(ln.note.encrypted_content.ciphertext.begin(), ln.note.encrypted_content.ciphertext.end());
    CHECK(stored.find("milk") == std::string::npos);

    std::string out_id;
    CHECK(dev.notebook.create_note(dev.session, std::string("bad\x01title"), "", "", out_id) ==
        ZkStatus::VALIDATION_FAILURE);
    CHECK(dev.notebook.create_note(dev.session, "x", "", "no-such-folder", out_id) ==
        ZkStatus::NOT_FOUND);

    NotePlain missing;
    CHECK(dev.notebook.read_note(dev.session, "no-such-note", missing) == ZkStatus::NOT_FOUND);

    clock.advance(500);
    REQUIRE(dev.notebook.update_note(dev.session, id, "Groceries", "milk\neggs\nbread") == ZkStatus::OK);
    CHECK(dev.read(id).content == "milk\neggs\nbread");
    REQUIRE(dev.store.get_note(id, ln));
    CHECK(ln.note.updated_at == clock.now);
    CHECK(ln.note.created_at == TEST_START_MS);

    clock.advance(500);
    REQUIRE(dev.notebook.delete_note(dev.session, id) == ZkStatus::OK);
    REQUIRE(dev.store.get_note(id, ln));
    CHECK(ln.note.is_deleted);
    CHECK(ln.note.deleted_at == clock.now);
    CHECK(dev.store.versions_of(id).empty());
    CHECK(dev.notebook.read_note(dev.session, id, missing) == ZkStatus::NOT_FOUND);
    CHECK(dev.notebook.delete_note(dev.session, id) == ZkStatus::NOT_FOUND);
}

TEST_CASE("Listing puts pinned notes first", "[notebook][list]") {
    ManualClock clock;
    TestDevice dev(clock);
    REQUIRE(dev.register_as("alice", "pw") == ZkStatus::OK);

    std::string a = dev.note("A", "");
    clock.advance(10);
    std::string b = dev.note("B", "");
    clock.advance(10);
    std::string c = dev.note("C", "");
    clock.advance(10);
    REQUIRE(dev.notebook.set_pinned(dev.session, a, true) == ZkStatus::OK);
    clock.advance(10);
    REQUIRE(dev.notebook.set_pinned(dev.session, b, true) == ZkStatus::OK);
    clock.advance(10);
    // most recently updated of the unpinned ones
    std::string d = dev.note("D", "");

    std::vector<NoteSummary> list;
    REQUIRE(dev.notebook.list_notes(dev.session, "", list) == ZkStatus::OK);
    REQUIRE(list.size() == 4);
    CHECK(list[0].id == b);
    CHECK(list[1].id == a);
    CHECK(list[2].id == d);
    CHECK(list[3].id == c);
    CHECK(list[0].title == "B");
    CHECK(list[0].is_pinned);

    REQUIRE(dev.notebook.set_pinned(dev.session, b, false) == ZkStatus::OK);
    LocalNote ln;
    REQUIRE(dev.store.get_note(b, ln));
    CHECK(ln.note.pinned_at == 0);

    SECTION("tags are deduplicated and validated") {
        REQUIRE(dev.notebook.set_tags(dev.session, c, { "work", "todo", "work" }) == ZkStatus::OK);
        REQUIRE(dev.store.get_note(c, ln));
        CHECK(ln.note.tags == std::vector<std::string>{ "work", "todo" });
        CHECK(dev.notebook.set_tags(dev.session, c, { "   " }) == ZkStatus::VALIDATION_FAILURE);
        CHECK(dev.notebook.set_tags(dev.session, c, std::vector<std::string>(MAX_TAGS + 1, "t")) ==
            ZkStatus::VALIDATION_FAILURE);
    }
}

TEST_CASE("Editing keeps a bounded history", "[notebook][history]") {
    ManualClock clock;
    TestDevice dev(clock);
    REQUIRE(dev.register_as("alice", "pw") == ZkStatus::OK);

    std::string id = dev.note("Draft", "v0");
    for (int i = 1; i <= 3; ++i) {
        clock.advance(1000);
        REQUIRE(dev.notebook.update_note(dev.session, id, "Draft", "v" + std::to_string(i)) == ZkStatus::OK);
    }

    std::vector<NoteVersion> versions = dev.notebook.versions(id);
    REQUIRE(versions.size() == 3);
    NotePlain old;
    REQUIRE(dev.notebook.read_version(dev.session, versions.front().id, old) == ZkStatus::OK);
    CHECK(old.content == "v0");

    SECTION("restore makes an old body current and keeps the replaced one") {
        clock.advance(1000);
        REQUIRE(dev.notebook.restore_version(dev.session, id, versions.front().id) == ZkStatus::OK);
        CHECK(dev.read(id).content == "v0");
        std::vector<NoteVersion> after = dev.notebook.versions(id);
        REQUIRE(after.size() == 4);
        NotePlain latest;
        REQUIRE(dev.notebook.read_version(dev.session, after.back().id, latest) == ZkStatus::OK);
        CHECK(latest.content == "v3");

        CHECK(dev.notebook.restore_version(dev.session, "other-note", versions.front().id) ==
            ZkStatus::NOT_FOUND);
    }

    SECTION("only the newest fifty are kept") {
        for (size_t i = 4; i <= MAX_NOTE_VERSIONS + 5; ++i) {
            clock.advance(1000);
            REQUIRE(dev.notebook.update_note(dev.session, id, "Draft", "v" + std::to_string(i)) ==
                ZkStatus::OK);
        }
        std::vector<NoteVersion> kept = dev.notebook.versions(id);
        REQUIRE(kept.size() == MAX_NOTE_VERSIONS);
        NotePlain oldest;
        REQUIRE(dev.notebook.read_version(dev.session, kept.front().id, oldest) == ZkStatus::OK);
        CHECK(oldest.content == "v5");
        CHECK(dev.notebook.read_version(dev.session, versions.front().id, oldest) == ZkStatus::NOT_FOUND);
    }
}

TEST_CASE("Folders", "[notebook][folders]") {
    ManualClock clock;
    TestDevice dev(clock);
    REQUIRE(dev.register_as("alice", "pw") == ZkStatus::OK);

    std::string work = dev.folder("Work");
    std::string projects = dev.folder("Projects", work);
    std::string home = dev.folder("Home");
    std::string n1 = dev.note("Plan", "q3", projects);
    std::string n2 = dev.note("Memo", "hi", work);
    std::string loose = dev.note("Loose", "");

    std::string id;
    CHECK(dev.notebook.create_folder(dev.session, "   ", "", id) == ZkStatus::VALIDATION_FAILURE);

    std::vector<FolderSummary> top;
    REQUIRE(dev.notebook.list_folders(dev.session, "", top) == ZkStatus::OK);
    REQUIRE(top.size() == 2);
    CHECK(top[0].name == "Work");
    CHECK(top[1].name == "Home");

    REQUIRE(dev.notebook.set_folder_order(dev.session, home, 0) == ZkStatus::OK);
    REQUIRE(dev.notebook.set_folder_order(dev.session, work, 1) == ZkStatus::OK);
    REQUIRE(dev.notebook.list_folders(dev.session, "", top) == ZkStatus::OK);
    CHECK(top[0].id == home);

    REQUIRE(dev.notebook.rename_folder(dev.session, home, "House") == ZkStatus::OK);
    std::string name;
    REQUIRE(dev.notebook.read_folder_name(dev.session, home, name) == ZkStatus::OK);
    CHECK(name == "House");

    CHECK(dev.notebook.move_folder(dev.session, work, projects) == ZkStatus::VALIDATION_FAILURE);
    REQUIRE(dev.notebook.move_folder(dev.session, projects, home) == ZkStatus::OK);
    REQUIRE(dev.notebook.move_note(dev.session, loose, home) == ZkStatus::OK);

    std::vector<NoteSummary> in_home;
    REQUIRE(dev.notebook.list_notes(dev.session, home, in_home) == ZkStatus::OK);
    REQUIRE(in_home.size() == 1);
    CHECK(in_home[0].id == loose);

    clock.advance(1000);
    REQUIRE(dev.notebook.delete_folder(dev.session, home) == ZkStatus::OK);
    for (const auto& gone : { home, projects }) {
        LocalFolder lf;
        REQUIRE(dev.store.get_folder(gone, lf));
        CHECK(lf.folder.is_deleted);
        CHECK(lf.dirty);
    }
    for (const auto& gone : { n1, loose }) {
        LocalNote ln;
        REQUIRE(dev.store.get_note(gone, ln));
        CHECK(ln.note.is_deleted);
    }
    CHECK(dev.read(n2).content == "hi");
    REQUIRE(dev.notebook.list_folders(dev.session, "", top) == ZkStatus::OK);
    REQUIRE(top.size() == 1);
    CHECK(top[0].id == work);
}

TEST_CASE("Every edit tells the scheduler", "[notebook][scheduler]") {
    ManualClock clock;
    TestDevice dev(clock);
    REQUIRE(dev.register_as("alice", "pw") == ZkStatus::OK);

    SyncScheduler scheduler(5, 2000);
    scheduler.start(clock.now);
    dev.notebook.set_scheduler(&scheduler);

    CHECK_FALSE(scheduler.flush_pending());
    dev.note("A", "");
    CHECK(scheduler.flush_pending());
    CHECK(scheduler.dirty_since() == clock.now);
    CHECK_FALSE(scheduler.due(clock.now + 1999));
    CHECK(scheduler.due(clock.now + 2000));
}
