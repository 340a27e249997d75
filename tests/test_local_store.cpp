#include <catch2/catch.hpp>

#include "io.hpp"
#include "local_store.hpp"
#include "test_support.hpp"

static LocalNote local(const Note& n, bool dirty) {
    LocalNote ln;
    ln.note = n;
    ln.dirty = dirty;
    ln.dirty_since = dirty ? n.updated_at : 0;
    return ln;
}

static NoteVersion version_of(const std::string& id, const std::string& note_id, int64_t at) {
    NoteVersion v;
    v.id = id;
    v.note_id = note_id;
    v.created_at = at;
    return v;
}

TEST_CASE("Memory store applies batches", "[store]") {
    MemoryLocalStore store;

    StoreBatch batch;
    batch.put_notes.push_back(local(plain_note("n1", 100), true));
    Note in_folder = plain_note("n2", 200);
    in_folder.folder_id = "f1";
    batch.put_notes.push_back(local(in_folder, false));
    LocalFolder lf;
    lf.folder = plain_folder("f1", "");
    batch.put_folders.push_back(lf);
    batch.put_versions.push_back(version_of("v2", "n1", 20));
    batch.put_versions.push_back(version_of("v1", "n1", 10));
    batch.put_versions.push_back(version_of("w1", "n2", 10));
    REQUIRE(store.apply(batch) == ZkStatus::OK);

    CHECK(store.all_notes().size() == 2);
    REQUIRE(store.dirty_notes().size() == 1);
    CHECK(store.dirty_notes()[0].note.id == "n1");
    CHECK(store.notes_in_folder("f1").size() == 1);
    CHECK(store.child_folders("").size() == 1);
    CHECK(store.dirty_folders().empty());

    std::vector<NoteVersion> vs = store.versions_of("n1");
    REQUIRE(vs.size() == 2);
    CHECK(vs[0].id == "v1");
    CHECK(vs[1].id == "v2");

    SECTION("purge and delete of versions") {
        StoreBatch b;
        b.purge_versions_of.push_back("n1");
        b.delete_versions.push_back("w1");
        REQUIRE(store.apply(b) == ZkStatus::OK);
        CHECK(store.versions_of("n1").empty());
        CHECK(store.versions_of("n2").empty());
    }

    SECTION("key store and sync state") {
        KeyStore ks;
        CHECK_FALSE(store.get_key_store(ks));
        StoreBatch b;
        KeyStore fresh;
        fresh.user_id = "alice";
        fresh.key_epoch = 3;
        b.key_store = fresh;
        SyncState ss;
        ss.last_sync_version = 9;
        b.sync_state = ss;
        REQUIRE(store.apply(b) == ZkStatus::OK);
        REQUIRE(store.get_key_store(ks));
        CHECK(ks.key_epoch == 3);
        CHECK(store.sync_state().last_sync_version == 9);
    }

    SECTION("an empty batch is a no-op") {
        CHECK(store.apply(StoreBatch{}) == ZkStatus::OK);
        CHECK(store.all_notes().size() == 2);
    }
}

TEST_CASE("File store persists across reloads", "[store][file]") {
    const std::string dir = make_temp_dir();
    const std::string path = dir + "/" + STORE_FILENAME;

    {
        FileLocalStore store(path);
        REQUIRE(store.load() == ZkStatus::OK);
        CHECK(store.all_notes().empty());

        StoreBatch b;
        Note n = plain_note("n1", 1234, 7);
        n.tags = { "a", "b" };
        b.put_notes.push_back(local(n, true));
        b.put_notes.back().lockout.attempts = 2;
        LocalFolder lf;
        lf.folder = plain_folder("f1", "");
        b.put_folders.push_back(lf);
        b.put_versions.push_back(version_of("v1", "n1", 5));
        KeyStore ks;
        ks.user_id = "alice";
        ks.salt = Bytes(SALT_LEN, 9);
        ks.key_epoch = 2;
        b.key_store = ks;
        SyncState ss;
        ss.last_sync_version = 42;
        ss.key_store_dirty = true;
        b.sync_state = ss;
        REQUIRE(store.apply(b) == ZkStatus::OK);
    }

    struct stat st;
    REQUIRE(stat(path.c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0600);

    FileLocalStore reloaded(path);
    REQUIRE(reloaded.load() == ZkStatus::OK);

    LocalNote ln;
    REQUIRE(reloaded.get_note("n1", ln));
    CHECK(ln.dirty);
    CHECK(ln.lockout.attempts == 2);
    CHECK(ln.note.sync_version == 7);
    CHECK(ln.note.updated_at == 1234);
    CHECK(ln.note.tags == std::vector<std::string>{ "a", "b" });
    CHECK(ln.note.encrypted_content == plain_note("n1", 1234).encrypted_content);

    LocalFolder lf;
    CHECK(reloaded.get_folder("f1", lf));
    CHECK(reloaded.versions_of("n1").size() == 1);

    KeyStore ks;
    REQUIRE(reloaded.get_key_store(ks));
    CHECK(ks.user_id == "alice");
    CHECK(ks.salt == Bytes(SALT_LEN, 9));
    CHECK(ks.key_epoch == 2);
    CHECK(reloaded.sync_state().last_sync_version == 42);
    CHECK(reloaded.sync_state().key_store_dirty);

    std::remove(path.c_str());
    rmdir(dir.c_str());
}

TEST_CASE("File store failures", "[store][file]") {
    const std::string dir = make_temp_dir();

    SECTION("an unreadable document is refused") {
        const std::string path = dir + "/" + STORE_FILENAME;
        REQUIRE(atomic_write_text(path, "{ not json"));
        FileLocalStore store(path);
        CHECK(store.load() == ZkStatus::STORAGE_FAILURE);
        std::remove(path.c_str());
    }

    SECTION("a failed write leaves nothing visible") {
        FileLocalStore store(dir + "/missing-dir/" + STORE_FILENAME);
        REQUIRE(store.load() == ZkStatus::OK);
        StoreBatch b;
        b.put_notes.push_back(local(plain_note("n1", 1), true));
        CHECK(store.apply(b) == ZkStatus::STORAGE_FAILURE);
        LocalNote ln;
        CHECK_FALSE(store.get_note("n1", ln));
    }

    rmdir(dir.c_str());
}
