#include <catch2/catch.hpp>

#include "folder_tree.hpp"
#include "test_support.hpp"

// f1 <- f2 <- ... <- fN
static std::vector<Folder> chain(int n) {
    std::vector<Folder> out;
    for (int i = 1; i <= n; ++i) {
        out.push_back(plain_folder("f" + std::to_string(i), i == 1 ? "" : "f" + std::to_string(i - 1)));
    }
    return out;
}

static Note note_in(const std::string& id, const std::string& folder_id) {
    Note n = plain_note(id, TEST_START_MS);
    n.folder_id = folder_id;
    return n;
}

TEST_CASE("Folder depth is capped at ten levels", "[folders][depth]") {
    FolderTree nine(chain(9), {});
    CHECK(nine.depth_of("f1") == 1);
    CHECK(nine.depth_of("f9") == 9);
    CHECK(nine.check_create("f9") == ZkStatus::OK);

    FolderTree ten(chain(10), {});
    CHECK(ten.depth_of("f10") == 10);
    CHECK(ten.check_create("f10") == ZkStatus::VALIDATION_FAILURE);
    CHECK(ten.check_create("f9") == ZkStatus::OK);
    CHECK(ten.check_create("") == ZkStatus::OK);
    CHECK(ten.check_create("missing") == ZkStatus::NOT_FOUND);
    CHECK(ten.subtree_height("f1") == 10);
    CHECK(ten.subtree_height("f8") == 3);
}

TEST_CASE("Folder moves", "[folders][move]") {
    std::vector<Folder> folders = chain(4);
    folders.push_back(plain_folder("other", ""));
    FolderTree t(folders, {});

    CHECK(t.check_move("f3", "other") == ZkStatus::OK);
    CHECK(t.check_move("f3", "") == ZkStatus::OK);

    SECTION("into itself or below itself is a cycle") {
        CHECK(t.check_move("f2", "f2") == ZkStatus::VALIDATION_FAILURE);
        CHECK(t.check_move("f2", "f4") == ZkStatus::VALIDATION_FAILURE);
        CHECK(t.check_move("f1", "f3") == ZkStatus::VALIDATION_FAILURE);
    }

    SECTION("unknown folders") {
        CHECK(t.check_move("nope", "f1") == ZkStatus::NOT_FOUND);
        CHECK(t.check_move("f2", "nope") == ZkStatus::NOT_FOUND);
    }

    SECTION("a move that would push the subtree past ten levels") {
        std::vector<Folder> deep = chain(8);
        deep.push_back(plain_folder("a", ""));
        deep.push_back(plain_folder("b", "a"));
        deep.push_back(plain_folder("c", "b"));
        FolderTree d(deep, {});
        CHECK(d.check_move("a", "f7") == ZkStatus::OK);          // 7 + 3
        CHECK(d.check_move("a", "f8") == ZkStatus::VALIDATION_FAILURE);
    }
}

TEST_CASE("Looping parent data is reported, not followed", "[folders][cycle]") {
    std::vector<Folder> folders;
    folders.push_back(plain_folder("x", "y"));
    folders.push_back(plain_folder("y", "x"));
    folders.push_back(plain_folder("orphan", "gone"));
    FolderTree t(folders, {});

    CHECK(t.depth_of("x") == -1);
    CHECK(t.depth_of("orphan") == -1);
    CHECK(t.check_create("x") == ZkStatus::NOT_FOUND);
    CHECK(t.check_move("x", "y") == ZkStatus::NOT_FOUND);
    CHECK(t.descendant_folders("x") == std::vector<std::string>{ "y" });
    CHECK(t.subtree_height("x") == 2);
}

TEST_CASE("Deleted folders are not part of the tree", "[folders]") {
    std::vector<Folder> folders = chain(2);
    folders[1].is_deleted = true;
    FolderTree t(folders, {});
    CHECK(t.contains("f1"));
    CHECK_FALSE(t.contains("f2"));
    CHECK(t.descendant_folders("f1").empty());
}

TEST_CASE("Password cascade plans", "[folders][cascade]") {
    // root -> child -> grandchild, notes at every level
    std::vector<Folder> folders;
    folders.push_back(plain_folder("root", ""));
    folders.push_back(plain_folder("child", "root"));
    folders.push_back(plain_folder("grand", "child"));
    folders.push_back(plain_folder("locked", "root"));
    folders.back().has_password = true;

    std::vector<Note> notes;
    notes.push_back(note_in("n-root", "root"));
    notes.push_back(note_in("n-child", "child"));
    notes.push_back(note_in("n-grand", "grand"));
    notes.push_back(note_in("n-own", "child"));
    notes.back().has_password = true;
    notes.push_back(note_in("n-outside", ""));

    FolderTree t(folders, notes);

    SECTION("inherit reaches every unprotected descendant") {
        CascadePlan plan = t.cascade_plan("root", true);
        std::sort(plan.folder_ids.begin(), plan.folder_ids.end());
        std::sort(plan.note_ids.begin(), plan.note_ids.end());
        CHECK(plan.folder_ids == std::vector<std::string>{ "child", "grand" });
        CHECK(plan.note_ids == std::vector<std::string>{ "n-child", "n-grand", "n-root" });
    }

    SECTION("without inherit nothing below changes") {
        CascadePlan plan = t.cascade_plan("root", false);
        CHECK(plan.folder_ids.empty());
        CHECK(plan.note_ids.empty());
    }

    SECTION("removal only takes back what the folder handed down") {
        std::vector<Folder> f2 = folders;
        std::vector<Note> n2 = notes;
        for (auto& f : f2) {
            if (f.id == "child" || f.id == "grand") {
                f.has_password = true;
                f.password_inherited = true;
                f.protection.source_folder_id = "root";
            }
        }
        for (auto& n : n2) {
            if (n.id == "n-child" || n.id == "n-root") {
                n.has_password = true;
                n.password_inherited = true;
                n.protection.source_folder_id = "root";
            }
        }
        FolderTree protected_tree(f2, n2);
        CascadePlan plan = protected_tree.inherited_from("root");
        std::sort(plan.folder_ids.begin(), plan.folder_ids.end());
        std::sort(plan.note_ids.begin(), plan.note_ids.end());
        CHECK(plan.folder_ids == std::vector<std::string>{ "child", "grand" });
        CHECK(plan.note_ids == std::vector<std::string>{ "n-child", "n-root" });
    }
}
