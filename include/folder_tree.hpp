#pragma once
#include "entities.hpp"
#include "status.hpp"

#include <unordered_map>

// Entities a folder-password change touches, collected in one pass
struct CascadePlan {
    std::vector<std::string> folder_ids;    // descendants, root excluded
    std::vector<std::string> note_ids;
};

// id -> children index over live (non-deleted) folders. Every walk is
// iterative; a parent chain that loops is reported, never followed.
class FolderTree {
public:
    FolderTree(const std::vector<Folder>& folders, const std::vector<Note>& notes);

    bool contains(const std::string& id) const;

    // 1 for a top-level folder, -1 if unknown or the parent chain loops
    int depth_of(const std::string& id) const;

    // levels in the subtree rooted at id, the root counted as 1
    int subtree_height(const std::string& id) const;

    // breadth-first, the root itself excluded
    std::vector<std::string> descendant_folders(const std::string& id) const;
    std::vector<std::string> notes_in(const std::string& folder_id) const;

    ZkStatus check_create(const std::string& parent_id) const;
    ZkStatus check_move(const std::string& id, const std::string& new_parent_id) const;

    // inherit=false: nothing below the folder changes
    CascadePlan cascade_plan(const std::string& folder_id, bool inherit) const;

    // Everything below folder_id whose protection came from it
    CascadePlan inherited_from(const std::string& folder_id) const;

private:
    struct NoteRef {
        std::string folder_id;
        bool has_password = false;
        std::string source_folder_id;
    };
    struct FolderRef {
        std::string parent_id;
        bool has_password = false;
        std::string source_folder_id;
    };

    std::unordered_map<std::string, FolderRef> folders_;
    std::unordered_map<std::string, std::vector<std::string>> children_;
    std::unordered_map<std::string, std::vector<std::string>> notes_by_folder_;
    std::unordered_map<std::string, NoteRef> notes_;
};
