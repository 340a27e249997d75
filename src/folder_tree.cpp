#include "folder_tree.hpp"
#include "logging.hpp"

#include <deque>
#include <unordered_set>

FolderTree::FolderTree(const std::vector<Folder>& folders, const std::vector<Note>& notes) {
    for (const auto& f : folders) {
        if (f.is_deleted) continue;
        FolderRef ref;
        ref.parent_id = f.parent_id;
        ref.has_password = f.has_password;
        ref.source_folder_id = f.password_inherited ? f.protection.source_folder_id : "";
        folders_[f.id] = ref;
        children_[f.parent_id].push_back(f.id);
    }
    for (const auto& n : notes) {
        if (n.is_deleted) continue;
        NoteRef ref;
        ref.folder_id = n.folder_id;
        ref.has_password = n.has_password;
        ref.source_folder_id = n.password_inherited ? n.protection.source_folder_id : "";
        notes_[n.id] = ref;
        notes_by_folder_[n.folder_id].push_back(n.id);
    }
}

bool FolderTree::contains(const std::string& id) const {
    return folders_.count(id) != 0;
}

int FolderTree::depth_of(const std::string& id) const {
    if (!contains(id)) return -1;

    std::unordered_set<std::string> seen;
    int depth = 0;
    std::string cur = id;
    while (!cur.empty()) {
        if (!seen.insert(cur).second) return -1;
        auto it = folders_.find(cur);
        if (it == folders_.end()) return -1;   // dangling parent
        depth++;
        cur = it->second.parent_id;
    }
    return depth;
}

int FolderTree::subtree_height(const std::string& id) const {
    if (!contains(id)) return 0;

    std::deque<std::pair<std::string, int>> queue;
    std::unordered_set<std::string> seen;
    queue.emplace_back(id, 1);
    int height = 0;
    while (!queue.empty()) {
        auto [cur, level] = queue.front();
        queue.pop_front();
        if (!seen.insert(cur).second) continue;
        height = std::max(height, level);
        auto it = children_.find(cur);
        if (it == children_.end()) continue;
        for (const auto& c : it->second) queue.emplace_back(c, level + 1);
    }
    return height;
}

std::vector<std::string> FolderTree::descendant_folders(const std::string& id) const {
    std::vector<std::string> out;
    std::deque<std::string> queue;
    std::unordered_set<std::string> seen{ id };
    queue.push_back(id);
    while (!queue.empty()) {
        std::string cur = queue.front();
        queue.pop_front();
        auto it = children_.find(cur);
        if (it == children_.end()) continue;
        for (const auto& c : it->second) {
            if (!seen.insert(c).second) continue;
            out.push_back(c);
            queue.push_back(c);
        }
    }
    return out;
}

std::vector<std::string> FolderTree::notes_in(const std::string& folder_id) const {
    auto it = notes_by_folder_.find(folder_id);
    return it == notes_by_folder_.end() ? std::vector<std::string>{} : it->second;
}

ZkStatus FolderTree::check_create(const std::string& parent_id) const {
    if (parent_id.empty()) return ZkStatus::OK;
    int d = depth_of(parent_id);
    if (d < 0) return ZkStatus::NOT_FOUND;
    if (d + 1 > MAX_FOLDER_DEPTH) {
        audit_log_level(LogLevel::WARN,
            "Folder nesting limit reached",
            "folder_tree",
            "failure");
        return ZkStatus::VALIDATION_FAILURE;
    }
    return ZkStatus::OK;
}

ZkStatus FolderTree::check_move(const std::string& id, const std::string& new_parent_id) const {
    if (!contains(id)) return ZkStatus::NOT_FOUND;
    if (new_parent_id.empty()) {
        return subtree_height(id) > MAX_FOLDER_DEPTH ? ZkStatus::VALIDATION_FAILURE : ZkStatus::OK;
    }
    if (new_parent_id == id) return ZkStatus::VALIDATION_FAILURE;

    int parent_depth = depth_of(new_parent_id);
    if (parent_depth < 0) return ZkStatus::NOT_FOUND;

    // new parent must not sit below the folder being moved
    std::string cur = new_parent_id;
    for (int i = 0; i <= parent_depth && !cur.empty(); ++i) {
        if (cur == id) {
            audit_log_level(LogLevel::WARN,
                "Folder move would create a cycle",
                "folder_tree",
                "failure");
            return ZkStatus::VALIDATION_FAILURE;
        }
        cur = folders_.at(cur).parent_id;
    }

    if (parent_depth + subtree_height(id) > MAX_FOLDER_DEPTH) {
        audit_log_level(LogLevel::WARN,
            "Folder move exceeds nesting limit",
            "folder_tree",
            "failure");
        return ZkStatus::VALIDATION_FAILURE;
    }
    return ZkStatus::OK;
}

CascadePlan FolderTree::cascade_plan(const std::string& folder_id, bool inherit) const {
    CascadePlan plan;
    if (!inherit || !contains(folder_id)) return plan;

    // entities that already carry a password keep it
    for (const auto& n : notes_in(folder_id)) {
        if (!notes_.at(n).has_password) plan.note_ids.push_back(n);
    }
    for (const auto& f : descendant_folders(folder_id)) {
        if (!folders_.at(f).has_password) plan.folder_ids.push_back(f);
        for (const auto& n : notes_in(f)) {
            if (!notes_.at(n).has_password) plan.note_ids.push_back(n);
        }
    }
    return plan;
}

CascadePlan FolderTree::inherited_from(const std::string& folder_id) const {
    CascadePlan plan;
    if (!contains(folder_id)) return plan;

    for (const auto& n : notes_in(folder_id)) {
        if (notes_.at(n).source_folder_id == folder_id) plan.note_ids.push_back(n);
    }
    for (const auto& f : descendant_folders(folder_id)) {
        if (folders_.at(f).source_folder_id == folder_id) plan.folder_ids.push_back(f);
        for (const auto& n : notes_in(f)) {
            if (notes_.at(n).source_folder_id == folder_id) plan.note_ids.push_back(n);
        }
    }
    return plan;
}
