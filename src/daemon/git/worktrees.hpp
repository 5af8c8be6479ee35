#pragma once

#include "errors.hpp"

#include <string>
#include <vector>

struct WorktreeInfo {
    std::string path;
    std::string head;
    std::string branch; // empty when detached
};

namespace git {

// Creates branch from base and checks it out into a new worktree at path.
Result<void> create_worktree_from_base(const std::string& repo, const std::string& branch,
                                       const std::string& path, const std::string& base);

// Checks an existing branch out into a new worktree at path.
Result<void> create_worktree_for_branch(const std::string& repo, const std::string& branch,
                                        const std::string& path);

// Deletes the worktree directory, then prunes stale worktree metadata.
Result<void> remove_worktree(const std::string& repo, const std::string& path);

Result<void> prune_worktrees(const std::string& repo);

Result<std::vector<WorktreeInfo>> list_worktrees(const std::string& repo);

bool is_worktree_registered(const std::string& repo, const std::string& path);

// Porcelain status, ignoring schaltwerk's own bookkeeping directory.
Result<bool> has_uncommitted_changes(const std::string& worktree);

// Tracked changes only; untracked files do not block a reset of the checkout.
Result<bool> has_tracked_changes(const std::string& worktree);

} // namespace git
