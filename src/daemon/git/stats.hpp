#pragma once

#include "errors.hpp"

#include <cstdint>
#include <string>

struct GitStats {
    std::string session_id;
    int64_t files_changed = 0;
    int64_t lines_added = 0;
    int64_t lines_removed = 0;
    bool has_uncommitted = false;
    int64_t calculated_at = 0; // unix seconds
};

namespace git {

// Line counts of the worktree (committed, staged, unstaged and untracked)
// relative to its merge base with parent_branch. session_id and
// calculated_at are left for the caller to fill in.
Result<GitStats> calculate_git_stats(const std::string& worktree, const std::string& parent_branch);

} // namespace git
