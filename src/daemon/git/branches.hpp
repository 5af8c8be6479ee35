#pragma once

#include "errors.hpp"

#include <string>
#include <vector>

namespace git {

bool is_valid_session_name(const std::string& name);
bool is_valid_branch_name(const std::string& name);

// Local and remote-tracking branch names with the remote prefix stripped,
// deduplicated and sorted. An unborn repository yields its unborn head name.
Result<std::vector<std::string>> list_branches(const std::string& repo);

// Invalid or unreadable refs count as "does not exist".
bool branch_exists(const std::string& repo, const std::string& branch);

Result<void> delete_branch(const std::string& repo, const std::string& branch);

// Fails if new_name already exists.
Result<void> rename_branch(const std::string& repo, const std::string& old_name,
                           const std::string& new_name);

// Name of the checked out branch, or "HEAD" when detached.
Result<std::string> current_branch(const std::string& repo);

Result<std::string> resolve_commit(const std::string& repo, const std::string& rev);

// Leaves repo checked out on branch, pointing at the pre-call HEAD commit.
Result<void> ensure_branch_at_head(const std::string& repo, const std::string& branch);

} // namespace git
