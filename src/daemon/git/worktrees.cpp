#include "git/worktrees.hpp"

#include "git/git_command.hpp"

#include <algorithm>
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace {

std::string canonical_or_self(const std::string& path) {
    std::error_code ec;
    auto p = fs::weakly_canonical(path, ec);
    return ec ? path : p.string();
}

bool is_internal_path(const std::string& path) {
    return path == ".schaltwerk" || path.starts_with(".schaltwerk/");
}

Result<bool> porcelain_has_entries(const std::string& worktree, bool include_untracked) {
    std::vector<std::string> args = {"status", "--porcelain"};
    args.push_back(include_untracked ? "--untracked-files=all" : "--untracked-files=no");

    auto res = git::run(worktree, args);
    if (!res) return std::unexpected(Error::git("status", res.error()));
    if (!res->ok()) return std::unexpected(Error::git("status", res->diagnostic()));

    for (const auto& line : git::split_lines(res->out)) {
        if (line.size() < 4) continue;
        auto path = line.substr(3);
        if (auto arrow = path.find(" -> "); arrow != std::string::npos) {
            path = path.substr(arrow + 4);
        }
        if (!is_internal_path(path)) return true;
    }
    return false;
}

} // namespace

namespace git {

Result<void> create_worktree_from_base(const std::string& repo, const std::string& branch,
                                       const std::string& path, const std::string& base) {
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) return std::unexpected(Error::io("create_directories", path, ec.message()));

    auto res = run(repo, {"worktree", "add", "-b", branch, path, base});
    if (!res) return std::unexpected(Error::git("worktree_add", res.error()));
    if (!res->ok()) return std::unexpected(Error::git("worktree_add", res->diagnostic()));
    return {};
}

Result<void> create_worktree_for_branch(const std::string& repo, const std::string& branch,
                                        const std::string& path) {
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) return std::unexpected(Error::io("create_directories", path, ec.message()));

    auto res = run(repo, {"worktree", "add", path, branch});
    if (!res) return std::unexpected(Error::git("worktree_add", res.error()));
    if (!res->ok()) return std::unexpected(Error::git("worktree_add", res->diagnostic()));
    return {};
}

Result<void> remove_worktree(const std::string& repo, const std::string& path) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        fs::remove_all(path, ec);
        if (ec) return std::unexpected(Error::io("remove_worktree", path, ec.message()));
    }
    return prune_worktrees(repo);
}

Result<void> prune_worktrees(const std::string& repo) {
    auto res = run(repo, {"worktree", "prune"});
    if (!res) return std::unexpected(Error::git("worktree_prune", res.error()));
    if (!res->ok()) return std::unexpected(Error::git("worktree_prune", res->diagnostic()));
    return {};
}

Result<std::vector<WorktreeInfo>> list_worktrees(const std::string& repo) {
    auto res = run(repo, {"worktree", "list", "--porcelain"});
    if (!res) return std::unexpected(Error::git("worktree_list", res.error()));
    if (!res->ok()) return std::unexpected(Error::git("worktree_list", res->diagnostic()));

    std::vector<WorktreeInfo> worktrees;
    for (const auto& line : split_lines(res->out)) {
        if (line.starts_with("worktree ")) {
            worktrees.push_back({.path = line.substr(9), .head = {}, .branch = {}});
        } else if (worktrees.empty()) {
            continue;
        } else if (line.starts_with("HEAD ")) {
            worktrees.back().head = line.substr(5);
        } else if (line.starts_with("branch refs/heads/")) {
            worktrees.back().branch = line.substr(std::string_view("branch refs/heads/").size());
        }
    }
    return worktrees;
}

bool is_worktree_registered(const std::string& repo, const std::string& path) {
    auto worktrees = list_worktrees(repo);
    if (!worktrees) return false;

    auto wanted = canonical_or_self(path);
    return std::ranges::any_of(*worktrees, [&](const WorktreeInfo& w) {
        return canonical_or_self(w.path) == wanted;
    });
}

Result<bool> has_uncommitted_changes(const std::string& worktree) {
    return porcelain_has_entries(worktree, true);
}

Result<bool> has_tracked_changes(const std::string& worktree) {
    return porcelain_has_entries(worktree, false);
}

} // namespace git
