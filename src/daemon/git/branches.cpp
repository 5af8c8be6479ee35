#include "git/branches.hpp"

#include "git/git_command.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace {

Result<GitOutput> checked(const std::string& repo, const std::vector<std::string>& args,
                          const std::string& operation) {
    auto res = git::run(repo, args);
    if (!res) return std::unexpected(Error::git(operation, res.error()));
    if (!res->ok()) return std::unexpected(Error::git(operation, res->diagnostic()));
    return *res;
}

} // namespace

namespace git {

bool is_valid_session_name(const std::string& name) {
    if (name.empty() || name.size() > 100) return false;

    auto first = static_cast<unsigned char>(name[0]);
    if (!std::isalnum(first) && name[0] != '_') return false;

    return std::ranges::all_of(name, [](char c) {
        auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) || c == '-' || c == '_' || c == '.';
    });
}

bool is_valid_branch_name(const std::string& name) {
    if (name.empty()) return false;
    if (name.find("..") != std::string::npos) return false;
    if (name.find('\0') != std::string::npos || name.find('\\') != std::string::npos) return false;

    return std::ranges::all_of(name, [](char c) {
        auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) || c == '/' || c == '-' || c == '_' || c == '.';
    });
}

Result<std::vector<std::string>> list_branches(const std::string& repo) {
    auto out = checked(repo, {"for-each-ref", "--format=%(refname)", "refs/heads", "refs/remotes"},
                       "list_branches");
    if (!out) return std::unexpected(out.error());

    std::vector<std::string> branches;
    for (const auto& ref : split_lines(out->out)) {
        std::string name;
        if (ref.starts_with("refs/heads/")) {
            name = ref.substr(std::string_view("refs/heads/").size());
        } else if (ref.starts_with("refs/remotes/")) {
            auto rest = ref.substr(std::string_view("refs/remotes/").size());
            auto slash = rest.find('/');
            if (slash == std::string::npos) continue;
            name = rest.substr(slash + 1);
        }
        if (name.empty() || name == "HEAD") continue;
        branches.push_back(std::move(name));
    }

    if (branches.empty()) {
        auto head = current_branch(repo);
        if (head && *head != "HEAD") branches.push_back(*head);
    }

    std::ranges::sort(branches);
    auto dup = std::ranges::unique(branches);
    branches.erase(dup.begin(), dup.end());
    return branches;
}

bool branch_exists(const std::string& repo, const std::string& branch) {
    if (branch.empty()) return false;
    auto res = run(repo, {"show-ref", "--verify", "--quiet", "refs/heads/" + branch});
    return res && res->ok();
}

Result<void> delete_branch(const std::string& repo, const std::string& branch) {
    auto out = checked(repo, {"branch", "-D", branch}, "delete_branch");
    if (!out) return std::unexpected(out.error());
    return {};
}

Result<void> rename_branch(const std::string& repo, const std::string& old_name,
                           const std::string& new_name) {
    if (!branch_exists(repo, old_name)) {
        return std::unexpected(Error::git("rename_branch",
                                          std::format("Branch '{}' does not exist", old_name)));
    }
    if (branch_exists(repo, new_name)) {
        return std::unexpected(Error::git("rename_branch",
                                          std::format("Branch '{}' already exists", new_name)));
    }
    auto out = checked(repo, {"branch", "-m", old_name, new_name}, "rename_branch");
    if (!out) return std::unexpected(out.error());
    return {};
}

Result<std::string> current_branch(const std::string& repo) {
    auto res = run(repo, {"symbolic-ref", "--quiet", "--short", "HEAD"});
    if (!res) return std::unexpected(Error::git("current_branch", res.error()));
    if (res->ok()) return res->first_line();
    if (res->exit_code == 1) return std::string("HEAD");
    return std::unexpected(Error::git("current_branch", res->diagnostic()));
}

Result<std::string> resolve_commit(const std::string& repo, const std::string& rev) {
    auto out = checked(repo, {"rev-parse", "--verify", "--quiet", rev + "^{commit}"},
                       "resolve_commit");
    if (!out) {
        return std::unexpected(Error::git("resolve_commit",
                                          std::format("Cannot resolve '{}' to a commit", rev)));
    }
    return out->first_line();
}

Result<void> ensure_branch_at_head(const std::string& repo, const std::string& branch) {
    auto checkout = [&]() -> Result<void> {
        auto out = checked(repo, {"checkout", "--force", branch}, "checkout");
        if (!out) return std::unexpected(out.error());
        return {};
    };

    if (branch_exists(repo, branch)) return checkout();

    auto head = resolve_commit(repo, "HEAD");
    if (!head) {
        return std::unexpected(Error::git("ensure_branch_at_head",
                                          "HEAD does not point to a commit; the repository has no commits"));
    }

    auto current = current_branch(repo);
    if (!current) return std::unexpected(current.error());

    if (*current != "HEAD" && *current != branch) {
        auto renamed = rename_branch(repo, *current, branch);
        if (!renamed) return renamed;
        return checkout();
    }

    auto created = checked(repo, {"branch", branch, *head}, "create_branch");
    if (!created) return std::unexpected(created.error());
    return checkout();
}

} // namespace git
