#include "git/stats.hpp"

#include "git/git_command.hpp"
#include "git/worktrees.hpp"

#include <filesystem>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

namespace {

constexpr size_t BINARY_PROBE_BYTES = 8000;

bool is_internal_path(const std::string& path) {
    return path == ".schaltwerk" || path.starts_with(".schaltwerk/");
}

// Number of lines in a text file, 0 for binary content.
int64_t count_file_lines(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return 0;

    int64_t lines = 0;
    size_t seen = 0;
    char last = '\n';
    char buf[4096];
    while (f.read(buf, sizeof(buf)) || f.gcount() > 0) {
        auto n = static_cast<size_t>(f.gcount());
        for (size_t i = 0; i < n; i++) {
            if (seen + i < BINARY_PROBE_BYTES && buf[i] == '\0') return 0;
            if (buf[i] == '\n') lines++;
        }
        seen += n;
        last = buf[n - 1];
    }
    if (seen > 0 && last != '\n') lines++;
    return lines;
}

} // namespace

namespace git {

Result<GitStats> calculate_git_stats(const std::string& worktree, const std::string& parent_branch) {
    std::error_code ec;
    if (!fs::exists(worktree, ec)) {
        return std::unexpected(Error::worktree_not_found(worktree));
    }

    std::string base = parent_branch;
    auto mb = run(worktree, {"merge-base", "HEAD", parent_branch});
    if (mb && mb->ok()) base = mb->first_line();

    auto diff = run(worktree, {"diff", "--numstat", base});
    if (!diff) return std::unexpected(Error::git("diff", diff.error()));
    if (!diff->ok()) return std::unexpected(Error::git("diff", diff->diagnostic()));

    GitStats stats;
    std::set<std::string> files;

    for (const auto& line : split_lines(diff->out)) {
        auto t1 = line.find('\t');
        if (t1 == std::string::npos) continue;
        auto t2 = line.find('\t', t1 + 1);
        if (t2 == std::string::npos) continue;

        auto path = line.substr(t2 + 1);
        if (is_internal_path(path)) continue;

        auto added = line.substr(0, t1);
        auto removed = line.substr(t1 + 1, t2 - t1 - 1);
        // Binary files report "-" for both counts.
        if (added != "-") stats.lines_added += std::stoll(added);
        if (removed != "-") stats.lines_removed += std::stoll(removed);
        files.insert(path);
    }

    auto untracked = run(worktree, {"ls-files", "--others", "--exclude-standard"});
    if (!untracked) return std::unexpected(Error::git("ls_files", untracked.error()));
    if (!untracked->ok()) return std::unexpected(Error::git("ls_files", untracked->diagnostic()));

    for (const auto& path : split_lines(untracked->out)) {
        if (is_internal_path(path)) continue;
        stats.lines_added += count_file_lines(fs::path(worktree) / path);
        files.insert(path);
    }

    auto dirty = has_uncommitted_changes(worktree);
    if (!dirty) return std::unexpected(dirty.error());

    stats.files_changed = static_cast<int64_t>(files.size());
    stats.has_uncommitted = *dirty;
    return stats;
}

} // namespace git
