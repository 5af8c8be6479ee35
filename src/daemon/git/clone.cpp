#include "git/clone.hpp"

#include "git/git_command.hpp"

#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace {

std::string strip_git_suffix(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    if (s.ends_with(".git")) s.resize(s.size() - 4);
    return s;
}

} // namespace

namespace git {

SanitizedRemote sanitize_remote(const std::string& url) {
    auto trimmed = trim(url);

    auto scheme_end = trimmed.find("://");
    if (scheme_end != std::string::npos) {
        auto scheme = trimmed.substr(0, scheme_end);
        auto rest = trimmed.substr(scheme_end + 3);

        auto slash = rest.find('/');
        auto authority = rest.substr(0, slash);
        auto path = slash == std::string::npos ? std::string() : rest.substr(slash);

        if (auto at = authority.rfind('@'); at != std::string::npos) {
            authority = authority.substr(at + 1);
        }

        return {
            .display = strip_git_suffix(authority + path),
            .history = scheme + "://" + authority + path,
        };
    }

    // scp-like ssh form: user@host:path
    auto at = trimmed.find('@');
    auto colon = trimmed.find(':');
    if (at != std::string::npos && colon != std::string::npos && at < colon) {
        auto host = trimmed.substr(at + 1, colon - at - 1);
        auto path = trimmed.substr(colon + 1);
        return {
            .display = strip_git_suffix(host + "/" + path),
            .history = "git@" + host + ":" + path,
        };
    }

    return {.display = strip_git_suffix(trimmed), .history = trimmed};
}

Result<CloneResult> clone_repository(const CloneRequest& request, const CloneProgress& progress) {
    auto folder = trim(request.folder_name);
    if (folder.empty()) {
        return std::unexpected(Error::invalid_input("folder_name", "Folder name cannot be empty"));
    }
    if (folder.find('/') != std::string::npos) {
        return std::unexpected(Error::invalid_input("folder_name",
                                                    "Folder name cannot contain path separators"));
    }
    if (trim(request.remote_url).empty()) {
        return std::unexpected(Error::invalid_input("remote_url", "Remote URL cannot be empty"));
    }

    std::error_code ec;
    if (!fs::is_directory(request.parent_directory, ec)) {
        return std::unexpected(Error::io("clone", request.parent_directory,
                                         "Parent directory does not exist"));
    }

    auto dest = fs::path(request.parent_directory) / folder;
    if (fs::exists(dest, ec)) {
        return std::unexpected(Error::io("clone", dest.string(), "Destination already exists"));
    }

    auto remote = sanitize_remote(request.remote_url);
    if (progress) progress(std::format("Cloning {} into {}", remote.display, dest.string()));

    auto code = run_streaming(
        {"clone", "--origin", "origin", "--progress", request.remote_url, dest.string()},
        [&progress](const std::string& line) {
            auto t = trim(line);
            if (!t.empty() && progress) progress(t);
        });

    if (!code || *code != 0) {
        fs::remove_all(dest, ec);
        auto message = code ? std::format("git clone exited with code {}", *code) : code.error();
        return std::unexpected(Error::git("clone", message));
    }

    return CloneResult{
        .project_path = dest.string(),
        .remote_display = remote.display,
        .remote_history = remote.history,
    };
}

} // namespace git
