#pragma once

#include "errors.hpp"

#include <functional>
#include <string>

struct CloneRequest {
    std::string remote_url;
    std::string parent_directory;
    std::string folder_name;
};

struct CloneResult {
    std::string project_path;
    std::string remote_display;
    std::string remote_history;
};

struct SanitizedRemote {
    std::string display; // host/path, no credentials, no .git
    std::string history; // form safe to remember for later clones
};

using CloneProgress = std::function<void(const std::string&)>;

namespace git {

SanitizedRemote sanitize_remote(const std::string& url);

// Clones through the host git binary so that its progress output can be
// streamed line by line. The destination is removed if the clone fails.
Result<CloneResult> clone_repository(const CloneRequest& request, const CloneProgress& progress);

} // namespace git
