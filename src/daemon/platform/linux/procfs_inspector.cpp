#include "platform/linux/procfs_inspector.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <signal.h>

namespace fs = std::filesystem;

namespace {

// True when path equals dir or lies below it, compared component-wise.
bool is_within(const fs::path& path, const fs::path& dir) {
    auto [dir_end, path_it] = std::mismatch(dir.begin(), dir.end(), path.begin(), path.end());
    return dir_end == dir.end();
}

} // namespace

bool ProcfsInspector::is_running(int pid) const {
    if (pid <= 0) return false;
    if (::kill(pid, 0) != 0 && errno != EPERM) return false;
    // Zombies still answer kill(0) but are gone for our purposes.
    return read_state(pid) != 'Z';
}

bool ProcfsInspector::send_terminate(int pid) {
    return pid > 0 && ::kill(pid, SIGTERM) == 0;
}

bool ProcfsInspector::send_kill(int pid) {
    return pid > 0 && ::kill(pid, SIGKILL) == 0;
}

std::optional<std::vector<std::string>> ProcfsInspector::read_cmdline(int pid) const {
    std::ifstream f(std::format("/proc/{}/cmdline", pid), std::ios::binary);
    if (!f.is_open()) return std::nullopt;

    std::string raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    std::vector<std::string> args;
    size_t start = 0;
    while (start < raw.size()) {
        auto end = raw.find('\0', start);
        if (end == std::string::npos) end = raw.size();
        args.push_back(raw.substr(start, end - start));
        start = end + 1;
    }
    return args;
}

std::vector<int> ProcfsInspector::pids_with_cwd_under(const std::string& dir) const {
    std::error_code ec;
    auto root = fs::weakly_canonical(dir, ec);
    if (ec) root = fs::path(dir).lexically_normal();
    if (root.has_parent_path() && root.filename().empty()) root = root.parent_path();

    std::vector<int> matches;
    for (int pid : list_pids()) {
        auto cwd = read_cwd(pid);
        if (cwd.empty()) continue;
        if (is_within(fs::path(cwd), root)) matches.push_back(pid);
    }
    return matches;
}

char ProcfsInspector::read_state(int pid) {
    std::ifstream f(std::format("/proc/{}/stat", pid));
    if (!f.is_open()) return 0;
    std::string stat;
    std::getline(f, stat);
    // comm may contain spaces and parens; the state follows the last ')'.
    auto pos = stat.rfind(')');
    if (pos == std::string::npos || pos + 2 >= stat.size()) return 0;
    return stat[pos + 2];
}

std::string ProcfsInspector::read_cwd(int pid) {
    std::error_code ec;
    auto path = fs::read_symlink(std::format("/proc/{}/cwd", pid), ec);
    if (ec) return {};
    return path.string();
}

std::vector<int> ProcfsInspector::list_pids() {
    std::vector<int> pids;
    std::error_code ec;
    for (auto& entry : fs::directory_iterator("/proc", ec)) {
        auto name = entry.path().filename().string();
        int pid = 0;
        auto [ptr, err] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (err == std::errc() && ptr == name.data() + name.size() && pid > 0) {
            pids.push_back(pid);
        }
    }
    return pids;
}
