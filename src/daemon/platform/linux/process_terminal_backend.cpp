#include "platform/linux/process_terminal_backend.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <print>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace fs = std::filesystem;

namespace {

std::vector<char*> to_cstrings(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

// Inherited environment with overrides applied; later entries win.
std::vector<std::string> merged_environment(const EnvVars& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; e++) {
        std::string entry = *e;
        auto eq = entry.find('=');
        auto key = entry.substr(0, eq);
        bool overridden = std::ranges::any_of(overrides, [&](const auto& kv) { return kv.first == key; });
        if (!overridden) env.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overrides) env.push_back(key + "=" + value);
    return env;
}

std::string file_safe(const std::string& id) {
    std::string out = id;
    for (char& c : out) {
        if (c == '/' || c == '\0') c = '_';
    }
    return out;
}

} // namespace

ProcessTerminalBackend::ProcessTerminalBackend(ProcessInspector& inspector, std::string log_dir,
                                               std::chrono::milliseconds close_grace)
    : inspector_(inspector), log_dir_(std::move(log_dir)), close_grace_(close_grace) {}

ProcessTerminalBackend::~ProcessTerminalBackend() {
    close_all();
}

Result<bool> ProcessTerminalBackend::terminal_exists(const std::string& id) {
    reap_exited();
    std::lock_guard lock(mu_);
    return terminals_.contains(id);
}

Result<void> ProcessTerminalBackend::close_terminal(const std::string& id) {
    int pid;
    {
        std::lock_guard lock(mu_);
        auto it = terminals_.find(id);
        if (it == terminals_.end()) return {};
        pid = it->second;
        terminals_.erase(it);
    }

    if (inspector_.send_terminate(pid) && wait_exit(pid, close_grace_)) return {};

    if (inspector_.is_running(pid) && !inspector_.send_kill(pid)) {
        return std::unexpected(Error::terminal(id, "close", std::format(
            "Failed to kill process {}: {}", pid, std::strerror(errno))));
    }
    // Collect the exit status so no zombie is left behind.
    while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
    return {};
}

Result<void> ProcessTerminalBackend::create_terminal_with_app(const std::string& id, const std::string& cwd,
                                                              const std::string& command,
                                                              const std::vector<std::string>& args,
                                                              const EnvVars& env) {
    return create_terminal_with_app_and_size({
        .id = id,
        .cwd = cwd,
        .command = command,
        .args = args,
        .env = env,
    });
}

Result<void> ProcessTerminalBackend::create_terminal_with_app_and_size(const CreateTerminalParams& params) {
    if (params.id.empty()) {
        return std::unexpected(Error::invalid_input("terminal_id", "Terminal id cannot be empty"));
    }

    reap_exited();
    {
        std::lock_guard lock(mu_);
        if (terminals_.contains(params.id)) {
            return std::unexpected(Error::terminal(params.id, "create", "Terminal already exists"));
        }
    }

    auto pid = spawn(params);
    if (!pid) return std::unexpected(pid.error());

    std::lock_guard lock(mu_);
    terminals_[params.id] = *pid;
    return {};
}

std::vector<std::string> ProcessTerminalBackend::terminal_ids() {
    reap_exited();
    std::lock_guard lock(mu_);
    std::vector<std::string> ids;
    for (const auto& [id, pid] : terminals_) ids.push_back(id);
    return ids;
}

std::optional<int> ProcessTerminalBackend::pid_of(const std::string& id) {
    std::lock_guard lock(mu_);
    auto it = terminals_.find(id);
    if (it == terminals_.end()) return std::nullopt;
    return it->second;
}

std::string ProcessTerminalBackend::log_path(const std::string& id) const {
    return (fs::path(log_dir_) / (file_safe(id) + ".log")).string();
}

void ProcessTerminalBackend::close_all() {
    for (const auto& id : terminal_ids()) {
        auto closed = close_terminal(id);
        if (!closed) std::println(stderr, "terminal: {}", closed.error().to_string());
    }
}

Result<int> ProcessTerminalBackend::spawn(const CreateTerminalParams& params) {
    std::error_code ec;
    fs::create_directories(log_dir_, ec);
    if (ec) return std::unexpected(Error::io("create_log_dir", log_dir_, ec.message()));

    auto path = log_path(params.id);
    int log_fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (log_fd < 0) return std::unexpected(Error::io("open_terminal_log", path, std::strerror(errno)));

    EnvVars env = params.env;
    if (params.cols > 0 && params.rows > 0) {
        env.emplace_back("COLUMNS", std::to_string(params.cols));
        env.emplace_back("LINES", std::to_string(params.rows));
    }

    std::vector<std::string> argv = {params.command};
    argv.insert(argv.end(), params.args.begin(), params.args.end());
    auto envp = merged_environment(env);
    auto c_argv = to_cstrings(argv);
    auto c_env = to_cstrings(envp);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(log_fd);
        return std::unexpected(Error::terminal(params.id, "spawn", std::strerror(errno)));
    }

    if (pid == 0) {
        ::setsid();
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(log_fd, STDOUT_FILENO);
        ::dup2(log_fd, STDERR_FILENO);
        if (!params.cwd.empty() && ::chdir(params.cwd.c_str()) < 0) ::_exit(126);
        ::execvpe(c_argv[0], c_argv.data(), c_env.data());
        ::_exit(127);
    }

    ::close(log_fd);
    return pid;
}

void ProcessTerminalBackend::reap_exited() {
    std::lock_guard lock(mu_);
    std::erase_if(terminals_, [](const auto& entry) {
        int status;
        pid_t r = ::waitpid(entry.second, &status, WNOHANG);
        return r == entry.second || (r < 0 && errno == ECHILD);
    });
}

bool ProcessTerminalBackend::wait_exit(int pid, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        pid_t r = ::waitpid(pid, nullptr, WNOHANG);
        if (r == pid || (r < 0 && errno == ECHILD)) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}
