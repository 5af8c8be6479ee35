#include "git/git_command.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

// Environment for child git processes: inherited, with prompts disabled and
// a stable locale so that messages stay parseable.
std::vector<std::string> child_environment() {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; e++) {
        std::string entry = *e;
        if (entry.starts_with("LC_ALL=") || entry.starts_with("GIT_TERMINAL_PROMPT=")) continue;
        env.push_back(std::move(entry));
    }
    env.emplace_back("LC_ALL=C");
    env.emplace_back("GIT_TERMINAL_PROMPT=0");
    return env;
}

std::vector<char*> to_cstrings(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

std::expected<int, std::string> wait_child(pid_t pid) {
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Forks and execs argv with stdout/stderr connected to the returned pipes.
std::expected<pid_t, std::string> spawn(std::vector<std::string> argv, int& out_fd, int& err_fd) {
    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    auto env = child_environment();
    auto c_argv = to_cstrings(argv);
    auto c_env = to_cstrings(env);

    pid_t pid = ::fork();
    if (pid < 0) {
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvpe(c_argv[0], c_argv.data(), c_env.data());
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    out_fd = out_pipe[0];
    err_fd = err_pipe[0];
    return pid;
}

// Drains both pipes until EOF. on_err_chunk receives stderr data as it arrives.
void drain(int out_fd, int err_fd, std::string& out,
           const std::function<void(const char*, size_t)>& on_err_chunk) {
    pollfd fds[2] = {
        {.fd = out_fd, .events = POLLIN, .revents = 0},
        {.fd = err_fd, .events = POLLIN, .revents = 0},
    };
    int open_count = 2;
    char buf[4096];

    while (open_count > 0) {
        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                open_count--;
                continue;
            }
            if (i == 0) out.append(buf, static_cast<size_t>(n));
            else on_err_chunk(buf, static_cast<size_t>(n));
        }
    }

    for (auto& p : fds) {
        if (p.fd >= 0) ::close(p.fd);
    }
}

} // namespace

std::string GitOutput::first_line() const {
    auto pos = out.find('\n');
    return git::trim(pos == std::string::npos ? out : out.substr(0, pos));
}

std::string GitOutput::diagnostic() const {
    auto msg = git::trim(err);
    if (msg.empty()) msg = git::trim(out);
    if (msg.empty()) msg = "git exited with code " + std::to_string(exit_code);
    return msg;
}

namespace git {

std::expected<GitOutput, std::string> run(const std::string& repo,
                                          const std::vector<std::string>& args) {
    std::vector<std::string> argv = {"git", "-c", "core.quotePath=false"};
    if (!repo.empty()) {
        argv.push_back("-C");
        argv.push_back(repo);
    }
    argv.insert(argv.end(), args.begin(), args.end());

    int out_fd = -1;
    int err_fd = -1;
    auto pid = spawn(std::move(argv), out_fd, err_fd);
    if (!pid) return std::unexpected(pid.error());

    GitOutput result;
    drain(out_fd, err_fd, result.out,
          [&result](const char* data, size_t n) { result.err.append(data, n); });

    auto code = wait_child(*pid);
    if (!code) return std::unexpected(code.error());
    result.exit_code = *code;
    return result;
}

std::expected<int, std::string> run_streaming(
    const std::vector<std::string>& args,
    const std::function<void(const std::string&)>& on_line) {
    std::vector<std::string> argv = {"git"};
    argv.insert(argv.end(), args.begin(), args.end());

    int out_fd = -1;
    int err_fd = -1;
    auto pid = spawn(std::move(argv), out_fd, err_fd);
    if (!pid) return std::unexpected(pid.error());

    std::string pending;
    std::string ignored_out;
    drain(out_fd, err_fd, ignored_out, [&](const char* data, size_t n) {
        for (size_t i = 0; i < n; i++) {
            char c = data[i];
            if (c == '\n' || c == '\r') {
                if (!pending.empty()) on_line(pending);
                pending.clear();
            } else {
                pending.push_back(c);
            }
        }
    });
    if (!pending.empty()) on_line(pending);

    return wait_child(*pid);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

std::string trim(const std::string& s) {
    constexpr const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace git
