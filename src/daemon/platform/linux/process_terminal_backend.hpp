#pragma once

#include "platform/process_inspector.hpp"
#include "platform/terminal_backend.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Runs each terminal's application as a detached child process whose
// output is appended to <log_dir>/<id>.log.
class ProcessTerminalBackend : public TerminalBackend {
public:
    ProcessTerminalBackend(ProcessInspector& inspector, std::string log_dir,
                           std::chrono::milliseconds close_grace = std::chrono::milliseconds(2000));
    ~ProcessTerminalBackend() override;

    ProcessTerminalBackend(const ProcessTerminalBackend&) = delete;
    ProcessTerminalBackend& operator=(const ProcessTerminalBackend&) = delete;

    Result<bool> terminal_exists(const std::string& id) override;
    Result<void> close_terminal(const std::string& id) override;
    Result<void> create_terminal_with_app(const std::string& id, const std::string& cwd,
                                          const std::string& command,
                                          const std::vector<std::string>& args,
                                          const EnvVars& env) override;
    Result<void> create_terminal_with_app_and_size(const CreateTerminalParams& params) override;

    std::vector<std::string> terminal_ids();
    std::optional<int> pid_of(const std::string& id);
    std::string log_path(const std::string& id) const;
    void close_all();

private:
    Result<int> spawn(const CreateTerminalParams& params);
    void reap_exited();
    bool wait_exit(int pid, std::chrono::milliseconds timeout);

    ProcessInspector& inspector_;
    std::string log_dir_;
    std::chrono::milliseconds close_grace_;

    std::mutex mu_;
    std::map<std::string, int> terminals_;
};
