#pragma once

#include <optional>
#include <string>
#include <vector>

class ProcessInspector {
public:
    virtual ~ProcessInspector() = default;
    virtual bool is_running(int pid) const = 0;
    virtual bool send_terminate(int pid) = 0;
    virtual bool send_kill(int pid) = 0;
    virtual std::optional<std::vector<std::string>> read_cmdline(int pid) const = 0;
    // Processes whose working directory is dir or lies below it.
    virtual std::vector<int> pids_with_cwd_under(const std::string& dir) const = 0;
};
