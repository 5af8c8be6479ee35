#pragma once

#include "platform/process_inspector.hpp"

#include <string>
#include <vector>

class ProcfsInspector : public ProcessInspector {
public:
    bool is_running(int pid) const override;
    bool send_terminate(int pid) override;
    bool send_kill(int pid) override;
    std::optional<std::vector<std::string>> read_cmdline(int pid) const override;
    std::vector<int> pids_with_cwd_under(const std::string& dir) const override;

private:
    static char read_state(int pid);
    static std::string read_cwd(int pid);
    static std::vector<int> list_pids();
};
