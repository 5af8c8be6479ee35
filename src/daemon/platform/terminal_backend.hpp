#pragma once

#include "errors.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using EnvVars = std::vector<std::pair<std::string, std::string>>;

struct CreateTerminalParams {
    std::string id;
    std::string cwd;
    std::string command;
    std::vector<std::string> args;
    EnvVars env;
    uint16_t cols = 0;
    uint16_t rows = 0;
};

class TerminalBackend {
public:
    virtual ~TerminalBackend() = default;
    virtual Result<bool> terminal_exists(const std::string& id) = 0;
    // Closing an unknown id succeeds.
    virtual Result<void> close_terminal(const std::string& id) = 0;
    virtual Result<void> create_terminal_with_app(const std::string& id, const std::string& cwd,
                                                  const std::string& command,
                                                  const std::vector<std::string>& args,
                                                  const EnvVars& env) = 0;
    virtual Result<void> create_terminal_with_app_and_size(const CreateTerminalParams& params) = 0;
};
