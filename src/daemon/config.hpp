#pragma once

#include <cstdint>
#include <map>
#include <string>

struct AgentSettings {
    std::string binary; // empty: manifest default
    std::map<std::string, std::string> env;
    std::string cli_args; // shell-split and prepended to the launch args
};

struct Config {
    std::string repository;    // empty: current directory
    std::string base_branch;   // empty: detect from the repository
    std::string branch_prefix = "schaltwerk";
    std::string database;      // empty: <data_dir>/sessions.db
    std::string default_agent = "claude";
    bool skip_permissions = false;

    struct Stats {
        int64_t stale_after_seconds = 60;
    } stats;

    struct Launch {
        uint32_t timeout_seconds = 12;
    } launch;

    struct Merge {
        uint32_t timeout_seconds = 180;
    } merge;

    std::map<std::string, AgentSettings> agents;

    std::string database_path() const;

    static Config load(const std::string& path);
    static Config load_default();
};
