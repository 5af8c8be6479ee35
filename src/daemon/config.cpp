#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::database_path() const {
    if (!database.empty()) return database;
    auto data = platform::data_dir();
    if (data.empty()) return "/tmp/schaltwerk/sessions.db";
    return data + "/sessions.db";
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("repository")) cfg.repository = j["repository"].get<std::string>();
        if (j.contains("base_branch")) cfg.base_branch = j["base_branch"].get<std::string>();
        if (j.contains("branch_prefix")) cfg.branch_prefix = j["branch_prefix"].get<std::string>();
        if (j.contains("database")) cfg.database = j["database"].get<std::string>();
        if (j.contains("default_agent")) cfg.default_agent = j["default_agent"].get<std::string>();
        if (j.contains("skip_permissions")) cfg.skip_permissions = j["skip_permissions"].get<bool>();

        if (j.contains("stats")) {
            auto& s = j["stats"];
            if (s.contains("stale_after_seconds"))
                cfg.stats.stale_after_seconds = s["stale_after_seconds"].get<int64_t>();
        }

        if (j.contains("launch")) {
            auto& l = j["launch"];
            if (l.contains("timeout_seconds")) cfg.launch.timeout_seconds = l["timeout_seconds"].get<uint32_t>();
        }

        if (j.contains("merge")) {
            auto& m = j["merge"];
            if (m.contains("timeout_seconds")) cfg.merge.timeout_seconds = m["timeout_seconds"].get<uint32_t>();
        }

        if (j.contains("agents")) {
            for (auto& [id, a] : j["agents"].items()) {
                AgentSettings settings;
                if (a.contains("binary")) settings.binary = a["binary"].get<std::string>();
                if (a.contains("env")) settings.env = a["env"].get<std::map<std::string, std::string>>();
                if (a.contains("cli_args")) settings.cli_args = a["cli_args"].get<std::string>();
                cfg.agents[id] = std::move(settings);
            }
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
