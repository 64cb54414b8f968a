#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace skillgate {

struct HookConfig {
    std::string type;     // HookType as string
    std::string command;  // shell command, receives the event JSON on stdin
    int priority = 0;
};

// Upper bound accepted for max_command_timeout (one day).
constexpr int kMaxCommandTimeout = 86400;

struct Config {
    std::string workspace = "~/.skillgate/workspace";  // base for relative skill paths
    std::string audit_db = "~/.skillgate/audit.db";    // ":memory:" keeps the log in-process
    std::string workflows_dir = "~/.skillgate/workflows"; // empty = no workflow persistence
    std::string skills_file = "~/.skillgate/skills.json"; // extra skill definitions

    int command_timeout = 60;       // seconds, default for run_terminal_command
    int max_command_timeout = 300;  // upper bound for per-call timeoutSeconds
    int max_output_bytes = 262144;  // per stream
    int approval_timeout = 600;     // seconds; 0 = wait for a decision indefinitely
    int retained_executions = 1000; // finished records kept in memory; older ones come from the audit log

    std::vector<HookConfig> hooks;

    std::string workspace_path() const { return expand_path(workspace); }
    std::string audit_db_path() const { return audit_db == ":memory:" ? audit_db : expand_path(audit_db); }
    std::string workflows_path() const { return expand_path(workflows_dir); }
    std::string skills_path() const { return expand_path(skills_file); }

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace skillgate
