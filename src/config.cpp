#include "config.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace skillgate {

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["workspace"] = workspace;
    j["audit_db"] = audit_db;
    j["workflows_dir"] = workflows_dir;
    j["skills_file"] = skills_file;
    j["command_timeout"] = command_timeout;
    j["max_command_timeout"] = max_command_timeout;
    j["max_output_bytes"] = max_output_bytes;
    j["approval_timeout"] = approval_timeout;
    j["retained_executions"] = retained_executions;

    if (!hooks.empty()) {
        j["hooks"] = nlohmann::json::array();
        for (auto& h : hooks) {
            nlohmann::json hj = {{"type", h.type}, {"command", h.command}};
            if (h.priority != 0) hj["priority"] = h.priority;
            j["hooks"].push_back(hj);
        }
    }
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;
    c.workspace = j.value("workspace", c.workspace);
    c.audit_db = j.value("audit_db", c.audit_db);
    c.workflows_dir = j.value("workflows_dir", c.workflows_dir);
    c.skills_file = j.value("skills_file", c.skills_file);
    c.command_timeout = j.value("command_timeout", c.command_timeout);
    c.max_command_timeout = j.value("max_command_timeout", c.max_command_timeout);
    c.max_output_bytes = j.value("max_output_bytes", c.max_output_bytes);
    c.approval_timeout = j.value("approval_timeout", c.approval_timeout);
    c.retained_executions = j.value("retained_executions", c.retained_executions);

    if (c.max_command_timeout < 1) c.max_command_timeout = 300;
    if (c.max_command_timeout > kMaxCommandTimeout) c.max_command_timeout = kMaxCommandTimeout;
    if (c.command_timeout < 1) c.command_timeout = 60;
    if (c.command_timeout > c.max_command_timeout) c.command_timeout = c.max_command_timeout;
    if (c.max_output_bytes < 1024) c.max_output_bytes = 1024;
    if (c.approval_timeout < 0) c.approval_timeout = 0;
    if (c.retained_executions < 1) c.retained_executions = 1;

    if (j.contains("hooks") && j["hooks"].is_array()) {
        for (auto& hj : j["hooks"]) {
            HookConfig h;
            h.type = hj.value("type", "");
            h.command = hj.value("command", "");
            h.priority = hj.value("priority", 0);
            if (h.type.empty() || h.command.empty()) {
                std::cerr << "[config] Ignoring hook without type or command\n";
                continue;
            }
            c.hooks.push_back(std::move(h));
        }
    }
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[config] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[config] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    if (!f) throw std::runtime_error("Cannot write config: " + path);
    f << to_json().dump(2) << std::endl;
}

} // namespace skillgate
