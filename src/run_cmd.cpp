#include "commands.hpp"
#include "engine.hpp"
#include "audit_log.hpp"
#include <iostream>

namespace skillgate {

void install_console_approver(SkillEngine& engine, bool auto_approve) {
    HookEntry entry;
    entry.name = "console-approval";
    entry.type = HookType::approval_requested;
    entry.priority = 1000;
    entry.callback = [&engine, auto_approve](const HookData& data) {
        std::string id = data.value("executionId", "");
        std::string title = data.value("title", "");
        std::cout << "\n[approval] " << title << " (" << id << ")\n"
                  << "  " << data.value("body", nlohmann::json::object()).dump() << "\n";

        bool approve = auto_approve;
        if (!auto_approve) {
            std::cout << "  Approve? [y/N] " << std::flush;
            std::string answer;
            if (!std::getline(std::cin, answer)) answer.clear();
            approve = answer == "y" || answer == "Y" || answer == "yes";
        } else {
            std::cout << "  auto-approved (--yes)\n";
        }

        if (approve) engine.approve_execution(id);
        else engine.deny_execution(id);
    };
    engine.hooks().register_hook(std::move(entry));
}

static void print_execution(const SkillExecution& exec) {
    std::cout << exec.id << " " << exec.skill_id << ": " << status_name(exec.status) << "\n";
    if (exec.error) {
        std::cout << "error: " << error_kind_name(exec.error->kind) << ": " << exec.error->message << "\n";
    }
    if (!exec.result) return;

    const auto& r = *exec.result;
    if (r.contains("stdout") || r.contains("stderr")) {
        std::cout << r.value("stdout", "");
        std::string err = r.value("stderr", "");
        if (!err.empty()) std::cerr << err;
        std::cout << "[exit code: " << r.value("exitCode", 0) << "]"
                  << (r.value("truncated", false) ? " (truncated)" : "") << "\n";
    } else {
        std::cout << r.dump(2) << "\n";
    }
}

int cmd_run(const std::string& config_path, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: skillgate run <skill> [--params JSON] [--yes]\n";
        return 1;
    }

    std::string skill_id = args[0];
    nlohmann::json params = nlohmann::json::object();
    bool yes = false;
    for (size_t i = 1; i < args.size(); i++) {
        if (args[i] == "--params" && i + 1 < args.size()) {
            try {
                params = nlohmann::json::parse(args[++i]);
            } catch (const nlohmann::json::parse_error& e) {
                std::cerr << "Invalid --params JSON: " << e.what() << "\n";
                return 1;
            }
        } else if (args[i] == "--yes" || args[i] == "-y") {
            yes = true;
        }
    }

    SkillEngine engine(Config::load(config_path));
    install_console_approver(engine, yes);

    SkillExecution exec = engine.execute_skill_and_wait(skill_id, params);
    print_execution(exec);
    return exec.status == ExecutionStatus::completed ? 0 : 1;
}

int cmd_history(const std::string& config_path, const std::vector<std::string>& args) {
    std::optional<std::string> skill;
    size_t limit = 20;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--skill" && i + 1 < args.size()) {
            skill = args[++i];
        } else if (args[i] == "--limit" && i + 1 < args.size()) {
            limit = static_cast<size_t>(std::stoul(args[++i]));
        }
    }

    Config cfg = Config::load(config_path);
    AuditLog audit(cfg.audit_db_path(), AuditLog::Access::reader);
    auto entries = audit.history(skill);
    if (entries.empty()) {
        std::cout << "No executions recorded.\n";
        return 0;
    }

    size_t start = entries.size() > limit ? entries.size() - limit : 0;
    for (size_t i = start; i < entries.size(); i++) {
        auto& e = entries[i];
        std::cout << "#" << e.seq << " " << iso8601_from_ms(e.completed_at) << " "
                  << e.execution_id << " " << e.skill_id << " "
                  << status_name(e.status) << " (approval: " << approval_state_name(e.approval) << ")";
        if (e.error) std::cout << " " << error_kind_name(e.error->kind) << ": " << e.error->message;
        std::cout << "\n";
    }
    return 0;
}

} // namespace skillgate
