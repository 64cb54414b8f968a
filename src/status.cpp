#include "commands.hpp"
#include "skill_registry.hpp"
#include "audit_log.hpp"
#include "workflow_store.hpp"
#include <iostream>

namespace skillgate {

int cmd_status(const std::string& config_path) {
    Config cfg = Config::load(config_path);
    std::string ws = cfg.workspace_path();

    std::cout << "=== skillgate status ===\n";
    std::cout << "Config path  : " << config_path << "\n";
    std::cout << "Workspace    : " << ws << (fs::exists(ws) ? "" : " (missing)") << "\n";
    std::cout << "Audit log    : " << cfg.audit_db_path() << "\n";
    std::cout << "Workflows    : " << (cfg.workflows_dir.empty() ? "(memory only)" : cfg.workflows_path()) << "\n";
    std::cout << "Skills file  : " << (cfg.skills_file.empty() ? "(none)" : cfg.skills_path()) << "\n";
    std::cout << "Cmd timeout  : " << cfg.command_timeout << "s (max " << cfg.max_command_timeout << "s)\n";
    std::cout << "Approval wait: ";
    if (cfg.approval_timeout > 0) std::cout << cfg.approval_timeout << "s\n";
    else std::cout << "unlimited\n";

    std::cout << "Hooks        : ";
    bool first = true;
    for (auto& h : cfg.hooks) {
        if (!first) std::cout << ", ";
        std::cout << h.type << " (" << h.command << ")";
        first = false;
    }
    if (first) std::cout << "(none)";
    std::cout << "\n";

    SkillRegistry registry;
    register_builtin_skills(registry);
    if (!cfg.skills_file.empty()) registry.load_file(cfg.skills_path());
    std::cout << "Skills       : " << registry.size() << "\n";

    if (!cfg.workflows_dir.empty()) {
        WorkflowStore store(cfg.workflows_path());
        std::cout << "Workflows    : " << store.list().size() << " saved\n";
    }

    // AuditLog on its own leaves pending markers in place
    AuditLog audit(cfg.audit_db_path(), AuditLog::Access::reader);
    std::cout << "Audit entries: " << audit.size() << "\n";
    return 0;
}

int cmd_skills(const std::string& config_path) {
    Config cfg = Config::load(config_path);
    SkillRegistry registry;
    register_builtin_skills(registry);
    if (!cfg.skills_file.empty()) registry.load_file(cfg.skills_path());
    for (auto& s : registry.list()) {
        std::cout << s.id;
        if (s.is_sensitive.value_or(false)) std::cout << " [approval required]";
        std::cout << "\n";
        if (!s.description.empty()) std::cout << "    " << s.description << "\n";
        for (auto& p : s.parameters) {
            std::cout << "    - " << p.name << ": "
                      << value_type_name(p.type.value_or(ValueType::any))
                      << (p.required ? "" : " (optional)") << "\n";
        }
    }
    return 0;
}

} // namespace skillgate
