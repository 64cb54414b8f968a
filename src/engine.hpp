#pragma once
#include "config.hpp"
#include "hooks.hpp"
#include "skill_registry.hpp"
#include "audit_log.hpp"
#include "approval_gate.hpp"
#include "actions/action_executor.hpp"
#include "execution_pipeline.hpp"
#include "workflow_store.hpp"
#include "workflow_engine.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace skillgate {

// Owns every component; the only entry point for callers.
class SkillEngine {
public:
    // `executor` replaces the built-in local actions when given.
    explicit SkillEngine(Config cfg, std::unique_ptr<ActionExecutor> executor = nullptr);
    ~SkillEngine();

    SkillEngine(const SkillEngine&) = delete;
    SkillEngine& operator=(const SkillEngine&) = delete;

    // Skills
    void register_skill(SkillDefinition def);
    void update_skill(SkillDefinition def);
    void unregister_skill(const std::string& id);
    std::vector<SkillDefinition> list_skills() const;
    SkillDefinition get_skill(const std::string& id) const;

    // Attaches the handler that runs a registered skill. Throws
    // SkillError(skill_not_found) for an unknown id and std::runtime_error
    // when the engine was given an executor that is not a LocalActionExecutor.
    void register_action(const std::string& skill_id, ActionHandler handler);

    // Executions
    std::string execute_skill(const std::string& skill_id, const nlohmann::json& params);
    SkillExecution execute_skill_and_wait(const std::string& skill_id, const nlohmann::json& params);
    SkillExecution await_execution(const std::string& execution_id);
    std::optional<SkillExecution> get_execution(const std::string& execution_id) const;
    void approve_execution(const std::string& execution_id);
    void deny_execution(const std::string& execution_id);
    std::vector<ApprovalRequest> pending_approvals() const;
    std::vector<AuditEntry> get_execution_history(
        const std::optional<std::string>& skill_id = std::nullopt) const;

    // Workflows
    void save_workflow(const Workflow& wf);
    Workflow get_workflow(const std::string& id) const;
    std::vector<Workflow> list_workflows() const;
    bool delete_workflow(const std::string& id);
    void validate_workflow(const Workflow& wf) const;
    WorkflowResult execute_workflow(const std::string& workflow_id, const nlohmann::json& inputs);

    void shutdown();

    const Config& config() const { return config_; }
    HookRunner& hooks() { return hooks_; }

private:
    Config config_;
    HookRunner hooks_;
    SkillRegistry registry_;
    AuditLog audit_;
    ApprovalGate gate_;
    std::unique_ptr<ActionExecutor> executor_;
    ExecutionPipeline pipeline_;
    WorkflowStore store_;
    WorkflowEngine workflows_;

    void register_config_hooks();
};

} // namespace skillgate
