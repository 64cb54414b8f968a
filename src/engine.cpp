#include "engine.hpp"
#include <iostream>
#include <stdexcept>

namespace skillgate {

static std::unique_ptr<ActionExecutor> make_executor(std::unique_ptr<ActionExecutor> given,
                                                     const Config& cfg) {
    if (given) return given;
    auto local = std::make_unique<LocalActionExecutor>();
    register_builtin_actions(*local, cfg);
    return local;
}

SkillEngine::SkillEngine(Config cfg, std::unique_ptr<ActionExecutor> executor)
    : config_(std::move(cfg)),
      audit_(config_.audit_db_path()),
      gate_(&hooks_),
      executor_(make_executor(std::move(executor), config_)),
      pipeline_(config_, registry_, gate_, *executor_, audit_, &hooks_),
      store_(config_.workflows_dir.empty() ? std::string() : config_.workflows_path()),
      workflows_(registry_, pipeline_, store_, &hooks_) {
    register_builtin_skills(registry_);
    if (!config_.skills_file.empty()) {
        size_t n = registry_.load_file(config_.skills_path());
        if (n > 0) std::cerr << "[registry] Loaded " << n << " skill(s) from " << config_.skills_path() << "\n";
    }
    register_config_hooks();

    audit_.recover_interrupted();
}

SkillEngine::~SkillEngine() {
    shutdown();
}

void SkillEngine::register_config_hooks() {
    for (auto& hc : config_.hooks) {
        auto type = parse_hook_type(hc.type);
        if (!type) {
            std::cerr << "[hook] Unknown hook type '" << hc.type << "', skipped\n";
            continue;
        }
        HookEntry entry;
        entry.name = hc.command;
        entry.type = *type;
        entry.priority = hc.priority;
        entry.callback = make_shell_hook(hc.command);
        hooks_.register_hook(std::move(entry));
    }
}

void SkillEngine::register_skill(SkillDefinition def) {
    registry_.register_skill(std::move(def));
}

void SkillEngine::update_skill(SkillDefinition def) {
    registry_.update_skill(std::move(def));
}

void SkillEngine::unregister_skill(const std::string& id) {
    registry_.unregister_skill(id);
}

std::vector<SkillDefinition> SkillEngine::list_skills() const {
    return registry_.list();
}

SkillDefinition SkillEngine::get_skill(const std::string& id) const {
    return registry_.lookup(id);
}

void SkillEngine::register_action(const std::string& skill_id, ActionHandler handler) {
    if (!registry_.has(skill_id)) {
        throw SkillError(ErrorKind::skill_not_found, "Unknown skill: " + skill_id, skill_id);
    }
    auto* local = dynamic_cast<LocalActionExecutor*>(executor_.get());
    if (!local) {
        throw std::runtime_error("Executor does not accept local handlers (skill " + skill_id + ")");
    }
    local->register_action(skill_id, std::move(handler));
}

std::string SkillEngine::execute_skill(const std::string& skill_id, const nlohmann::json& params) {
    return pipeline_.submit(skill_id, params).id;
}

SkillExecution SkillEngine::execute_skill_and_wait(const std::string& skill_id,
                                                   const nlohmann::json& params) {
    return pipeline_.execute(skill_id, params);
}

SkillExecution SkillEngine::await_execution(const std::string& execution_id) {
    return pipeline_.await(execution_id);
}

std::optional<SkillExecution> SkillEngine::get_execution(const std::string& execution_id) const {
    return pipeline_.get(execution_id);
}

void SkillEngine::approve_execution(const std::string& execution_id) {
    pipeline_.approve(execution_id);
}

void SkillEngine::deny_execution(const std::string& execution_id) {
    pipeline_.deny(execution_id);
}

std::vector<ApprovalRequest> SkillEngine::pending_approvals() const {
    return gate_.pending();
}

std::vector<AuditEntry> SkillEngine::get_execution_history(const std::optional<std::string>& skill_id) const {
    return audit_.history(skill_id);
}

void SkillEngine::save_workflow(const Workflow& wf) {
    store_.save(wf);
}

Workflow SkillEngine::get_workflow(const std::string& id) const {
    return store_.get(id);
}

std::vector<Workflow> SkillEngine::list_workflows() const {
    return store_.list();
}

bool SkillEngine::delete_workflow(const std::string& id) {
    return store_.remove(id);
}

void SkillEngine::validate_workflow(const Workflow& wf) const {
    workflows_.validate(wf);
}

WorkflowResult SkillEngine::execute_workflow(const std::string& workflow_id, const nlohmann::json& inputs) {
    return workflows_.execute(workflow_id, inputs);
}

void SkillEngine::shutdown() {
    pipeline_.shutdown();
}

} // namespace skillgate
