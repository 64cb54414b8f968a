#pragma once
#include "skill.hpp"
#include "config.hpp"
#include <atomic>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace skillgate {

class SkillRegistry;
class ApprovalGate;
class ActionExecutor;
class AuditLog;
class HookRunner;

// Submission -> approval -> execution -> audit. Each execution runs on its
// own task; sensitive ones block on the gate first.
class ExecutionPipeline {
public:
    ExecutionPipeline(const Config& cfg, SkillRegistry& registry, ApprovalGate& gate,
                      ActionExecutor& executor, AuditLog& audit,
                      const HookRunner* hooks = nullptr);
    ~ExecutionPipeline();

    ExecutionPipeline(const ExecutionPipeline&) = delete;
    ExecutionPipeline& operator=(const ExecutionPipeline&) = delete;

    // Validates synchronously (SkillNotFound, ParameterInvalid) and returns the
    // initial record: Pending for sensitive skills, Approved otherwise.
    SkillExecution submit(const std::string& skill_id, const nlohmann::json& params);

    // Blocks until the execution is terminal. Finished executions no longer
    // held in memory are answered from the audit log. Rethrows
    // std::runtime_error when the terminal record could not be audited.
    SkillExecution await(const std::string& execution_id);

    SkillExecution execute(const std::string& skill_id, const nlohmann::json& params);

    std::optional<SkillExecution> get(const std::string& execution_id) const;
    std::vector<SkillExecution> list() const;

    // Throw SkillError(execution_not_found | already_decided).
    void approve(const std::string& execution_id);
    void deny(const std::string& execution_id);

    // Denies everything still waiting and joins outstanding tasks.
    void shutdown();

private:
    const Config& cfg_;
    SkillRegistry& registry_;
    ApprovalGate& gate_;
    ActionExecutor& executor_;
    AuditLog& audit_;
    const HookRunner* hooks_;

    mutable std::mutex mutex_;
    std::map<std::string, SkillExecution> executions_;
    std::deque<std::string> finished_;   // retirement order, oldest first
    std::atomic<bool> stopping_{false};
    // last: destroying an unfinished std::async future waits for its task,
    // which still touches the members above
    std::map<std::string, std::shared_future<SkillExecution>> tasks_;

    SkillExecution run(SkillExecution exec, SkillDefinition def, bool gated);
    void store(const SkillExecution& exec);
    void retire(const std::string& execution_id);
    void prune_tasks();
    void check_pending(const std::string& execution_id) const;
};

} // namespace skillgate
