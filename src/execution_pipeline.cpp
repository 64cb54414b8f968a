#include "execution_pipeline.hpp"
#include "skill_registry.hpp"
#include "sensitivity.hpp"
#include "approval_gate.hpp"
#include "actions/action_executor.hpp"
#include "audit_log.hpp"
#include "hooks.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>

namespace skillgate {

ExecutionPipeline::ExecutionPipeline(const Config& cfg, SkillRegistry& registry, ApprovalGate& gate,
                                     ActionExecutor& executor, AuditLog& audit,
                                     const HookRunner* hooks)
    : cfg_(cfg), registry_(registry), gate_(gate), executor_(executor),
      audit_(audit), hooks_(hooks) {}

ExecutionPipeline::~ExecutionPipeline() {
    shutdown();
}

SkillExecution ExecutionPipeline::submit(const std::string& skill_id, const nlohmann::json& params) {
    SkillDefinition def = registry_.lookup(skill_id);
    nlohmann::json args = params.is_null() ? nlohmann::json::object() : params;
    validate_parameters(def, args);

    bool gated = requires_approval(def);

    SkillExecution exec;
    exec.id = generate_execution_id();
    exec.skill_id = skill_id;
    exec.parameters = args;
    exec.submitted_at = epoch_ms_now();
    if (gated) {
        exec.status = ExecutionStatus::pending;
        exec.approval = ApprovalState::pending;
    } else {
        exec.status = ExecutionStatus::approved;
        exec.approval = ApprovalState::not_required;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Execution pipeline is shut down");
        }
        executions_[exec.id] = exec;
    }

    if (gated) {
        try {
            audit_.mark_pending(exec);
        } catch (const std::runtime_error& e) {
            std::cerr << "[pipeline] " << e.what() << "\n";
        }
        ApprovalRequest req;
        req.execution_id = exec.id;
        req.skill_id = skill_id;
        req.title = def.name.empty() ? skill_id : def.name;
        req.parameters = args;
        req.requested_at = exec.submitted_at;
        gate_.open(req);
    }

    bool stopped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prune_tasks();
        tasks_[exec.id] =
            std::async(std::launch::async, &ExecutionPipeline::run, this, exec, def, gated).share();
        stopped = stopping_;
    }

    // shutdown started after the first check; its deny_all may have run
    // before this request was opened
    if (stopped && gated && gate_.is_pending(exec.id)) {
        try {
            gate_.deny(exec.id);
        } catch (const SkillError& e) {
            std::cerr << "[pipeline] " << e.what() << "\n";
        }
    }
    return exec;
}

SkillExecution ExecutionPipeline::await(const std::string& execution_id) {
    std::shared_future<SkillExecution> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(execution_id);
        if (it != tasks_.end()) {
            task = it->second;
        } else {
            auto rec = executions_.find(execution_id);
            if (rec != executions_.end() && rec->second.terminal()) return rec->second;
        }
    }
    if (task.valid()) return task.get();

    if (auto entry = audit_.find(execution_id)) return entry->to_execution();
    throw SkillError(ErrorKind::execution_not_found,
                     "Unknown execution: " + execution_id, execution_id);
}

SkillExecution ExecutionPipeline::execute(const std::string& skill_id, const nlohmann::json& params) {
    return await(submit(skill_id, params).id);
}

std::optional<SkillExecution> ExecutionPipeline::get(const std::string& execution_id) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = executions_.find(execution_id);
        if (it != executions_.end()) return it->second;
    }
    if (auto entry = audit_.find(execution_id)) return entry->to_execution();
    return std::nullopt;
}

std::vector<SkillExecution> ExecutionPipeline::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SkillExecution> out;
    for (auto& [_, e] : executions_) out.push_back(e);
    return out;
}

void ExecutionPipeline::check_pending(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executions_.find(execution_id);
    if (it == executions_.end()) {
        if (audit_.contains(execution_id)) {
            throw SkillError(ErrorKind::already_decided,
                             "Execution " + execution_id + " is already finished", execution_id);
        }
        throw SkillError(ErrorKind::execution_not_found,
                         "Unknown execution: " + execution_id, execution_id);
    }
    if (it->second.approval != ApprovalState::pending) {
        throw SkillError(ErrorKind::already_decided,
                         "Execution " + execution_id + " is not awaiting approval", execution_id);
    }
}

void ExecutionPipeline::approve(const std::string& execution_id) {
    check_pending(execution_id);
    gate_.approve(execution_id);
}

void ExecutionPipeline::deny(const std::string& execution_id) {
    check_pending(execution_id);
    gate_.deny(execution_id);
}

void ExecutionPipeline::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }

    gate_.deny_all("shutting down");

    std::vector<std::shared_future<SkillExecution>> outstanding;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [_, t] : tasks_) outstanding.push_back(t);
    }
    for (auto& t : outstanding) t.wait();
}

void ExecutionPipeline::store(const SkillExecution& exec) {
    std::lock_guard<std::mutex> lock(mutex_);
    executions_[exec.id] = exec;
}

// Finished and audited: keep only the newest records in memory.
void ExecutionPipeline::retire(const std::string& execution_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_.push_back(execution_id);
    size_t keep = static_cast<size_t>(std::max(cfg_.retained_executions, 1));
    while (finished_.size() > keep) {
        executions_.erase(finished_.front());
        finished_.pop_front();
    }
}

// Caller holds mutex_. A ready future is dropped without blocking.
void ExecutionPipeline::prune_tasks() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

SkillExecution ExecutionPipeline::run(SkillExecution exec, SkillDefinition def, bool gated) {
    if (gated) {
        ApprovalDecision decision = ApprovalDecision::denied;
        try {
            decision = gate_.wait(exec.id, std::chrono::seconds(cfg_.approval_timeout));
        } catch (const SkillError& e) {
            std::cerr << "[pipeline] " << e.what() << "\n";
        }

        switch (decision) {
            case ApprovalDecision::approved:
                exec.status = ExecutionStatus::approved;
                exec.approval = ApprovalState::approved;
                break;
            case ApprovalDecision::timed_out:
                exec.status = ExecutionStatus::failed;
                exec.approval = ApprovalState::timed_out;
                exec.error = ErrorInfo{ErrorKind::approval_timed_out,
                                       "No approval decision within " +
                                       std::to_string(cfg_.approval_timeout) + "s", exec.id};
                break;
            case ApprovalDecision::denied:
            case ApprovalDecision::pending:
                exec.status = ExecutionStatus::failed;
                exec.approval = ApprovalState::denied;
                exec.error = ErrorInfo{ErrorKind::approval_denied,
                                       "Execution of " + exec.skill_id + " was denied", exec.id};
                break;
        }
        store(exec);
    }

    if (exec.status == ExecutionStatus::approved) {
        if (hooks_) {
            hooks_->fire(HookType::pre_execute, {
                {"executionId", exec.id},
                {"skillId", exec.skill_id},
                {"parameters", exec.parameters}
            });
        }
        try {
            exec.result = executor_.run(exec.skill_id, exec.parameters);
            exec.status = ExecutionStatus::completed;
        } catch (const SkillError& e) {
            exec.status = ExecutionStatus::failed;
            exec.error = e.info();
        } catch (const std::exception& e) {
            exec.status = ExecutionStatus::failed;
            exec.error = ErrorInfo{ErrorKind::io_error, e.what(), exec.skill_id};
        }
    }

    exec.completed_at = epoch_ms_now();
    store(exec);

    try {
        audit_.append(exec);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[pipeline] Audit append rejected: " << e.what() << "\n";
    }
    if (gated) gate_.forget(exec.id);
    retire(exec.id);

    if (exec.status == ExecutionStatus::failed && exec.error) {
        std::cerr << "[pipeline] " << exec.id << " failed: "
                  << error_kind_name(exec.error->kind) << ": " << exec.error->message << "\n";
    }
    if (hooks_) hooks_->fire(HookType::post_execute, exec.to_json());
    return exec;
}

} // namespace skillgate
