#pragma once
#include "workflow.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace skillgate {

class SkillRegistry;
class ExecutionPipeline;
class WorkflowStore;
class HookRunner;

struct NodeResult {
    std::string execution_id;   // empty for start/end nodes
    ExecutionStatus status = ExecutionStatus::completed;
    nlohmann::json result;
};

struct WorkflowResult {
    bool success = false;
    std::vector<std::string> executed_nodes;   // skill nodes attempted, in run order
    std::vector<std::string> skipped_nodes;
    std::string failed_node;
    std::optional<ErrorInfo> error;
    std::optional<ErrorInfo> cause;
    std::map<std::string, NodeResult> node_results;
    nlohmann::json output = nlohmann::json::object();

    nlohmann::json to_json() const;
};

class WorkflowEngine {
public:
    WorkflowEngine(SkillRegistry& registry, ExecutionPipeline& pipeline,
                   WorkflowStore& store, const HookRunner* hooks = nullptr);

    // Throws SkillError: workflow_invalid, skill_not_found (ref = node id),
    // cyclic_graph (ref = node id), type_mismatch (ref = edge id).
    void validate(const Workflow& wf) const;

    // Topological order, ties broken by node insertion order.
    // Throws SkillError(cyclic_graph).
    std::vector<std::string> order(const Workflow& wf) const;

    // Throws SkillError(workflow_not_found) or any validation error; node
    // failures are reported in the result.
    WorkflowResult execute(const std::string& workflow_id, const nlohmann::json& inputs);
    WorkflowResult run(const Workflow& wf, const nlohmann::json& inputs);

private:
    SkillRegistry& registry_;
    ExecutionPipeline& pipeline_;
    WorkflowStore& store_;
    const HookRunner* hooks_;

    ValueType source_type(const WorkflowNode& node) const;
    ValueType target_type(const WorkflowNode& node, const WorkflowEdge& edge) const;
};

} // namespace skillgate
