#pragma once
#include "skill.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace skillgate {

enum class NodeKind { skill, start, end };

const char* node_kind_name(NodeKind k);
std::optional<NodeKind> parse_node_kind(const std::string& s);

enum class ConditionOp { eq, ne, gt, ge, lt, le, contains, truthy, falsy };

const char* condition_op_name(ConditionOp op);
std::optional<ConditionOp> parse_condition_op(const std::string& s);

// Predicate over a node result. `field` is a dotted path into the result
// object; empty means the whole result.
struct EdgeCondition {
    std::string field;
    ConditionOp op = ConditionOp::truthy;
    nlohmann::json value;

    bool evaluate(const nlohmann::json& result) const;

    nlohmann::json to_json() const;
    static EdgeCondition from_json(const nlohmann::json& j);
};

struct WorkflowNode {
    std::string id;
    NodeKind kind = NodeKind::skill;
    std::string skill_id;
    nlohmann::json parameters = nlohmann::json::object();   // may hold ${inputs.NAME}
    std::optional<ValueType> input_type;
    std::optional<ValueType> output_type;
    double x = 0;
    double y = 0;
};

struct WorkflowEdge {
    std::string id;
    std::string source;
    std::string target;
    std::optional<EdgeCondition> condition;
    std::optional<std::string> target_param;
    std::string source_field = "output";
};

struct Workflow {
    std::string id;
    std::string name;
    std::vector<WorkflowNode> nodes;
    std::vector<WorkflowEdge> edges;

    const WorkflowNode* find_node(const std::string& node_id) const;

    nlohmann::json to_json() const;
    // Throws SkillError(workflow_invalid) on malformed documents.
    static Workflow from_json(const nlohmann::json& j);
};

// Structural checks: ids present and unique, edges reference existing nodes,
// skill nodes name a skill. Throws SkillError(workflow_invalid).
void check_structure(const Workflow& wf);

bool json_truthy(const nlohmann::json& v);

// Looks up a dotted path ("a.b.c"); returns null when absent.
nlohmann::json json_field(const nlohmann::json& doc, const std::string& path);

// Replaces ${inputs.NAME} in every string of `params`. A string that is
// exactly one placeholder takes the input's JSON value unchanged.
nlohmann::json substitute_inputs(const nlohmann::json& params, const nlohmann::json& inputs);

} // namespace skillgate
