#include "workflow_engine.hpp"
#include "skill_registry.hpp"
#include "execution_pipeline.hpp"
#include "workflow_store.hpp"
#include "hooks.hpp"
#include <iostream>
#include <set>

namespace skillgate {

nlohmann::json WorkflowResult::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    j["executedNodes"] = executed_nodes;
    j["skippedNodes"] = skipped_nodes;
    j["failedNode"] = failed_node.empty() ? nlohmann::json(nullptr) : nlohmann::json(failed_node);
    if (error) j["error"] = error->to_json();
    if (cause) j["cause"] = cause->to_json();
    j["nodeResults"] = nlohmann::json::object();
    for (auto& [id, r] : node_results) {
        nlohmann::json rj = {{"status", status_name(r.status)}, {"result", r.result}};
        if (!r.execution_id.empty()) rj["executionId"] = r.execution_id;
        j["nodeResults"][id] = rj;
    }
    j["output"] = output;
    return j;
}

WorkflowEngine::WorkflowEngine(SkillRegistry& registry, ExecutionPipeline& pipeline,
                               WorkflowStore& store, const HookRunner* hooks)
    : registry_(registry), pipeline_(pipeline), store_(store), hooks_(hooks) {}

ValueType WorkflowEngine::source_type(const WorkflowNode& node) const {
    if (node.output_type) return *node.output_type;
    if (node.kind == NodeKind::skill && registry_.has(node.skill_id)) {
        return registry_.lookup(node.skill_id).output_type;
    }
    return ValueType::any;
}

ValueType WorkflowEngine::target_type(const WorkflowNode& node, const WorkflowEdge& edge) const {
    if (edge.target_param && node.kind == NodeKind::skill) {
        SkillDefinition def = registry_.lookup(node.skill_id);
        const SkillParameter* p = def.find_parameter(*edge.target_param);
        if (!p) {
            throw SkillError(ErrorKind::workflow_invalid,
                             "Edge '" + edge.id + "' targets unknown parameter '" + *edge.target_param +
                             "' of " + node.skill_id, edge.id);
        }
        return p->type.value_or(ValueType::any);
    }
    if (node.input_type) return *node.input_type;
    return ValueType::any;
}

std::vector<std::string> WorkflowEngine::order(const Workflow& wf) const {
    std::map<std::string, size_t> index;
    for (size_t i = 0; i < wf.nodes.size(); i++) index[wf.nodes[i].id] = i;

    std::vector<std::vector<size_t>> out_edges(wf.nodes.size());
    std::vector<int> in_degree(wf.nodes.size(), 0);
    for (auto& e : wf.edges) {
        size_t s = index.at(e.source), t = index.at(e.target);
        out_edges[s].push_back(t);
        in_degree[t]++;
    }

    // Kahn's algorithm; the ordered set releases the earliest inserted node first
    std::set<size_t> ready;
    for (size_t i = 0; i < wf.nodes.size(); i++) {
        if (in_degree[i] == 0) ready.insert(i);
    }
    std::vector<std::string> sorted;
    std::vector<bool> placed(wf.nodes.size(), false);
    while (!ready.empty()) {
        size_t n = *ready.begin();
        ready.erase(ready.begin());
        placed[n] = true;
        sorted.push_back(wf.nodes[n].id);
        for (size_t t : out_edges[n]) {
            if (--in_degree[t] == 0) ready.insert(t);
        }
    }

    if (sorted.size() == wf.nodes.size()) return sorted;

    // Peel off leftovers that only lead out of the cycle so the reported
    // node sits on one.
    std::vector<bool> remaining(wf.nodes.size());
    for (size_t i = 0; i < wf.nodes.size(); i++) remaining[i] = !placed[i];
    bool changed = true;
    while (changed) {
        changed = false;
        for (size_t i = 0; i < wf.nodes.size(); i++) {
            if (!remaining[i]) continue;
            bool leads_back = false;
            for (size_t t : out_edges[i]) {
                if (remaining[t]) { leads_back = true; break; }
            }
            if (!leads_back) {
                remaining[i] = false;
                changed = true;
            }
        }
    }
    for (size_t i = 0; i < wf.nodes.size(); i++) {
        if (remaining[i]) {
            throw SkillError(ErrorKind::cyclic_graph,
                             "Workflow '" + wf.id + "' contains a cycle through '" + wf.nodes[i].id + "'",
                             wf.nodes[i].id);
        }
    }
    throw SkillError(ErrorKind::cyclic_graph, "Workflow '" + wf.id + "' contains a cycle");
}

void WorkflowEngine::validate(const Workflow& wf) const {
    check_structure(wf);

    for (auto& n : wf.nodes) {
        if (n.kind == NodeKind::skill && !registry_.has(n.skill_id)) {
            throw SkillError(ErrorKind::skill_not_found,
                             "Node '" + n.id + "' uses unknown skill '" + n.skill_id + "'", n.id);
        }
    }

    order(wf);

    for (auto& e : wf.edges) {
        const WorkflowNode* src = wf.find_node(e.source);
        const WorkflowNode* dst = wf.find_node(e.target);
        ValueType from = source_type(*src);
        ValueType to = target_type(*dst, e);
        if (from != to && to != ValueType::any) {
            throw SkillError(ErrorKind::type_mismatch,
                             "Edge '" + e.id + "' connects " + value_type_name(from) +
                             " output to " + value_type_name(to) + " input", e.id);
        }
    }
}

WorkflowResult WorkflowEngine::execute(const std::string& workflow_id, const nlohmann::json& inputs) {
    return run(store_.get(workflow_id), inputs);
}

WorkflowResult WorkflowEngine::run(const Workflow& wf, const nlohmann::json& inputs) {
    validate(wf);
    std::vector<std::string> sequence = order(wf);
    nlohmann::json in = inputs.is_object() ? inputs : nlohmann::json::object();

    if (hooks_) hooks_->fire(HookType::workflow_start, {{"workflowId", wf.id}, {"inputs", in}});
    std::cerr << "[workflow] Running " << wf.id << " (" << sequence.size() << " nodes)\n";

    WorkflowResult res;
    std::map<std::string, nlohmann::json> results;
    std::string last_skill_node;
    bool has_end = false;

    for (auto& node_id : sequence) {
        const WorkflowNode* node = wf.find_node(node_id);

        std::vector<const WorkflowEdge*> incoming, live;
        for (auto& e : wf.edges) {
            if (e.target != node_id) continue;
            incoming.push_back(&e);
            auto src = results.find(e.source);
            if (src == results.end()) continue;
            if (!e.condition || e.condition->evaluate(src->second)) live.push_back(&e);
        }
        if (!incoming.empty() && live.empty()) {
            res.skipped_nodes.push_back(node_id);
            continue;
        }

        if (node->kind == NodeKind::start) {
            results[node_id] = in;
            res.node_results[node_id] = NodeResult{"", ExecutionStatus::completed, in};
            continue;
        }

        if (node->kind == NodeKind::end) {
            has_end = true;
            nlohmann::json collected = nlohmann::json::object();
            for (auto* e : live) {
                nlohmann::json v = json_field(results[e->source], e->source_field);
                collected[e->target_param ? *e->target_param : e->source] = v;
                res.output[e->target_param ? *e->target_param : e->source] = v;
            }
            results[node_id] = collected;
            res.node_results[node_id] = NodeResult{"", ExecutionStatus::completed, collected};
            continue;
        }

        nlohmann::json params = substitute_inputs(node->parameters, in);
        if (!params.is_object()) params = nlohmann::json::object();
        for (auto* e : live) {
            if (e->target_param) params[*e->target_param] = json_field(results[e->source], e->source_field);
        }

        res.executed_nodes.push_back(node_id);
        std::optional<ErrorInfo> failure;
        try {
            SkillExecution exec = pipeline_.execute(node->skill_id, params);
            res.node_results[node_id] = NodeResult{
                exec.id, exec.status, exec.result ? *exec.result : nlohmann::json(nullptr)};
            if (exec.status == ExecutionStatus::completed) {
                results[node_id] = exec.result ? *exec.result : nlohmann::json(nullptr);
                last_skill_node = node_id;
            } else {
                failure = exec.error ? *exec.error
                                     : ErrorInfo{ErrorKind::io_error, "Execution ended " +
                                                 std::string(status_name(exec.status)), exec.id};
            }
        } catch (const SkillError& e) {
            res.node_results[node_id] = NodeResult{"", ExecutionStatus::failed, nullptr};
            failure = e.info();
        }

        if (failure) {
            res.failed_node = node_id;
            res.cause = failure;
            res.error = ErrorInfo{ErrorKind::workflow_node_failed,
                                  "Node '" + node_id + "' failed: " + failure->message, node_id};
            std::cerr << "[workflow] " << wf.id << " halted at " << node_id << ": "
                      << error_kind_name(failure->kind) << "\n";
            break;
        }
    }

    res.success = res.failed_node.empty();
    if (res.success && !has_end && !last_skill_node.empty()) {
        res.output = results[last_skill_node];
    }

    if (hooks_) {
        nlohmann::json data = res.to_json();
        data["workflowId"] = wf.id;
        hooks_->fire(HookType::workflow_end, data);
    }
    return res;
}

} // namespace skillgate
