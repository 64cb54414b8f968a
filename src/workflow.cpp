#include "workflow.hpp"
#include <set>

namespace skillgate {

const char* node_kind_name(NodeKind k) {
    switch (k) {
        case NodeKind::skill: return "skill";
        case NodeKind::start: return "start";
        case NodeKind::end:   return "end";
    }
    return "skill";
}

std::optional<NodeKind> parse_node_kind(const std::string& s) {
    if (s == "skill") return NodeKind::skill;
    if (s == "start") return NodeKind::start;
    if (s == "end")   return NodeKind::end;
    return std::nullopt;
}

const char* condition_op_name(ConditionOp op) {
    switch (op) {
        case ConditionOp::eq:       return "eq";
        case ConditionOp::ne:       return "ne";
        case ConditionOp::gt:       return "gt";
        case ConditionOp::ge:       return "ge";
        case ConditionOp::lt:       return "lt";
        case ConditionOp::le:       return "le";
        case ConditionOp::contains: return "contains";
        case ConditionOp::truthy:   return "truthy";
        case ConditionOp::falsy:    return "falsy";
    }
    return "truthy";
}

std::optional<ConditionOp> parse_condition_op(const std::string& s) {
    if (s == "eq")       return ConditionOp::eq;
    if (s == "ne")       return ConditionOp::ne;
    if (s == "gt")       return ConditionOp::gt;
    if (s == "ge")       return ConditionOp::ge;
    if (s == "lt")       return ConditionOp::lt;
    if (s == "le")       return ConditionOp::le;
    if (s == "contains") return ConditionOp::contains;
    if (s == "truthy")   return ConditionOp::truthy;
    if (s == "falsy")    return ConditionOp::falsy;
    return std::nullopt;
}

bool json_truthy(const nlohmann::json& v) {
    if (v.is_null()) return false;
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>() != 0.0;
    if (v.is_string()) return !v.get<std::string>().empty();
    return !v.empty();
}

nlohmann::json json_field(const nlohmann::json& doc, const std::string& path) {
    if (path.empty()) return doc;
    const nlohmann::json* cur = &doc;
    size_t start = 0;
    while (start <= path.size()) {
        size_t dot = path.find('.', start);
        std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!cur->is_object() || !cur->contains(key)) return nullptr;
        cur = &(*cur)[key];
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return *cur;
}

// -1, 0, 1, or nullopt when the values are not ordered against each other
static std::optional<int> compare(const nlohmann::json& a, const nlohmann::json& b) {
    if (a.is_number() && b.is_number()) {
        double x = a.get<double>(), y = b.get<double>();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_string() && b.is_string()) {
        int c = a.get<std::string>().compare(b.get<std::string>());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    return std::nullopt;
}

bool EdgeCondition::evaluate(const nlohmann::json& result) const {
    nlohmann::json actual = json_field(result, field);
    switch (op) {
        case ConditionOp::eq: {
            auto c = compare(actual, value);
            return c ? *c == 0 : actual == value;
        }
        case ConditionOp::ne: {
            auto c = compare(actual, value);
            return c ? *c != 0 : actual != value;
        }
        case ConditionOp::gt: { auto c = compare(actual, value); return c && *c > 0; }
        case ConditionOp::ge: { auto c = compare(actual, value); return c && *c >= 0; }
        case ConditionOp::lt: { auto c = compare(actual, value); return c && *c < 0; }
        case ConditionOp::le: { auto c = compare(actual, value); return c && *c <= 0; }
        case ConditionOp::contains:
            if (actual.is_string() && value.is_string()) {
                return actual.get<std::string>().find(value.get<std::string>()) != std::string::npos;
            }
            if (actual.is_array()) {
                for (auto& el : actual) {
                    if (el == value) return true;
                }
                return false;
            }
            if (actual.is_object() && value.is_string()) {
                return actual.contains(value.get<std::string>());
            }
            return false;
        case ConditionOp::truthy: return json_truthy(actual);
        case ConditionOp::falsy:  return !json_truthy(actual);
    }
    return false;
}

nlohmann::json EdgeCondition::to_json() const {
    nlohmann::json j = {{"field", field}, {"op", condition_op_name(op)}};
    if (op != ConditionOp::truthy && op != ConditionOp::falsy) j["value"] = value;
    return j;
}

EdgeCondition EdgeCondition::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw SkillError(ErrorKind::workflow_invalid, "Edge condition must be an object", "condition");
    }
    EdgeCondition c;
    c.field = j.value("field", "");
    std::string op = j.value("op", "truthy");
    auto parsed = parse_condition_op(op);
    if (!parsed) {
        throw SkillError(ErrorKind::workflow_invalid, "Unknown condition operator '" + op + "'", "condition.op");
    }
    c.op = *parsed;
    if (j.contains("value")) c.value = j["value"];
    return c;
}

const WorkflowNode* Workflow::find_node(const std::string& node_id) const {
    for (auto& n : nodes) {
        if (n.id == node_id) return &n;
    }
    return nullptr;
}

nlohmann::json Workflow::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["nodes"] = nlohmann::json::array();
    for (auto& n : nodes) {
        nlohmann::json nj = {
            {"id", n.id},
            {"kind", node_kind_name(n.kind)},
            {"parameters", n.parameters},
            {"position", {{"x", n.x}, {"y", n.y}}}
        };
        if (!n.skill_id.empty()) nj["skillId"] = n.skill_id;
        if (n.input_type) nj["inputType"] = value_type_name(*n.input_type);
        if (n.output_type) nj["outputType"] = value_type_name(*n.output_type);
        j["nodes"].push_back(nj);
    }
    j["edges"] = nlohmann::json::array();
    for (auto& e : edges) {
        nlohmann::json ej = {{"id", e.id}, {"source", e.source}, {"target", e.target}};
        if (e.condition) ej["condition"] = e.condition->to_json();
        if (e.target_param) ej["targetParam"] = *e.target_param;
        if (e.source_field != "output") ej["sourceField"] = e.source_field;
        j["edges"].push_back(ej);
    }
    return j;
}

static std::optional<ValueType> optional_type(const nlohmann::json& j, const char* key,
                                              const std::string& ref) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    std::string name = j[key].is_string() ? j[key].get<std::string>() : "";
    auto t = parse_value_type(name);
    if (!t) {
        throw SkillError(ErrorKind::workflow_invalid, "Unknown type '" + name + "'", ref);
    }
    return t;
}

Workflow Workflow::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw SkillError(ErrorKind::workflow_invalid, "Workflow must be a JSON object");
    }
    Workflow wf;
    wf.id = j.value("id", "");
    wf.name = j.value("name", wf.id);

    if (j.contains("nodes") && j["nodes"].is_array()) {
        for (auto& nj : j["nodes"]) {
            if (!nj.is_object()) {
                throw SkillError(ErrorKind::workflow_invalid, "Workflow node must be an object", "nodes");
            }
            WorkflowNode n;
            n.id = nj.value("id", "");
            std::string kind = nj.value("kind", "skill");
            auto k = parse_node_kind(kind);
            if (!k) {
                throw SkillError(ErrorKind::workflow_invalid, "Unknown node kind '" + kind + "'", n.id);
            }
            n.kind = *k;
            n.skill_id = nj.value("skillId", "");
            if (nj.contains("parameters") && nj["parameters"].is_object()) n.parameters = nj["parameters"];
            n.input_type = optional_type(nj, "inputType", n.id);
            n.output_type = optional_type(nj, "outputType", n.id);
            if (nj.contains("position") && nj["position"].is_object()) {
                n.x = nj["position"].value("x", 0.0);
                n.y = nj["position"].value("y", 0.0);
            }
            wf.nodes.push_back(std::move(n));
        }
    }

    if (j.contains("edges") && j["edges"].is_array()) {
        for (auto& ej : j["edges"]) {
            if (!ej.is_object()) {
                throw SkillError(ErrorKind::workflow_invalid, "Workflow edge must be an object", "edges");
            }
            WorkflowEdge e;
            e.id = ej.value("id", "");
            e.source = ej.value("source", "");
            e.target = ej.value("target", "");
            if (ej.contains("condition") && !ej["condition"].is_null()) {
                try {
                    e.condition = EdgeCondition::from_json(ej["condition"]);
                } catch (const SkillError& err) {
                    throw SkillError(ErrorKind::workflow_invalid, err.what(), e.id);
                }
            }
            if (ej.contains("targetParam") && ej["targetParam"].is_string()) {
                e.target_param = ej["targetParam"].get<std::string>();
            }
            e.source_field = ej.value("sourceField", "output");
            wf.edges.push_back(std::move(e));
        }
    }
    return wf;
}

void check_structure(const Workflow& wf) {
    if (wf.id.empty()) {
        throw SkillError(ErrorKind::workflow_invalid, "Workflow id is empty", "id");
    }
    std::set<std::string> node_ids;
    for (auto& n : wf.nodes) {
        if (n.id.empty()) {
            throw SkillError(ErrorKind::workflow_invalid, "Workflow node with empty id", "nodes");
        }
        if (!node_ids.insert(n.id).second) {
            throw SkillError(ErrorKind::workflow_invalid, "Duplicate node id '" + n.id + "'", n.id);
        }
        if (n.kind == NodeKind::skill && n.skill_id.empty()) {
            throw SkillError(ErrorKind::workflow_invalid, "Skill node '" + n.id + "' has no skillId", n.id);
        }
    }
    std::set<std::string> edge_ids;
    for (auto& e : wf.edges) {
        if (e.id.empty()) {
            throw SkillError(ErrorKind::workflow_invalid, "Workflow edge with empty id", "edges");
        }
        if (!edge_ids.insert(e.id).second) {
            throw SkillError(ErrorKind::workflow_invalid, "Duplicate edge id '" + e.id + "'", e.id);
        }
        if (!node_ids.count(e.source) || !node_ids.count(e.target)) {
            throw SkillError(ErrorKind::workflow_invalid,
                             "Edge '" + e.id + "' references an unknown node", e.id);
        }
    }
}

static const std::string kInputPrefix = "${inputs.";

static nlohmann::json substitute_string(const std::string& s, const nlohmann::json& inputs) {
    // whole-string placeholder keeps the input's type
    if (s.size() > kInputPrefix.size() + 1 && s.compare(0, kInputPrefix.size(), kInputPrefix) == 0 &&
        s.back() == '}' && s.find('}') == s.size() - 1) {
        std::string name = s.substr(kInputPrefix.size(), s.size() - kInputPrefix.size() - 1);
        if (inputs.is_object() && inputs.contains(name)) return inputs[name];
        return nullptr;
    }

    std::string out;
    size_t pos = 0;
    while (true) {
        size_t open = s.find(kInputPrefix, pos);
        if (open == std::string::npos) break;
        size_t close = s.find('}', open);
        if (close == std::string::npos) break;
        out += s.substr(pos, open - pos);
        std::string name = s.substr(open + kInputPrefix.size(), close - open - kInputPrefix.size());
        if (inputs.is_object() && inputs.contains(name)) {
            const auto& v = inputs[name];
            out += v.is_string() ? v.get<std::string>() : v.dump();
        }
        pos = close + 1;
    }
    out += s.substr(pos);
    return out;
}

nlohmann::json substitute_inputs(const nlohmann::json& params, const nlohmann::json& inputs) {
    if (params.is_string()) return substitute_string(params.get<std::string>(), inputs);
    if (params.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto& [k, v] : params.items()) out[k] = substitute_inputs(v, inputs);
        return out;
    }
    if (params.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (auto& v : params) out.push_back(substitute_inputs(v, inputs));
        return out;
    }
    return params;
}

} // namespace skillgate
