#include "skill.hpp"
#include "utils.hpp"

namespace skillgate {

const char* value_type_name(ValueType t) {
    switch (t) {
        case ValueType::string:  return "string";
        case ValueType::number:  return "number";
        case ValueType::boolean: return "boolean";
        case ValueType::path:    return "path";
        case ValueType::any:     return "any";
    }
    return "any";
}

std::optional<ValueType> parse_value_type(const std::string& s) {
    if (s == "string")  return ValueType::string;
    if (s == "number")  return ValueType::number;
    if (s == "boolean") return ValueType::boolean;
    if (s == "path")    return ValueType::path;
    if (s == "any")     return ValueType::any;
    return std::nullopt;
}

bool value_matches(ValueType t, const nlohmann::json& v) {
    switch (t) {
        case ValueType::string:  return v.is_string();
        case ValueType::number:  return v.is_number();
        case ValueType::boolean: return v.is_boolean();
        case ValueType::path:    return v.is_string() && !v.get<std::string>().empty();
        case ValueType::any:     return true;
    }
    return false;
}

const SkillParameter* SkillDefinition::find_parameter(const std::string& param) const {
    for (auto& p : parameters) {
        if (p.name == param) return &p;
    }
    return nullptr;
}

nlohmann::json SkillDefinition::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["description"] = description;
    j["category"] = category;
    j["parameters"] = nlohmann::json::array();
    for (auto& p : parameters) {
        nlohmann::json pj = {{"name", p.name}, {"required", p.required}};
        if (p.type) pj["type"] = value_type_name(*p.type);
        if (!p.description.empty()) pj["description"] = p.description;
        j["parameters"].push_back(pj);
    }
    if (is_sensitive) j["isSensitive"] = *is_sensitive;
    j["outputType"] = value_type_name(output_type);
    return j;
}

SkillDefinition SkillDefinition::from_json(const nlohmann::json& j) {
    SkillDefinition d;
    d.id = j.value("id", "");
    d.name = j.value("name", d.id);
    d.description = j.value("description", "");
    d.category = j.value("category", "");
    if (j.contains("isSensitive") && j["isSensitive"].is_boolean()) {
        d.is_sensitive = j["isSensitive"].get<bool>();
    }
    if (j.contains("outputType")) {
        auto t = parse_value_type(j.value("outputType", ""));
        if (!t) {
            throw SkillError(ErrorKind::signature_invalid,
                             "Unknown output type for skill '" + d.id + "'", "outputType");
        }
        d.output_type = *t;
    }
    if (j.contains("parameters") && j["parameters"].is_array()) {
        size_t i = 0;
        for (auto& pj : j["parameters"]) {
            SkillParameter p;
            p.name = pj.value("name", "");
            p.required = pj.value("required", true);
            p.description = pj.value("description", "");
            if (pj.contains("type")) {
                std::string tn = pj.value("type", "");
                p.type = parse_value_type(tn);
                if (!p.type) {
                    throw SkillError(ErrorKind::signature_invalid,
                                     "Unknown parameter type '" + tn + "'",
                                     "parameters[" + std::to_string(i) + "].type");
                }
            }
            d.parameters.push_back(std::move(p));
            ++i;
        }
    }
    return d;
}

const char* status_name(ExecutionStatus s) {
    switch (s) {
        case ExecutionStatus::pending:   return "Pending";
        case ExecutionStatus::approved:  return "Approved";
        case ExecutionStatus::denied:    return "Denied";
        case ExecutionStatus::completed: return "Completed";
        case ExecutionStatus::failed:    return "Failed";
    }
    return "Failed";
}

ExecutionStatus parse_status(const std::string& s) {
    if (s == "Pending")   return ExecutionStatus::pending;
    if (s == "Approved")  return ExecutionStatus::approved;
    if (s == "Denied")    return ExecutionStatus::denied;
    if (s == "Completed") return ExecutionStatus::completed;
    return ExecutionStatus::failed;
}

const char* approval_state_name(ApprovalState s) {
    switch (s) {
        case ApprovalState::not_required: return "not_required";
        case ApprovalState::pending:      return "pending";
        case ApprovalState::approved:     return "approved";
        case ApprovalState::denied:       return "denied";
        case ApprovalState::timed_out:    return "timed_out";
    }
    return "not_required";
}

ApprovalState parse_approval_state(const std::string& s) {
    if (s == "pending")   return ApprovalState::pending;
    if (s == "approved")  return ApprovalState::approved;
    if (s == "denied")    return ApprovalState::denied;
    if (s == "timed_out") return ApprovalState::timed_out;
    return ApprovalState::not_required;
}

nlohmann::json SkillExecution::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["skillId"] = skill_id;
    j["parameters"] = parameters;
    j["status"] = status_name(status);
    j["approval"] = approval_state_name(approval);
    if (result) j["result"] = *result;
    if (error) j["error"] = error->to_json();
    j["submittedAt"] = iso8601_from_ms(submitted_at);
    if (completed_at > 0) j["completedAt"] = iso8601_from_ms(completed_at);
    return j;
}

void validate_parameters(const SkillDefinition& def, const nlohmann::json& params) {
    if (!params.is_null() && !params.is_object()) {
        throw SkillError(ErrorKind::parameter_invalid,
                         "Parameters for '" + def.id + "' must be an object", "parameters");
    }

    for (auto& p : def.parameters) {
        bool present = params.is_object() && params.contains(p.name) && !params[p.name].is_null();
        if (!present) {
            if (p.required) {
                throw SkillError(ErrorKind::parameter_invalid,
                                 "Missing required parameter '" + p.name + "' for '" + def.id + "'",
                                 p.name);
            }
            continue;
        }
        ValueType t = p.type.value_or(ValueType::any);
        if (!value_matches(t, params[p.name])) {
            throw SkillError(ErrorKind::parameter_invalid,
                             "Parameter '" + p.name + "' must be of type " + value_type_name(t),
                             p.name);
        }
    }

    if (params.is_object()) {
        for (auto& [key, _] : params.items()) {
            if (!def.find_parameter(key)) {
                throw SkillError(ErrorKind::parameter_invalid,
                                 "Unknown parameter '" + key + "' for '" + def.id + "'", key);
            }
        }
    }
}

} // namespace skillgate
