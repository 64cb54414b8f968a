#pragma once
#include "errors.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace skillgate {

// Skill parameters use string..path; `any` only appears in workflow typing.
enum class ValueType { string, number, boolean, path, any };

const char* value_type_name(ValueType t);
std::optional<ValueType> parse_value_type(const std::string& s);
bool value_matches(ValueType t, const nlohmann::json& v);

struct SkillParameter {
    std::string name;
    std::optional<ValueType> type;
    bool required = true;
    std::string description;
};

struct SkillDefinition {
    std::string id;
    std::string name;
    std::string description;
    std::string category;
    std::vector<SkillParameter> parameters;
    std::optional<bool> is_sensitive;
    ValueType output_type = ValueType::any;

    const SkillParameter* find_parameter(const std::string& param) const;

    nlohmann::json to_json() const;
    // Throws SkillError(signature_invalid) on an unknown type name.
    static SkillDefinition from_json(const nlohmann::json& j);
};

enum class ExecutionStatus { pending, approved, denied, completed, failed };

enum class ApprovalState { not_required, pending, approved, denied, timed_out };

const char* status_name(ExecutionStatus s);
ExecutionStatus parse_status(const std::string& s);
const char* approval_state_name(ApprovalState s);
ApprovalState parse_approval_state(const std::string& s);

struct SkillExecution {
    std::string id;
    std::string skill_id;
    nlohmann::json parameters = nlohmann::json::object();
    ExecutionStatus status = ExecutionStatus::pending;
    ApprovalState approval = ApprovalState::not_required;
    std::optional<nlohmann::json> result;
    std::optional<ErrorInfo> error;
    int64_t submitted_at = 0;   // epoch ms
    int64_t completed_at = 0;

    bool terminal() const {
        return status == ExecutionStatus::completed || status == ExecutionStatus::failed;
    }

    nlohmann::json to_json() const;
};

// Required parameters present, types match, no unknown names.
// Throws SkillError(parameter_invalid) with the parameter name as ref.
void validate_parameters(const SkillDefinition& def, const nlohmann::json& params);

} // namespace skillgate
