#pragma once
#include "skill.hpp"
#include <set>
#include <string>

namespace skillgate {

// Built-ins that always require approval, whatever their registration says.
const std::set<std::string>& reserved_sensitive_skills();

bool is_reserved_sensitive(const std::string& skill_id);

bool requires_approval(const SkillDefinition& def);

} // namespace skillgate
