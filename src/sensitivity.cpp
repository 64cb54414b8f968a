#include "sensitivity.hpp"

namespace skillgate {

const std::set<std::string>& reserved_sensitive_skills() {
    static const std::set<std::string> reserved = {
        "run_terminal_command", "write_file", "delete_file"
    };
    return reserved;
}

bool is_reserved_sensitive(const std::string& skill_id) {
    return reserved_sensitive_skills().count(skill_id) > 0;
}

bool requires_approval(const SkillDefinition& def) {
    return is_reserved_sensitive(def.id) || def.is_sensitive.value_or(false);
}

} // namespace skillgate
