#pragma once
#include "skill.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace skillgate {

class SkillRegistry {
public:
    SkillRegistry();

    void register_skill(SkillDefinition def);
    void update_skill(SkillDefinition def);
    void unregister_skill(const std::string& id);

    SkillDefinition lookup(const std::string& id) const;
    bool has(const std::string& id) const;
    std::vector<SkillDefinition> list() const;
    size_t size() const;

    nlohmann::json to_json() const;

    // JSON array of definitions; invalid entries are logged and skipped.
    // Returns the number registered.
    size_t load_file(const std::string& path);

private:
    using SkillMap = std::map<std::string, SkillDefinition>;

    std::mutex write_mutex_;
    std::shared_ptr<const SkillMap> skills_;

    std::shared_ptr<const SkillMap> snapshot() const;
    void publish(std::shared_ptr<const SkillMap> next);

    // Throws SkillError(signature_invalid) with the offending field as ref.
    static void validate_signature(SkillDefinition& def);
};

std::vector<SkillDefinition> builtin_skill_definitions();

void register_builtin_skills(SkillRegistry& reg);

} // namespace skillgate
