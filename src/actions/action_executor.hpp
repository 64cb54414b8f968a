#pragma once
#include <string>
#include <map>
#include <mutex>
#include <vector>
#include <functional>
#include <nlohmann/json.hpp>

namespace skillgate {

struct Config;

// Runs one concrete action. Failures are reported as SkillError.
class ActionExecutor {
public:
    virtual ~ActionExecutor() = default;
    virtual nlohmann::json run(const std::string& skill_id, const nlohmann::json& params) = 0;
};

using ActionHandler = std::function<nlohmann::json(const nlohmann::json&)>;

class LocalActionExecutor : public ActionExecutor {
public:
    void register_action(const std::string& skill_id, ActionHandler handler);

    bool has(const std::string& skill_id) const;

    // Throws SkillError(skill_not_found) when no handler is registered.
    nlohmann::json run(const std::string& skill_id, const nlohmann::json& params) override;

    std::vector<std::string> action_names() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ActionHandler> actions_;
};

// run_terminal_command, read_file, write_file, delete_file
void register_builtin_actions(LocalActionExecutor& exec, const Config& cfg);

} // namespace skillgate
