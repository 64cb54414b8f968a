#include "action_executor.hpp"
#include "terminal_action.hpp"
#include "fs_actions.hpp"
#include "../errors.hpp"

namespace skillgate {

void LocalActionExecutor::register_action(const std::string& skill_id, ActionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    actions_[skill_id] = std::move(handler);
}

bool LocalActionExecutor::has(const std::string& skill_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actions_.count(skill_id) > 0;
}

nlohmann::json LocalActionExecutor::run(const std::string& skill_id, const nlohmann::json& params) {
    ActionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = actions_.find(skill_id);
        if (it == actions_.end()) {
            throw SkillError(ErrorKind::skill_not_found, "No action registered for " + skill_id, skill_id);
        }
        handler = it->second;
    }
    return handler(params);
}

std::vector<std::string> LocalActionExecutor::action_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (auto& [n, _] : actions_) names.push_back(n);
    return names;
}

void register_builtin_actions(LocalActionExecutor& exec, const Config& cfg) {
    register_terminal_action(exec, cfg);
    register_fs_actions(exec, cfg);
}

} // namespace skillgate
