#pragma once
#include "config.hpp"
#include <string>
#include <vector>

namespace skillgate {

class SkillEngine;

int cmd_status(const std::string& config_path);
int cmd_skills(const std::string& config_path);
int cmd_run(const std::string& config_path, const std::vector<std::string>& args);
int cmd_history(const std::string& config_path, const std::vector<std::string>& args);
int cmd_workflow(const std::string& config_path, const std::vector<std::string>& args);

// Answers approval_requested events on the terminal, or approves
// automatically when `auto_approve` is set.
void install_console_approver(SkillEngine& engine, bool auto_approve);

} // namespace skillgate
