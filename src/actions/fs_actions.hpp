#pragma once
#include "action_executor.hpp"
#include "../config.hpp"
#include <string>

namespace skillgate {

// Absolute paths pass through; relative ones resolve under the workspace.
std::string resolve_workspace_path(const std::string& workspace, const std::string& path);

void register_fs_actions(LocalActionExecutor& exec, const Config& cfg);

} // namespace skillgate
