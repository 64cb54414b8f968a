#pragma once
#include "action_executor.hpp"
#include "../config.hpp"
#include <cstdint>
#include <string>

namespace skillgate {

struct CommandSpec {
    std::string command;        // passed to the platform shell
    std::string working_dir;    // empty = inherit
    int64_t timeout_ms = 60000;
    size_t max_output_bytes = 262144;
};

struct CommandOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    bool truncated = false;
};

// Runs a shell command capturing stdout and stderr separately.
// Throws SkillError(spawn_failed) if the process cannot be started and
// SkillError(command_timed_out) after killing a process that overran.
CommandOutput run_command(const CommandSpec& spec);

void register_terminal_action(LocalActionExecutor& exec, const Config& cfg);

} // namespace skillgate
