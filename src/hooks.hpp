#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

namespace skillgate {

enum class HookType {
    // Approval gate
    approval_requested,
    approval_decided,

    // Execution pipeline
    pre_execute,
    post_execute,

    // Workflow engine
    workflow_start,
    workflow_end,
};

using HookData = nlohmann::json;
using HookCallback = std::function<void(const HookData&)>;

struct HookEntry {
    std::string name;
    HookType type;
    int priority = 0;  // lower runs first
    HookCallback callback;
};

class HookRunner {
public:
    void register_hook(HookEntry entry);

    // Runs every callback for `type`; failures are logged, never propagated.
    void fire(HookType type, const HookData& data = {}) const;

    bool has_hooks(HookType type) const;

    int hook_count() const;

private:
    mutable std::mutex mutex_;
    std::map<HookType, std::vector<HookEntry>> hooks_;
};

const char* hook_type_name(HookType type);
std::optional<HookType> parse_hook_type(const std::string& s);

// Shell hook: the event JSON is written to the command's stdin.
HookCallback make_shell_hook(const std::string& command);

} // namespace skillgate
