#include "hooks.hpp"
#include <algorithm>
#include <iostream>
#include <cstdio>

namespace skillgate {

void HookRunner::register_hook(HookEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& vec = hooks_[entry.type];
    vec.push_back(std::move(entry));
    // Keep sorted by priority (lower first)
    std::stable_sort(vec.begin(), vec.end(),
                     [](const HookEntry& a, const HookEntry& b) { return a.priority < b.priority; });
}

void HookRunner::fire(HookType type, const HookData& data) const {
    std::vector<HookEntry> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = hooks_.find(type);
        if (it == hooks_.end()) return;
        entries = it->second;
    }
    for (auto& entry : entries) {
        try {
            entry.callback(data);
        } catch (const std::exception& e) {
            std::cerr << "[hook:" << entry.name << "] error: " << e.what() << "\n";
        }
    }
}

bool HookRunner::has_hooks(HookType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hooks_.find(type);
    return it != hooks_.end() && !it->second.empty();
}

int HookRunner::hook_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int count = 0;
    for (auto& [_, vec] : hooks_) count += static_cast<int>(vec.size());
    return count;
}

const char* hook_type_name(HookType type) {
    switch (type) {
        case HookType::approval_requested: return "approval_requested";
        case HookType::approval_decided:   return "approval_decided";
        case HookType::pre_execute:        return "pre_execute";
        case HookType::post_execute:       return "post_execute";
        case HookType::workflow_start:     return "workflow_start";
        case HookType::workflow_end:       return "workflow_end";
    }
    return "unknown";
}

std::optional<HookType> parse_hook_type(const std::string& s) {
    if (s == "approval_requested") return HookType::approval_requested;
    if (s == "approval_decided")   return HookType::approval_decided;
    if (s == "pre_execute")        return HookType::pre_execute;
    if (s == "post_execute")       return HookType::post_execute;
    if (s == "workflow_start")     return HookType::workflow_start;
    if (s == "workflow_end")       return HookType::workflow_end;
    return std::nullopt;
}

HookCallback make_shell_hook(const std::string& command) {
    return [command](const HookData& data) {
        std::string input = data.dump() + "\n";

#ifdef _WIN32
        FILE* pipe = _popen(command.c_str(), "w");
#else
        FILE* pipe = popen(command.c_str(), "w");
#endif
        if (!pipe) {
            std::cerr << "[hook] Failed to execute: " << command << "\n";
            return;
        }

        size_t written = std::fwrite(input.data(), 1, input.size(), pipe);

#ifdef _WIN32
        int status = _pclose(pipe);
#else
        int status = pclose(pipe);
#endif

        if (written != input.size()) {
            std::cerr << "[hook] Short write to: " << command << "\n";
        }
        if (status != 0) {
            std::cerr << "[hook] Command exited with status " << status << ": " << command << "\n";
        }
    };
}

} // namespace skillgate
