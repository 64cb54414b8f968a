#pragma once
#include <catch2/catch.hpp>

#include "config.hpp"
#include "engine.hpp"
#include "utils.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace skillgate::test {

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("skillgate_test_" + std::to_string(epoch_ms_now()) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

    std::string write(const std::string& name, const std::string& content) const {
        auto p = path_ / name;
        fs::create_directories(p.parent_path());
        std::ofstream f(p, std::ios::binary);
        f << content;
        return p.string();
    }

private:
    fs::path path_;
};

inline Config test_config(const TempDir& dir) {
    Config cfg;
    cfg.workspace = dir.path();
    cfg.audit_db = ":memory:";
    cfg.workflows_dir = "";
    cfg.skills_file = "";
    cfg.command_timeout = 10;
    cfg.approval_timeout = 0;
    return cfg;
}

// Runs `f` and returns the SkillError it threw, if any.
template <typename F>
std::optional<ErrorInfo> capture_error(F&& f) {
    try {
        f();
    } catch (const SkillError& e) {
        return e.info();
    }
    return std::nullopt;
}

// Delegates to the built-in actions and remembers every call.
class RecordingExecutor : public ActionExecutor {
public:
    explicit RecordingExecutor(const Config& cfg) { register_builtin_actions(local_, cfg); }

    LocalActionExecutor& local() { return local_; }

    nlohmann::json run(const std::string& skill_id, const nlohmann::json& params) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(skill_id);
        }
        return local_.run(skill_id, params);
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    LocalActionExecutor local_;
    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
};

// Approves every request as soon as the gate opens it.
inline void auto_approve(SkillEngine& engine) {
    HookEntry entry;
    entry.name = "auto-approve";
    entry.type = HookType::approval_requested;
    entry.callback = [&engine](const HookData& data) {
        engine.approve_execution(data.value("executionId", ""));
    };
    engine.hooks().register_hook(std::move(entry));
}

inline SkillParameter param(const std::string& name, ValueType type, bool required = true) {
    SkillParameter p;
    p.name = name;
    p.type = type;
    p.required = required;
    return p;
}

} // namespace skillgate::test
