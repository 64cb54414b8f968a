#include "test_helpers.hpp"

#include "config.hpp"
#include "hooks.hpp"

#include <stdexcept>

using namespace skillgate;
using skillgate::test::TempDir;

TEST_CASE("defaults apply when fields are absent", "[config]") {
    auto c = Config::from_json(nlohmann::json::object());
    CHECK(c.command_timeout == 60);
    CHECK(c.max_command_timeout == 300);
    CHECK(c.max_output_bytes == 262144);
    CHECK(c.approval_timeout == 600);
    CHECK(c.retained_executions == 1000);
    CHECK(c.hooks.empty());
}

TEST_CASE("out-of-range limits are clamped", "[config]") {
    auto c = Config::from_json({
        {"command_timeout", 900},
        {"max_command_timeout", 120},
        {"max_output_bytes", 10},
        {"approval_timeout", -5},
    });
    CHECK(c.command_timeout == 120);
    CHECK(c.max_output_bytes == 1024);
    CHECK(c.approval_timeout == 0);

    c = Config::from_json({{"max_command_timeout", 3000000}, {"command_timeout", 2500000}});
    CHECK(c.max_command_timeout == kMaxCommandTimeout);
    CHECK(c.command_timeout == kMaxCommandTimeout);

    c = Config::from_json({{"retained_executions", 0}});
    CHECK(c.retained_executions == 1);

    c = Config::from_json({{"command_timeout", 0}, {"max_command_timeout", -1}});
    CHECK(c.command_timeout == 60);
    CHECK(c.max_command_timeout == 300);
}

TEST_CASE("hooks without a type or command are dropped", "[config]") {
    auto c = Config::from_json(nlohmann::json::parse(R"({
        "hooks": [
            {"type": "post_execute", "command": "logger", "priority": 5},
            {"type": "pre_execute"},
            {"command": "true"}
        ]
    })"));
    REQUIRE(c.hooks.size() == 1);
    CHECK(c.hooks[0].type == "post_execute");
    CHECK(c.hooks[0].priority == 5);
}

TEST_CASE("load falls back to defaults for missing or broken files", "[config]") {
    TempDir dir;
    auto missing = Config::load(dir.file("nope.json"));
    CHECK(missing.approval_timeout == 600);

    auto broken = Config::load(dir.write("broken.json", "{ not json"));
    CHECK(broken.command_timeout == 60);
}

TEST_CASE("save then load keeps every field", "[config]") {
    TempDir dir;
    Config c;
    c.workspace = dir.path();
    c.audit_db = ":memory:";
    c.workflows_dir = "";
    c.approval_timeout = 30;
    c.hooks.push_back({"workflow_end", "cat > /dev/null", 2});

    std::string path = dir.file("conf/config.json");
    c.save(path);
    auto back = Config::load(path);

    CHECK(back.workspace == dir.path());
    CHECK(back.audit_db_path() == ":memory:");
    CHECK(back.workflows_dir.empty());
    CHECK(back.approval_timeout == 30);
    REQUIRE(back.hooks.size() == 1);
    CHECK(back.hooks[0].command == "cat > /dev/null");
    CHECK(back.hooks[0].priority == 2);
}

TEST_CASE("hooks run by priority and contain failures", "[hooks]") {
    HookRunner hooks;
    std::vector<std::string> order;
    hooks.register_hook({"late", HookType::post_execute, 10, [&](const HookData&) { order.push_back("late"); }});
    hooks.register_hook({"broken", HookType::post_execute, 5, [&](const HookData&) {
        order.push_back("broken");
        throw std::runtime_error("hook exploded");
    }});
    hooks.register_hook({"early", HookType::post_execute, -1, [&](const HookData&) { order.push_back("early"); }});

    CHECK_NOTHROW(hooks.fire(HookType::post_execute, {{"executionId", "e"}}));
    CHECK(order == std::vector<std::string>{"early", "broken", "late"});
    CHECK(hooks.has_hooks(HookType::post_execute));
    CHECK_FALSE(hooks.has_hooks(HookType::pre_execute));
    CHECK(hooks.hook_count() == 3);
}

TEST_CASE("hook type names parse back", "[hooks]") {
    for (auto t : {HookType::approval_requested, HookType::approval_decided, HookType::pre_execute,
                   HookType::post_execute, HookType::workflow_start, HookType::workflow_end}) {
        CHECK(parse_hook_type(hook_type_name(t)) == t);
    }
    CHECK_FALSE(parse_hook_type("on_boot"));
}
