#include "test_helpers.hpp"

#include "approval_gate.hpp"
#include "audit_log.hpp"
#include "execution_pipeline.hpp"
#include "skill_registry.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

using namespace skillgate;
using skillgate::test::RecordingExecutor;
using skillgate::test::TempDir;
using skillgate::test::capture_error;
using skillgate::test::test_config;

TEST_CASE("denied delete_file leaves the target in place", "[pipeline][approval]") {
    TempDir dir;
    auto target = dir.write("x", "keep me");
    SkillEngine engine(test_config(dir));

    std::string id = engine.execute_skill("delete_file", {{"path", target}});
    auto pending = engine.get_execution(id);
    REQUIRE(pending);
    CHECK(pending->status == ExecutionStatus::pending);
    CHECK(pending->approval == ApprovalState::pending);
    REQUIRE(engine.pending_approvals().size() == 1);
    CHECK(engine.pending_approvals()[0].execution_id == id);

    engine.deny_execution(id);
    auto done = engine.await_execution(id);
    CHECK(done.status == ExecutionStatus::failed);
    CHECK(done.approval == ApprovalState::denied);
    REQUIRE(done.error);
    CHECK(done.error->kind == ErrorKind::approval_denied);
    CHECK(fs::exists(target));
}

TEST_CASE("approved delete_file removes the target", "[pipeline][approval]") {
    TempDir dir;
    auto target = dir.write("x", "remove me");
    SkillEngine engine(test_config(dir));

    std::string id = engine.execute_skill("delete_file", {{"path", target}});
    engine.approve_execution(id);
    auto done = engine.await_execution(id);
    CHECK(done.status == ExecutionStatus::completed);
    CHECK(done.approval == ApprovalState::approved);
    REQUIRE(done.result);
    CHECK((*done.result)["output"] == target);
    CHECK_FALSE(fs::exists(target));
}

TEST_CASE("sensitive skills never reach the executor before approval", "[pipeline][approval]") {
    TempDir dir;
    Config cfg = test_config(dir);
    auto recorder = std::make_unique<RecordingExecutor>(cfg);
    RecordingExecutor* calls = recorder.get();
    SkillEngine engine(cfg, std::move(recorder));

    std::string id = engine.execute_skill("write_file", {{"path", "out.txt"}, {"content", "hi"}});
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    CHECK(calls->calls().empty());
    CHECK_FALSE(fs::exists(dir.file("out.txt")));

    engine.approve_execution(id);
    auto done = engine.await_execution(id);
    CHECK(done.status == ExecutionStatus::completed);
    CHECK(calls->calls() == std::vector<std::string>{"write_file"});
    CHECK(read_file(dir.file("out.txt")) == "hi");
}

TEST_CASE("non-sensitive skills run without approval", "[pipeline]") {
    TempDir dir;
    dir.write("in.txt", "hello");
    SkillEngine engine(test_config(dir));

    auto exec = engine.execute_skill_and_wait("read_file", {{"path", "in.txt"}});
    CHECK(exec.status == ExecutionStatus::completed);
    CHECK(exec.approval == ApprovalState::not_required);
    CHECK((*exec.result)["output"] == "hello");

    auto err = capture_error([&] { engine.approve_execution(exec.id); });
    REQUIRE(err);
    CHECK(err->kind == ErrorKind::already_decided);

    err = capture_error([&] { engine.deny_execution("exec_0_0"); });
    REQUIRE(err);
    CHECK(err->kind == ErrorKind::execution_not_found);
}

TEST_CASE("invalid requests fail before an execution id exists", "[pipeline]") {
    TempDir dir;
    SkillEngine engine(test_config(dir));

    auto err = capture_error([&] { engine.execute_skill("format_disk", nlohmann::json::object()); });
    REQUIRE(err);
    CHECK(err->kind == ErrorKind::skill_not_found);

    err = capture_error([&] { engine.execute_skill("delete_file", {{"path", 7}}); });
    REQUIRE(err);
    CHECK(err->kind == ErrorKind::parameter_invalid);
    CHECK(err->ref == "path");

    CHECK(engine.get_execution_history().empty());
    CHECK(engine.pending_approvals().empty());
}

TEST_CASE("executor failures are captured in the record", "[pipeline]") {
    TempDir dir;
    SkillEngine engine(test_config(dir));

    auto exec = engine.execute_skill_and_wait("read_file", {{"path", "absent.txt"}});
    CHECK(exec.status == ExecutionStatus::failed);
    REQUIRE(exec.error);
    CHECK(exec.error->kind == ErrorKind::path_not_found);
}

TEST_CASE("skills without a handler fail inside the record", "[pipeline]") {
    TempDir dir;
    SkillEngine engine(test_config(dir));
    SkillDefinition def;
    def.id = "summarize";
    def.is_sensitive = false;
    engine.register_skill(def);

    auto exec = engine.execute_skill_and_wait("summarize", nullptr);
    CHECK(exec.status == ExecutionStatus::failed);
    CHECK(exec.error->kind == ErrorKind::skill_not_found);
    CHECK(engine.get_execution_history().size() == 1);

    SECTION("until a handler is attached") {
        engine.register_action("summarize", [](const nlohmann::json&) -> nlohmann::json {
            return {{"output", "short"}};
        });
        auto done = engine.execute_skill_and_wait("summarize", nullptr);
        CHECK(done.status == ExecutionStatus::completed);
        CHECK((*done.result)["output"] == "short");

        auto err = capture_error([&] {
            engine.register_action("nonexistent", [](const nlohmann::json&) { return nlohmann::json(); });
        });
        REQUIRE(err);
        CHECK(err->kind == ErrorKind::skill_not_found);
    }
}

TEST_CASE("a second engine on the same audit database is refused", "[pipeline][audit][owner]") {
    TempDir dir;
    auto target = dir.write("x", "x");
    Config cfg = test_config(dir);
    cfg.audit_db = dir.file("audit.db");

    {
        SkillEngine first(cfg);
        std::string id = first.execute_skill("delete_file", {{"path", target}});

        CHECK_THROWS_AS(SkillEngine(cfg), std::runtime_error);

        first.approve_execution(id);
        auto done = first.await_execution(id);
        CHECK(done.status == ExecutionStatus::completed);
        CHECK_FALSE(fs::exists(target));
    }

    AuditLog reader(cfg.audit_db, AuditLog::Access::reader);
    auto history = reader.history();
    REQUIRE(history.size() == 1);
    CHECK(history[0].status == ExecutionStatus::completed);
    CHECK(history[0].approval == ApprovalState::approved);
}

TEST_CASE("approval waits expire as ApprovalTimedOut", "[pipeline][timeout]") {
    TempDir dir;
    Config cfg = test_config(dir);
    cfg.approval_timeout = 1;
    SkillEngine engine(cfg);

    auto target = dir.write("y", "data");
    auto exec = engine.execute_skill_and_wait("delete_file", {{"path", target}});
    CHECK(exec.status == ExecutionStatus::failed);
    CHECK(exec.approval == ApprovalState::timed_out);
    CHECK(exec.error->kind == ErrorKind::approval_timed_out);
    CHECK(fs::exists(target));
}

TEST_CASE("every minted execution id gets exactly one audit entry", "[pipeline][audit]") {
    TempDir dir;
    dir.write("a.txt", "a");
    SkillEngine engine(test_config(dir));

    std::vector<std::string> ids;
    ids.push_back(engine.execute_skill("read_file", {{"path", "a.txt"}}));
    ids.push_back(engine.execute_skill("read_file", {{"path", "missing.txt"}}));
    ids.push_back(engine.execute_skill("write_file", {{"path", "b.txt"}, {"content", "b"}}));
    ids.push_back(engine.execute_skill("delete_file", {{"path", "a.txt"}}));

    engine.approve_execution(ids[2]);
    engine.deny_execution(ids[3]);
    for (auto& id : ids) engine.await_execution(id);

    auto history = engine.get_execution_history();
    REQUIRE(history.size() == ids.size());
    for (auto& id : ids) {
        auto n = std::count_if(history.begin(), history.end(),
                               [&](const AuditEntry& e) { return e.execution_id == id; });
        CHECK(n == 1);
    }
    CHECK(engine.get_execution_history(std::string("read_file")).size() == 2);
}

TEST_CASE("shutdown denies approvals still waiting", "[pipeline]") {
    TempDir dir;
    auto target = dir.write("z", "z");
    SkillEngine engine(test_config(dir));

    std::string id = engine.execute_skill("delete_file", {{"path", target}});
    engine.shutdown();

    auto exec = engine.get_execution(id);
    REQUIRE(exec);
    CHECK(exec->status == ExecutionStatus::failed);
    CHECK(exec->error->kind == ErrorKind::approval_denied);
    CHECK(fs::exists(target));
}

TEST_CASE("pipeline hooks see each execution once", "[pipeline][hooks]") {
    TempDir dir;
    dir.write("h.txt", "h");
    SkillEngine engine(test_config(dir));

    std::vector<std::string> events;
    std::mutex m;
    engine.hooks().register_hook({"pre", HookType::pre_execute, 0, [&](const HookData& d) {
        std::lock_guard<std::mutex> lock(m);
        events.push_back("pre:" + d.value("skillId", ""));
    }});
    engine.hooks().register_hook({"post", HookType::post_execute, 0, [&](const HookData& d) {
        std::lock_guard<std::mutex> lock(m);
        events.push_back("post:" + d.value("status", ""));
    }});

    engine.execute_skill_and_wait("read_file", {{"path", "h.txt"}});
    std::lock_guard<std::mutex> lock(m);
    CHECK(events == std::vector<std::string>{"pre:read_file", "post:Completed"});
}

TEST_CASE("submissions racing shutdown are denied, never stranded", "[pipeline][shutdown]") {
    TempDir dir;
    auto target = dir.write("keep", "keep");
    std::vector<std::string> ids;
    std::mutex m;
    {
        SkillEngine engine(test_config(dir));   // approval_timeout 0: waits forever
        std::vector<std::thread> submitters;
        for (int t = 0; t < 4; t++) {
            submitters.emplace_back([&] {
                for (int i = 0; i < 50; i++) {
                    try {
                        std::string id = engine.execute_skill("delete_file", {{"path", target}});
                        std::lock_guard<std::mutex> lock(m);
                        ids.push_back(id);
                    } catch (const std::runtime_error&) {
                        return;
                    }
                }
            });
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        engine.shutdown();
        for (auto& t : submitters) t.join();

        for (auto& id : ids) {
            auto exec = engine.await_execution(id);
            CHECK(exec.status == ExecutionStatus::failed);
            REQUIRE(exec.error);
            CHECK(exec.error->kind == ErrorKind::approval_denied);
        }
        CHECK(engine.get_execution_history().size() == ids.size());
        CHECK_THROWS_AS(engine.execute_skill("read_file", {{"path", "keep"}}), std::runtime_error);
    }
    CHECK(fs::exists(target));
}

TEST_CASE("finished executions leave memory but stay answerable", "[pipeline][retention]") {
    TempDir dir;
    dir.write("in.txt", "hello");
    Config cfg = test_config(dir);
    cfg.retained_executions = 2;

    SkillRegistry registry;
    register_builtin_skills(registry);
    ApprovalGate gate;
    AuditLog audit(":memory:");
    LocalActionExecutor actions;
    register_builtin_actions(actions, cfg);
    ExecutionPipeline pipeline(cfg, registry, gate, actions, audit);

    std::vector<std::string> ids;
    for (int i = 0; i < 5; i++) {
        ids.push_back(pipeline.execute("read_file", {{"path", "in.txt"}}).id);
    }
    CHECK(pipeline.list().size() == 2);
    CHECK(audit.size() == 5);

    auto oldest = pipeline.get(ids[0]);
    REQUIRE(oldest);
    CHECK(oldest->status == ExecutionStatus::completed);
    CHECK(pipeline.await(ids[0]).result->at("output") == "hello");

    auto err = capture_error([&] { pipeline.approve(ids[0]); });
    REQUIRE(err);
    CHECK(err->kind == ErrorKind::already_decided);

    std::string gated = pipeline.submit("write_file", {{"path", "out.txt"}, {"content", "x"}}).id;
    pipeline.deny(gated);
    pipeline.await(gated);
    err = capture_error([&] { gate.approve(gated); });
    REQUIRE(err);
    CHECK(err->kind == ErrorKind::execution_not_found);
}
