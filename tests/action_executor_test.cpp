#include "test_helpers.hpp"

#include "actions/action_executor.hpp"
#include "actions/fs_actions.hpp"
#include "actions/terminal_action.hpp"

using namespace skillgate;
using skillgate::test::TempDir;
using skillgate::test::capture_error;

TEST_CASE("unknown actions report SkillNotFound", "[executor]") {
    LocalActionExecutor exec;
    auto err = capture_error([&] { exec.run("teleport", nlohmann::json::object()); });
    REQUIRE(err);
    CHECK(err->kind == ErrorKind::skill_not_found);
}

TEST_CASE("built-in actions cover the reserved skills", "[executor]") {
    TempDir dir;
    LocalActionExecutor exec;
    register_builtin_actions(exec, skillgate::test::test_config(dir));
    CHECK(exec.action_names() ==
          std::vector<std::string>{"delete_file", "read_file", "run_terminal_command", "write_file"});
}

TEST_CASE("file actions resolve relative paths under the workspace", "[executor][fs]") {
    TempDir dir;
    LocalActionExecutor exec;
    register_fs_actions(exec, skillgate::test::test_config(dir));

    auto written = exec.run("write_file", {{"path", "notes/todo.txt"}, {"content", "ship it"}});
    CHECK(written["output"] == dir.file("notes/todo.txt"));
    CHECK(written["bytes"] == 7);
    REQUIRE(fs::exists(dir.file("notes/todo.txt")));

    auto read = exec.run("read_file", {{"path", "notes/todo.txt"}});
    CHECK(read["output"] == "ship it");

    auto removed = exec.run("delete_file", {{"path", dir.file("notes/todo.txt")}});
    CHECK(removed["deleted"] == true);
    CHECK_FALSE(fs::exists(dir.file("notes/todo.txt")));
}

TEST_CASE("file actions map failures onto error kinds", "[executor][fs]") {
    TempDir dir;
    LocalActionExecutor exec;
    register_fs_actions(exec, skillgate::test::test_config(dir));

    auto err = capture_error([&] { exec.run("read_file", {{"path", "missing.txt"}}); });
    REQUIRE(err);
    CHECK(err->kind == ErrorKind::path_not_found);

    err = capture_error([&] { exec.run("delete_file", {{"path", "missing.txt"}}); });
    REQUIRE(err);
    CHECK(err->kind == ErrorKind::path_not_found);

    fs::create_directories(dir.file("subdir"));
    err = capture_error([&] { exec.run("delete_file", {{"path", "subdir"}}); });
    REQUIRE(err);
    CHECK(err->kind == ErrorKind::io_error);
    CHECK(fs::exists(dir.file("subdir")));
}

#ifndef _WIN32

TEST_CASE("run_command captures both streams and the exit code", "[executor][terminal]") {
    CommandSpec spec;
    spec.command = "echo out; echo err 1>&2; exit 3";
    auto out = run_command(spec);
    CHECK(out.stdout_text == "out\n");
    CHECK(out.stderr_text == "err\n");
    CHECK(out.exit_code == 3);
    CHECK_FALSE(out.truncated);
}

TEST_CASE("run_command kills commands that overrun the timeout", "[executor][terminal][timeout]") {
    CommandSpec spec;
    spec.command = "sleep 5";
    spec.timeout_ms = 300;
    auto start = std::chrono::steady_clock::now();
    auto err = capture_error([&] { run_command(spec); });
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(err);
    CHECK(err->kind == ErrorKind::command_timed_out);
    CHECK(elapsed < std::chrono::seconds(3));
}

TEST_CASE("run_command bounds captured output", "[executor][terminal]") {
    CommandSpec spec;
    spec.command = "head -c 5000 /dev/zero | tr '\\0' 'a'";
    spec.max_output_bytes = 1024;
    auto out = run_command(spec);
    CHECK(out.stdout_text.size() == 1024);
    CHECK(out.truncated);
}

TEST_CASE("long timeouts do not wrap around", "[executor][terminal][timeout]") {
    CommandSpec spec;
    spec.command = "echo hi";
    spec.timeout_ms = 3000000000LL;
    auto out = run_command(spec);
    CHECK(out.stdout_text == "hi\n");
    CHECK(out.exit_code == 0);

    TempDir dir;
    Config cfg = skillgate::test::test_config(dir);
    cfg.max_command_timeout = 3000000;
    LocalActionExecutor exec;
    register_terminal_action(exec, cfg);
    auto res = exec.run("run_terminal_command", {{"command", "echo hi"}, {"timeoutSeconds", 2500000}});
    CHECK(res["exitCode"] == 0);
    CHECK(res["output"] == "hi\n");
}

TEST_CASE("run_terminal_command runs in the requested directory", "[executor][terminal]") {
    TempDir dir;
    dir.write("work/marker.txt", "x");
    LocalActionExecutor exec;
    register_terminal_action(exec, skillgate::test::test_config(dir));

    auto res = exec.run("run_terminal_command", {{"command", "ls"}, {"workingDir", "work"}});
    CHECK(res["exitCode"] == 0);
    CHECK(res["output"] == "marker.txt\n");
    CHECK(res["stdout"] == res["output"]);

    auto failed = exec.run("run_terminal_command", {{"command", "false"}});
    CHECK(failed["exitCode"] == 1);

    auto err = capture_error([&] {
        exec.run("run_terminal_command", {{"command", "ls"}, {"workingDir", "no/such/dir"}});
    });
    REQUIRE(err);
    CHECK(err->kind == ErrorKind::spawn_failed);

    err = capture_error([&] {
        exec.run("run_terminal_command", {{"command", "sleep 5"}, {"timeoutSeconds", 0.3}});
    });
    REQUIRE(err);
    CHECK(err->kind == ErrorKind::command_timed_out);
}

#endif
