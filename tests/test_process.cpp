#include <catch2/catch.hpp>
#include <crabby/process.hpp>
#include <crabby/script.hpp>
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace crabby;
using crabby::testing::TempDir;

// ===== run_command =====

TEST_CASE("run_command captures output and exit code", "[process]") {
    auto r = run_command({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE(r.value().stdout_str == "out\n");
    REQUIRE(r.value().stderr_str == "err\n");
}

TEST_CASE("run_command runs in the working directory with extra env", "[process]") {
    TempDir tmp;
    CommandOptions options;
    options.working_dir = tmp.path.string();
    options.env = {{"CRABBY_TEST_VALUE", "hello"}};
    auto r = run_command({"/bin/sh", "-c", "pwd; echo $CRABBY_TEST_VALUE"}, options);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str == tmp.path.string() + "\nhello\n");
}

TEST_CASE("run_command does not read the terminal", "[process]") {
    auto r = run_command({"/bin/sh", "-c", "cat; echo done"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str == "done\n");
}

TEST_CASE("run_command reports a missing program as exit 127", "[process]") {
    auto r = run_command({"/nonexistent/crabby-program"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("run_command rejects empty args", "[process]") {
    auto r = run_command({});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrabbyError::InvalidArg);
}

TEST_CASE("run_command times out", "[process]") {
    CommandOptions options;
    options.timeout_seconds = 1;
    auto start = std::chrono::steady_clock::now();
    auto r = run_command({"/bin/sh", "-c", "sleep 10"}, options);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrabbyError::Script);
    REQUIRE(elapsed < std::chrono::seconds(5));
}

TEST_CASE("run_command can be cancelled", "[process]") {
    std::atomic<bool> cancel{false};
    CommandOptions options;
    options.cancel = &cancel;
    std::thread trigger([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel = true;
    });
    auto r = run_command({"/bin/sh", "-c", "sleep 10"}, options);
    trigger.join();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrabbyError::Cancelled);
}

// ===== ShellScriptRunner =====

TEST_CASE("shell runner sets lifecycle variables", "[process][script]") {
    TempDir tmp;
    ScriptContext ctx;
    ctx.package_name = "native-addon";
    ctx.package_version = "2.1.0";
    ctx.package_dir = tmp.path;

    ShellScriptRunner runner;
    auto r = runner.run("postinstall",
        "echo $npm_lifecycle_event $npm_package_name $npm_package_version; pwd", ctx);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().output == "postinstall native-addon 2.1.0\n" + tmp.path.string() + "\n");
}

TEST_CASE("shell runner puts bin dirs first on PATH", "[process][script]") {
    TempDir tmp;
    tmp.write_file("node_modules/.bin/greet", "#!/bin/sh\necho hi from bin\n");
    std::filesystem::permissions(tmp.path / "node_modules" / ".bin" / "greet",
                                 std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add);

    ScriptContext ctx;
    ctx.package_name = "app";
    ctx.package_dir = tmp.path;
    ctx.bin_dirs = {tmp.path / "node_modules" / ".bin"};

    ShellScriptRunner runner;
    auto r = runner.run("install", "greet", ctx);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().output == "hi from bin\n");
}

TEST_CASE("shell runner reports failure through the outcome", "[process][script]") {
    TempDir tmp;
    ScriptContext ctx;
    ctx.package_name = "bad";
    ctx.package_dir = tmp.path;

    ShellScriptRunner runner;
    auto r = runner.run("install", "echo broken >&2; exit 2", ctx);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 2);
    REQUIRE(r.value().output == "broken\n");
}

TEST_CASE("shell runner timeout is an error", "[process][script]") {
    TempDir tmp;
    ScriptContext ctx;
    ctx.package_name = "slow";
    ctx.package_dir = tmp.path;
    ctx.timeout_seconds = 1;

    ShellScriptRunner runner;
    auto r = runner.run("postinstall", "sleep 10", ctx);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrabbyError::Script);
    REQUIRE(r.error().message.find("slow postinstall") != std::string::npos);
}
