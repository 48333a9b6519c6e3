#include <catch2/catch.hpp>
#include <crabby/installer.hpp>
#include <crabby/resolver.hpp>
#include "test_support.hpp"

#include <algorithm>
#include <fstream>

using namespace crabby;
using crabby::testing::FakePackage;
using crabby::testing::FakeRegistry;
using crabby::testing::RecordingScriptRunner;
using crabby::testing::TempDir;
namespace fs = std::filesystem;

namespace {

Manifest manifest(const std::string& json) {
    auto m = Manifest::parse(json);
    REQUIRE(m.is_ok());
    return std::move(m).value();
}

InstallOptions quick_options() {
    InstallOptions o;
    o.fetch.jobs = 4;
    o.fetch.retries = 3;
    o.fetch.retry_delay_ms = 1;
    o.fetch.retry_max_delay_ms = 4;
    return o;
}

// Project dir, cache dir and the pieces an install needs.
struct Fixture {
    TempDir project;
    TempDir cache_dir;
    FakeRegistry registry;
    RecordingScriptRunner scripts;
    PackageCache cache{cache_dir.path};

    Fixture() { REQUIRE(cache.open().is_ok()); }

    DependencyGraph resolve(const std::string& json, const Workspace* ws = nullptr) {
        project.write_file("package.json", json);
        Resolver resolver(registry, ws);
        auto r = resolver.resolve(manifest(json));
        REQUIRE(r.is_ok());
        return std::move(r).value().graph;
    }

    InstallReport install(const DependencyGraph& graph, InstallOptions options = quick_options(),
                          const Workspace* ws = nullptr) {
        Installer installer(registry, cache, scripts, options, ws);
        return installer.install(graph, project.path);
    }

    std::vector<std::string> script_log() const {
        std::vector<std::string> out;
        for (const auto& c : scripts.calls) out.push_back(c.package + ":" + c.event);
        return out;
    }
};

} // namespace

// ===== Placement =====

TEST_CASE("packages are placed at their install paths", "[installer]") {
    Fixture f;
    f.registry.publish("a", "1.0.0", {{"b", "^1.0.0"}});
    f.registry.publish("b", "1.2.0");

    auto graph = f.resolve(R"({"name":"app","dependencies":{"a":"^1.0.0"}})");
    auto report = f.install(graph);

    REQUIRE(report.ok());
    REQUIRE(report.exit_code() == 0);
    REQUIRE(report.installed == 2);
    REQUIRE(report.fetched == 2);
    REQUIRE(report.cache_hits == 0);
    REQUIRE(f.project.read_file("node_modules/a/index.js") == "module.exports = 'a@1.0.0';\n");
    REQUIRE(f.project.exists("node_modules/b/package.json"));
    REQUIRE_FALSE(f.project.exists("node_modules/a/node_modules"));
}

TEST_CASE("conflicting version is installed nested", "[installer]") {
    Fixture f;
    f.registry.publish("b", "1.0.0", {{"c", "^2.0.0"}});
    f.registry.publish("c", "1.0.0");
    f.registry.publish("c", "2.0.0");

    auto graph = f.resolve(R"({"name":"app","dependencies":{"b":"^1.0.0","c":"^1.0.0"}})");
    auto report = f.install(graph);

    REQUIRE(report.ok());
    REQUIRE(report.installed == 3);
    REQUIRE(f.project.read_file("node_modules/c/index.js") == "module.exports = 'c@1.0.0';\n");
    REQUIRE(f.project.read_file("node_modules/b/node_modules/c/index.js") ==
            "module.exports = 'c@2.0.0';\n");
}

TEST_CASE("second install is served from the cache", "[installer]") {
    Fixture f;
    f.registry.publish("a", "1.0.0", {{"b", "^1.0.0"}});
    f.registry.publish("b", "1.0.0");
    auto graph = f.resolve(R"({"name":"app","dependencies":{"a":"^1.0.0"}})");
    REQUIRE(f.install(graph).ok());
    REQUIRE(f.registry.tarball_requests() == 2);

    TempDir other;
    RecordingScriptRunner scripts;
    Installer installer(f.registry, f.cache, scripts, quick_options());
    auto report = installer.install(graph, other.path);

    REQUIRE(report.ok());
    REQUIRE(report.cache_hits == 2);
    REQUIRE(report.fetched == 0);
    REQUIRE(f.registry.tarball_requests() == 2);
    REQUIRE(other.exists("node_modules/a/index.js"));
}

TEST_CASE("copy mode installs independent files", "[installer]") {
    Fixture f;
    f.registry.publish("a", "1.0.0");
    auto graph = f.resolve(R"({"name":"app","dependencies":{"a":"1.0.0"}})");

    auto options = quick_options();
    options.link_mode = LinkMode::Copy;
    REQUIRE(f.install(graph, options).ok());
    REQUIRE(fs::hard_link_count(f.project.path / "node_modules" / "a" / "index.js") == 1);
}

TEST_CASE("reinstall replaces existing directories", "[installer]") {
    Fixture f;
    f.registry.publish("a", "1.0.0");
    f.project.write_file("node_modules/a/leftover.js", "old");
    auto graph = f.resolve(R"({"name":"app","dependencies":{"a":"1.0.0"}})");

    REQUIRE(f.install(graph).ok());
    REQUIRE_FALSE(f.project.exists("node_modules/a/leftover.js"));
    REQUIRE(f.project.exists("node_modules/a/index.js"));
}

TEST_CASE("extraneous root entries are removed", "[installer]") {
    Fixture f;
    f.registry.publish("a", "1.0.0");
    f.registry.publish("@keep/lib", "1.0.0");
    f.project.write_file("node_modules/stale/index.js", "");
    f.project.write_file("node_modules/@old/pkg/index.js", "");
    f.project.write_file("node_modules/@keep/gone/index.js", "");
    auto graph = f.resolve(
        R"({"name":"app","dependencies":{"a":"1.0.0","@keep/lib":"1.0.0"}})");

    REQUIRE(f.install(graph).ok());
    REQUIRE(f.project.exists("node_modules/a"));
    REQUIRE_FALSE(f.project.exists("node_modules/stale"));
    REQUIRE_FALSE(f.project.exists("node_modules/@old/pkg"));
    REQUIRE_FALSE(f.project.exists("node_modules/@old"));
    REQUIRE_FALSE(f.project.exists("node_modules/@keep/gone"));
    REQUIRE(f.project.exists("node_modules/@keep/lib"));
}

TEST_CASE("missing integrity is computed locally", "[installer]") {
    Fixture f;
    FakePackage pkg;
    pkg.name = "loose";
    pkg.version = "1.0.0";
    pkg.files["index.js"] = "";
    pkg.omit_integrity = true;
    f.registry.publish(pkg);

    auto graph = f.resolve(R"({"name":"app","dependencies":{"loose":"1.0.0"}})");
    auto report = f.install(graph);
    REQUIRE(report.ok());
    REQUIRE(report.computed_integrity.count("node_modules/loose") == 1);
    REQUIRE(report.computed_integrity["node_modules/loose"].rfind("sha512-", 0) == 0);

    // Another project sharing the cache reuses the download
    TempDir other;
    f.registry.reset_counters();
    Installer installer(f.registry, f.cache, f.scripts, quick_options());
    auto again = installer.install(graph, other.path);
    REQUIRE(again.ok());
    REQUIRE(again.cache_hits == 1);
    REQUIRE(f.registry.tarball_requests() == 0);
    REQUIRE(again.computed_integrity["node_modules/loose"] ==
            report.computed_integrity["node_modules/loose"]);
    REQUIRE(other.exists("node_modules/loose/index.js"));
}

// ===== Failures =====

TEST_CASE("transient fetch failures are retried", "[installer]") {
    Fixture f;
    std::string url = f.registry.publish("a", "1.0.0");
    f.registry.fail_tarball(url, 2);
    auto graph = f.resolve(R"({"name":"app","dependencies":{"a":"1.0.0"}})");

    auto report = f.install(graph);
    REQUIRE(report.ok());
    REQUIRE(f.registry.tarball_requests() == 3);
    REQUIRE(f.project.exists("node_modules/a/index.js"));
}

TEST_CASE("exhausted retries are fatal", "[installer]") {
    Fixture f;
    std::string url = f.registry.publish("a", "1.0.0");
    f.registry.fail_tarball(url, 10);
    auto graph = f.resolve(R"({"name":"app","dependencies":{"a":"1.0.0"}})");

    auto report = f.install(graph);
    REQUIRE_FALSE(report.ok());
    REQUIRE(report.exit_code() == 1);
    REQUIRE(report.fatal->code == CrabbyError::Network);
    REQUIRE(report.failed_package == "a@1.0.0");
    REQUIRE(f.registry.tarball_requests() == 3);
    REQUIRE_FALSE(f.project.exists("node_modules/a"));
}

TEST_CASE("integrity mismatch aborts the install", "[installer]") {
    Fixture f;
    f.registry.publish("good", "1.0.0");
    std::string url = f.registry.publish("bad", "1.0.0");
    f.registry.corrupt_tarball(url);
    auto graph = f.resolve(R"({"name":"app","dependencies":{"bad":"1.0.0","good":"1.0.0"}})");

    auto report = f.install(graph);
    REQUIRE_FALSE(report.ok());
    REQUIRE(report.fatal->code == CrabbyError::IntegrityMismatch);
    REQUIRE(report.failed_package == "bad@1.0.0");
    REQUIRE_FALSE(f.project.exists("node_modules/bad"));
    REQUIRE(f.scripts.calls.empty());
    REQUIRE(f.install(graph).summary().find("install failed at bad@1.0.0") == 0);
}

// ===== Bins =====

TEST_CASE("bins are linked into the root .bin", "[installer][bin]") {
    Fixture f;
    FakePackage tool;
    tool.name = "tool";
    tool.version = "1.0.0";
    tool.bin["tool"] = "bin/tool.js";
    f.registry.publish(tool);

    auto graph = f.resolve(R"({"name":"app","dependencies":{"tool":"^1.0.0"}})");
    auto report = f.install(graph);
    REQUIRE(report.ok());
    REQUIRE(report.linked_bins == 1);

    fs::path link = f.project.path / "node_modules" / ".bin" / "tool";
    REQUIRE(fs::is_symlink(link));
    REQUIRE(fs::read_symlink(link) == fs::path("..") / "tool" / "bin" / "tool.js");
    auto perms = fs::status(link).permissions();
    REQUIRE((perms & fs::perms::owner_exec) != fs::perms::none);
}

TEST_CASE("bins of nested packages go to the nearest .bin", "[installer][bin]") {
    Fixture f;
    FakePackage old_tool;
    old_tool.name = "tool";
    old_tool.version = "1.0.0";
    old_tool.bin["tool"] = "cli.js";
    f.registry.publish(old_tool);
    FakePackage new_tool = old_tool;
    new_tool.version = "2.0.0";
    f.registry.publish(new_tool);
    f.registry.publish("wrapper", "1.0.0", {{"tool", "^2.0.0"}});

    auto graph = f.resolve(
        R"({"name":"app","dependencies":{"tool":"^1.0.0","wrapper":"^1.0.0"}})");
    auto report = f.install(graph);
    REQUIRE(report.ok());
    REQUIRE(report.linked_bins == 2);
    REQUIRE(fs::is_symlink(f.project.path / "node_modules/.bin/tool"));
    REQUIRE(fs::is_symlink(f.project.path / "node_modules/wrapper/node_modules/.bin/tool"));
    REQUIRE(fs::read_symlink(f.project.path / "node_modules/wrapper/node_modules/.bin/tool") ==
            fs::path("..") / "tool" / "cli.js");
}

TEST_CASE("direct dependency wins a bin name clash", "[installer][bin]") {
    Fixture f;
    FakePackage a;
    a.name = "aaa";
    a.version = "1.0.0";
    a.bin["shared"] = "a.js";
    f.registry.publish(a);
    FakePackage z;
    z.name = "zzz";
    z.version = "1.0.0";
    z.bin["shared"] = "z.js";
    f.registry.publish(z);
    f.registry.publish("host", "1.0.0", {{"aaa", "1.0.0"}});

    auto graph = f.resolve(R"({"name":"app","dependencies":{"host":"1.0.0","zzz":"1.0.0"}})");
    REQUIRE(f.install(graph).ok());
    REQUIRE(fs::read_symlink(f.project.path / "node_modules/.bin/shared") ==
            fs::path("..") / "zzz" / "z.js");
}

TEST_CASE("bins escaping the package are skipped", "[installer][bin]") {
    Fixture f;
    FakePackage tool;
    tool.name = "tool";
    tool.version = "1.0.0";
    tool.bin["tool"] = "cli.js";
    f.registry.publish(tool);
    auto graph = f.resolve(R"({"name":"app","dependencies":{"tool":"1.0.0"}})");
    REQUIRE(f.install(graph).linked_bins == 1);

    // Rewrite the cached manifest so the next install sees an escaping bin.
    CacheKey key{"tool", "1.0.0", f.registry.integrity_of("tool", "1.0.0")};
    auto cached = f.cache.lookup(key);
    REQUIRE(cached.has_value());
    fs::remove(*cached / "package.json");
    std::ofstream(*cached / "package.json")
        << R"({"name":"tool","version":"1.0.0","bin":{"tool":"../../outside.js"}})";

    TempDir other;
    Installer installer(f.registry, f.cache, f.scripts, quick_options());
    auto report = installer.install(graph, other.path);
    REQUIRE(report.ok());
    REQUIRE(report.linked_bins == 0);
    REQUIRE_FALSE(other.exists("node_modules/.bin/tool"));
}

// ===== Workspaces =====

TEST_CASE("workspace members are linked, not copied", "[installer][workspace]") {
    Fixture f;
    f.registry.publish("left-pad", "1.3.0");
    f.project.write_file("packages/lib/package.json",
        R"({"name":"lib","version":"0.1.0","dependencies":{"left-pad":"^1.0.0"}})");
    f.project.write_file("packages/lib/index.js", "");

    std::string root_json = R"({"name":"mono","workspaces":["packages/*"],"dependencies":{"lib":"workspace:*"}})";
    f.project.write_file("package.json", root_json);
    auto ws = Workspace::discover(f.project.path, manifest(root_json));
    REQUIRE(ws.is_ok());

    auto graph = f.resolve(root_json, &ws.value());
    auto report = f.install(graph, quick_options(), &ws.value());
    REQUIRE(report.ok());
    REQUIRE(report.linked_workspaces == 1);
    REQUIRE(report.installed == 1);

    fs::path link = f.project.path / "node_modules" / "lib";
    REQUIRE(fs::is_symlink(link));
    REQUIRE(fs::read_symlink(link) == fs::path("..") / "packages" / "lib");
    REQUIRE(fs::exists(link / "index.js"));
    REQUIRE(f.project.exists("node_modules/left-pad/index.js"));
}

// ===== Lifecycle scripts =====

TEST_CASE("scripts run dependencies first and the project last", "[installer][scripts]") {
    Fixture f;
    FakePackage dep;
    dep.name = "dep";
    dep.version = "1.0.0";
    dep.scripts["postinstall"] = "build-dep";
    f.registry.publish(dep);
    FakePackage top;
    top.name = "top";
    top.version = "1.0.0";
    top.dependencies = {{"dep", "^1.0.0"}};
    top.scripts["preinstall"] = "check";
    top.scripts["install"] = "compile";
    f.registry.publish(top);

    auto graph = f.resolve(
        R"({"name":"app","version":"1.0.0","dependencies":{"top":"^1.0.0"},)"
        R"("scripts":{"prepare":"prep","postinstall":"post","test":"unit"}})");
    auto report = f.install(graph);

    REQUIRE(report.ok());
    REQUIRE(report.scripts_run == 5);
    REQUIRE(f.script_log() == std::vector<std::string>{
        "dep@1.0.0:postinstall", "top@1.0.0:preinstall", "top@1.0.0:install",
        "app:postinstall", "app:prepare"});

    const auto& first = f.scripts.calls.front();
    REQUIRE(first.dir == f.project.path / "node_modules" / "dep");
    REQUIRE(first.bin_dirs.front() == f.project.path / "node_modules" / ".bin");
    REQUIRE(f.scripts.calls.back().dir == f.project.path);
}

TEST_CASE("nested package sees its own .bin first", "[installer][scripts]") {
    Fixture f;
    f.registry.publish("c", "1.0.0");
    FakePackage c2;
    c2.name = "c";
    c2.version = "2.0.0";
    c2.scripts["install"] = "native";
    f.registry.publish(c2);
    f.registry.publish("b", "1.0.0", {{"c", "^2.0.0"}});

    auto graph = f.resolve(R"({"name":"app","dependencies":{"b":"1.0.0","c":"1.0.0"}})");
    REQUIRE(f.install(graph).ok());
    REQUIRE(f.scripts.calls.size() == 1);
    const auto& call = f.scripts.calls[0];
    REQUIRE(call.dir == f.project.path / "node_modules/b/node_modules/c");
    REQUIRE(call.bin_dirs.size() >= 2);
    REQUIRE(call.bin_dirs[0] == f.project.path / "node_modules/b/node_modules/.bin");
    REQUIRE(call.bin_dirs.back() == f.project.path / "node_modules/.bin");
}

TEST_CASE("script failure is reported but not fatal", "[installer][scripts]") {
    Fixture f;
    FakePackage broken;
    broken.name = "broken";
    broken.version = "1.0.0";
    broken.scripts["preinstall"] = "fail";
    broken.scripts["postinstall"] = "never";
    f.registry.publish(broken);
    FakePackage fine;
    fine.name = "fine";
    fine.version = "1.0.0";
    fine.scripts["install"] = "ok";
    f.registry.publish(fine);

    auto graph = f.resolve(R"({"name":"app","dependencies":{"broken":"1.0.0","fine":"1.0.0"}})");
    auto report = f.install(graph);

    REQUIRE(report.ok());
    REQUIRE(report.exit_code() == 2);
    REQUIRE(report.failed_scripts.size() == 1);
    REQUIRE(report.failed_scripts[0].package == "broken@1.0.0");
    REQUIRE(report.failed_scripts[0].event == "preinstall");
    REQUIRE(report.failed_scripts[0].exit_code == 1);
    REQUIRE(report.failed_scripts[0].output == "boom\n");
    REQUIRE(f.project.exists("node_modules/broken/index.js"));

    auto log = f.script_log();
    REQUIRE(std::find(log.begin(), log.end(), "broken@1.0.0:postinstall") == log.end());
    REQUIRE(std::find(log.begin(), log.end(), "fine@1.0.0:install") != log.end());
    REQUIRE(report.summary().find("1 lifecycle script failed") != std::string::npos);
}

TEST_CASE("scripts can be disabled", "[installer][scripts]") {
    Fixture f;
    FakePackage pkg;
    pkg.name = "native";
    pkg.version = "1.0.0";
    pkg.scripts["install"] = "compile";
    f.registry.publish(pkg);
    auto graph = f.resolve(
        R"({"name":"app","dependencies":{"native":"1.0.0"},"scripts":{"prepare":"prep"}})");

    auto options = quick_options();
    options.ignore_scripts = true;
    auto report = f.install(graph, options);
    REQUIRE(report.ok());
    REQUIRE(report.scripts_run == 0);
    REQUIRE(f.scripts.calls.empty());
}

TEST_CASE("install options come from config", "[installer]") {
    auto cfg = Config::parse("[fetch]\njobs = 3\nretries = 5\n"
                             "[install]\nignore-scripts = true\nlink-mode = \"copy\"\n");
    REQUIRE(cfg.is_ok());
    auto o = InstallOptions::from_config(cfg.value());
    REQUIRE(o.fetch.jobs == 3);
    REQUIRE(o.fetch.retries == 5);
    REQUIRE(o.ignore_scripts);
    REQUIRE(o.link_mode == LinkMode::Copy);
}
