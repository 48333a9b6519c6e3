#include <catch2/catch.hpp>
#include <crabby/lockfile.hpp>
#include "test_support.hpp"

using namespace crabby;
using crabby::testing::TempDir;

static LockEntry registry_entry(const std::string& name, const std::string& version,
                                const std::string& path) {
    LockEntry e;
    e.name = name;
    e.version = version;
    e.path = path;
    e.integrity = Integrity::compute(HashAlgorithm::Sha512, name + version).value().to_string();
    e.resolved = "https://registry.test/" + name + "/-/" + name + "-" + version + ".tgz";
    return e;
}

static Lockfile sample_lockfile() {
    Lockfile lf;
    lf.manifest_hash = "abc123";
    auto b = registry_entry("b", "2.0.0", "node_modules/a/node_modules/b");
    auto a = registry_entry("a", "1.0.0", "node_modules/a");
    a.requirements.push_back(LockRequirement{"b", "2.0.0"});
    auto s = registry_entry("@scope/c", "3.1.0", "node_modules/@scope/c");

    LockEntry ws;
    ws.name = "lib";
    ws.version = "0.1.0";
    ws.path = "node_modules/lib";
    ws.source = PackageSource::Workspace;
    ws.resolved = "packages/lib";

    lf.packages = {b, s, ws, a};
    return lf;
}

// ===== Helpers =====

TEST_CASE("install paths nest under node_modules", "[lockfile]") {
    REQUIRE(install_path("", "a") == "node_modules/a");
    REQUIRE(install_path("node_modules/a", "b") == "node_modules/a/node_modules/b");
    REQUIRE(install_path("", "@s/x") == "node_modules/@s/x");
}

TEST_CASE("entry scope path", "[lockfile]") {
    LockEntry e;
    e.path = "node_modules/a";
    REQUIRE(e.scope_path().empty());
    e.path = "node_modules/@s/a/node_modules/@t/b";
    REQUIRE(e.scope_path() == "node_modules/@s/a");
}

TEST_CASE("requirement strings split at the last @", "[lockfile]") {
    auto r = LockRequirement::parse("@scope/pkg@1.2.3");
    REQUIRE(r.has_value());
    REQUIRE(r->name == "@scope/pkg");
    REQUIRE(r->version == "1.2.3");
    REQUIRE_FALSE(LockRequirement::parse("nover").has_value());
    REQUIRE_FALSE(LockRequirement::parse("x@").has_value());
    REQUIRE_FALSE(LockRequirement::parse("@1.0.0").has_value());
}

// ===== Serialization =====

TEST_CASE("serialize is sorted and deterministic", "[lockfile]") {
    auto lf = sample_lockfile();
    std::string first = lf.serialize();

    auto shuffled = lf;
    std::reverse(shuffled.packages.begin(), shuffled.packages.end());
    REQUIRE(shuffled.serialize() == first);

    REQUIRE(first.rfind("# This file is auto-generated by crabby", 0) == 0);
    REQUIRE(first.find("lockfile-version = 1") != std::string::npos);
    REQUIRE(first.find("[[packages]]") != std::string::npos);
    REQUIRE(first.find("node_modules/@scope/c") < first.find("node_modules/a/node_modules/b"));
}

TEST_CASE("parse of serialized lockfile restores every field", "[lockfile]") {
    auto lf = sample_lockfile();
    auto parsed = Lockfile::parse(lf.serialize());
    REQUIRE(parsed.is_ok());
    const auto& out = parsed.value();
    REQUIRE(out.manifest_hash == "abc123");
    REQUIRE(out.integrity_algorithm == HashAlgorithm::Sha512);
    REQUIRE(out.packages.size() == 4);

    const auto* a = out.find("node_modules/a");
    REQUIRE(a != nullptr);
    REQUIRE(a->version == "1.0.0");
    REQUIRE(a->requirements.size() == 1);
    REQUIRE(a->requirements[0].to_string() == "b@2.0.0");

    const auto* ws = out.find_in_scope("", "lib");
    REQUIRE(ws != nullptr);
    REQUIRE(ws->source == PackageSource::Workspace);
    REQUIRE(ws->integrity.empty());
    REQUIRE(ws->resolved == "packages/lib");

    REQUIRE(out.find_in_scope("node_modules/a", "b") != nullptr);
    REQUIRE(out.find("node_modules/b") == nullptr);

    REQUIRE(out.serialize() == lf.serialize());
}

TEST_CASE("save and load through the filesystem", "[lockfile]") {
    TempDir tmp;
    auto lf = sample_lockfile();
    REQUIRE(lf.save(tmp.path / kLockfileName).is_ok());
    auto loaded = Lockfile::load(tmp.path / kLockfileName);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().packages.size() == 4);
    REQUIRE(Lockfile::load(tmp.path / "missing.lock").is_err());
}

// ===== Parse errors =====

TEST_CASE("lockfile parse errors", "[lockfile]") {
    auto bad = [](const std::string& text) {
        auto r = Lockfile::parse(text);
        INFO(text);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == CrabbyError::Parse);
    };
    bad("not = [valid");
    bad("manifest-hash = \"x\"\n");
    bad("lockfile-version = 99\n");
    bad("lockfile-version = 1\nintegrity-algorithm = \"md5\"\n");
    bad("lockfile-version = 1\n[[packages]]\nname = \"Bad Name\"\nversion = \"1.0.0\"\n");
    bad("lockfile-version = 1\n[[packages]]\nname = \"a\"\nversion = \"one\"\n");
    bad("lockfile-version = 1\n[[packages]]\nname = \"a\"\nversion = \"1.0.0\"\n"
        "path = \"node_modules/../../etc\"\n");
    bad("lockfile-version = 1\n[[packages]]\nname = \"a\"\nversion = \"1.0.0\"\n"
        "path = \"node_modules/b\"\n");
    bad("lockfile-version = 1\n[[packages]]\nname = \"a\"\nversion = \"1.0.0\"\n"
        "source = \"git\"\n");
    bad("lockfile-version = 1\n[[packages]]\nname = \"a\"\nversion = \"1.0.0\"\n"
        "integrity = \"sha512-nope\"\n");
    bad("lockfile-version = 1\n[[packages]]\nname = \"a\"\nversion = \"1.0.0\"\n"
        "requires = [\"b\"]\n");
    bad("lockfile-version = 1\n"
        "[[packages]]\nname = \"a\"\nversion = \"1.0.0\"\n"
        "[[packages]]\nname = \"a\"\nversion = \"1.0.1\"\n");
    // nested under a package the lockfile does not have
    bad("lockfile-version = 1\n[[packages]]\nname = \"b\"\nversion = \"1.0.0\"\n"
        "path = \"node_modules/a/node_modules/b\"\n");
}

TEST_CASE("requirements keep their declaration order", "[lockfile]") {
    Lockfile lf;
    auto a = registry_entry("a", "1.0.0", "node_modules/a");
    a.requirements.push_back(LockRequirement{"z", "1.0.0"});
    a.requirements.push_back(LockRequirement{"y", "1.0.0"});
    lf.packages = {a, registry_entry("y", "1.0.0", "node_modules/y"),
                   registry_entry("z", "1.0.0", "node_modules/z")};

    std::string text = lf.serialize();
    REQUIRE(text.find("\"z@1.0.0\"") < text.find("\"y@1.0.0\""));

    auto parsed = Lockfile::parse(text).value();
    const auto* out = parsed.find("node_modules/a");
    REQUIRE(out != nullptr);
    REQUIRE(out->requirements.size() == 2);
    REQUIRE(out->requirements[0].name == "z");
    REQUIRE(out->requirements[1].name == "y");
    REQUIRE(parsed.serialize() == text);
}

TEST_CASE("missing path defaults to the root scope", "[lockfile]") {
    auto r = Lockfile::parse("lockfile-version = 1\n[[packages]]\nname = \"a\"\nversion = \"1.0.0\"\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().packages[0].path == "node_modules/a");
    REQUIRE(r.value().packages[0].source == PackageSource::Registry);
}

// ===== Consistency =====

TEST_CASE("lockfile consistency with the manifest", "[lockfile]") {
    auto m = Manifest::parse(
        R"({"name":"app","dependencies":{"a":"^1.0.0","lib":"workspace:*"}})").value();
    auto lf = sample_lockfile();
    lf.manifest_hash = m.dependency_hash().value();
    REQUIRE(lf.is_consistent(m, true));

    SECTION("hash mismatch") {
        lf.manifest_hash = "stale";
        REQUIRE_FALSE(lf.is_consistent(m, true));
    }

    SECTION("locked version no longer satisfies the range") {
        auto changed = Manifest::parse(
            R"({"name":"app","dependencies":{"a":"^2.0.0","lib":"workspace:*"}})").value();
        lf.manifest_hash = changed.dependency_hash().value();
        REQUIRE_FALSE(lf.is_consistent(changed, true));
    }

    SECTION("root dependency missing from the lockfile") {
        auto more = Manifest::parse(
            R"({"name":"app","dependencies":{"a":"^1.0.0","lib":"workspace:*","zzz":"^1"}})").value();
        lf.manifest_hash = more.dependency_hash().value();
        REQUIRE_FALSE(lf.is_consistent(more, true));
    }
}
