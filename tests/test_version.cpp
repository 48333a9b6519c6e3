#include <catch2/catch.hpp>
#include <crabby/version.hpp>

using namespace crabby;

static Version V(const std::string& s) { return Version::parse(s).value(); }

static bool sat(const std::string& range, const std::string& version) {
    auto req = VersionReq::parse(range);
    REQUIRE(req.is_ok());
    return req.value().matches(V(version));
}

// ===== Version parsing =====

TEST_CASE("parse simple version", "[version]") {
    auto r = Version::parse("1.2.3");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().major == 1);
    REQUIRE(r.value().minor == 2);
    REQUIRE(r.value().patch == 3);
    REQUIRE(r.value().prerelease.empty());
}

TEST_CASE("parse version with prerelease and build", "[version]") {
    auto r = Version::parse("1.0.0-alpha.1+build.5");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().prerelease == std::vector<std::string>{"alpha", "1"});
    REQUIRE(r.value().build == std::vector<std::string>{"build", "5"});
    REQUIRE(r.value().to_string() == "1.0.0-alpha.1+build.5");
}

TEST_CASE("leading v and = are accepted", "[version]") {
    REQUIRE(V("v2.0.1").to_string() == "2.0.1");
    REQUIRE(V("=2.0.1").to_string() == "2.0.1");
}

TEST_CASE("version parse errors", "[version]") {
    REQUIRE(Version::parse("").is_err());
    REQUIRE(Version::parse("1").is_err());
    REQUIRE(Version::parse("1.2").is_err());
    REQUIRE(Version::parse("abc").is_err());
    REQUIRE(Version::parse("1.2.3-").is_err());
    REQUIRE(Version::parse("1.2.3.4").is_err());
}

// ===== Version ordering =====

TEST_CASE("version ordering", "[version]") {
    REQUIRE(V("1.0.0") < V("1.1.0"));
    REQUIRE(V("1.1.0") < V("1.1.1"));
    REQUIRE(V("1.1.1") < V("2.0.0"));
    REQUIRE(V("1.10.0") > V("1.9.0"));
}

TEST_CASE("prerelease precedence", "[version]") {
    // 1.0.0-alpha < 1.0.0-alpha.1 < 1.0.0-alpha.beta < 1.0.0-beta
    //   < 1.0.0-beta.2 < 1.0.0-beta.11 < 1.0.0-rc.1 < 1.0.0
    std::vector<std::string> chain = {
        "1.0.0-alpha", "1.0.0-alpha.1", "1.0.0-alpha.beta", "1.0.0-beta",
        "1.0.0-beta.2", "1.0.0-beta.11", "1.0.0-rc.1", "1.0.0"};
    for (size_t i = 0; i + 1 < chain.size(); ++i) {
        INFO(chain[i] << " < " << chain[i + 1]);
        REQUIRE(V(chain[i]) < V(chain[i + 1]));
    }
}

TEST_CASE("build metadata does not affect equality", "[version]") {
    REQUIRE(V("1.2.3+a") == V("1.2.3+b"));
}

// ===== PartialVersion =====

TEST_CASE("partial versions", "[version]") {
    auto one = PartialVersion::parse("1").value();
    REQUIRE(one.major == 1);
    REQUIRE(one.minor == -1);
    REQUIRE_FALSE(one.is_complete());
    REQUIRE(one.floor() == V("1.0.0"));

    auto x = PartialVersion::parse("1.x").value();
    REQUIRE(x.minor == -1);

    REQUIRE(PartialVersion::parse("*").value().is_any());
    REQUIRE(PartialVersion::parse("1.2.3").value().is_complete());
}

// ===== Ranges =====

TEST_CASE("caret ranges", "[version][range]") {
    REQUIRE(sat("^1.2.3", "1.2.3"));
    REQUIRE(sat("^1.2.3", "1.9.9"));
    REQUIRE_FALSE(sat("^1.2.3", "2.0.0"));
    REQUIRE_FALSE(sat("^1.2.3", "1.2.2"));

    REQUIRE(sat("^0.2.3", "0.2.9"));
    REQUIRE_FALSE(sat("^0.2.3", "0.3.0"));

    REQUIRE(sat("^0.0.3", "0.0.3"));
    REQUIRE_FALSE(sat("^0.0.3", "0.0.4"));

    REQUIRE(sat("^1.x", "1.5.0"));
    REQUIRE_FALSE(sat("^1.x", "2.0.0"));
}

TEST_CASE("tilde ranges", "[version][range]") {
    REQUIRE(sat("~1.2.3", "1.2.9"));
    REQUIRE_FALSE(sat("~1.2.3", "1.3.0"));
    REQUIRE(sat("~1", "1.9.0"));
    REQUIRE_FALSE(sat("~1", "2.0.0"));
}

TEST_CASE("x-ranges and wildcards", "[version][range]") {
    REQUIRE(sat("*", "3.1.4"));
    REQUIRE(sat("", "0.0.1"));
    REQUIRE(sat("1.x", "1.4.0"));
    REQUIRE_FALSE(sat("1.x", "2.0.0"));
    REQUIRE(sat("1.2", "1.2.7"));
    REQUIRE_FALSE(sat("1.2", "1.3.0"));
}

TEST_CASE("comparators and conjunction", "[version][range]") {
    REQUIRE(sat(">=1.0.0 <2.0.0", "1.5.0"));
    REQUIRE_FALSE(sat(">=1.0.0 <2.0.0", "2.0.0"));
    REQUIRE(sat(">= 1.0.0", "1.0.0"));
    REQUIRE(sat(">1.2", "1.3.0"));
    REQUIRE_FALSE(sat(">1.2", "1.2.9"));
    REQUIRE(sat("<=1.2", "1.2.9"));
    REQUIRE_FALSE(sat("<1.2", "1.2.0"));
    REQUIRE(sat("=1.2.3", "1.2.3"));
}

TEST_CASE("hyphen ranges", "[version][range]") {
    REQUIRE(sat("1.2.3 - 2.3.4", "1.2.3"));
    REQUIRE(sat("1.2.3 - 2.3.4", "2.3.4"));
    REQUIRE_FALSE(sat("1.2.3 - 2.3.4", "2.3.5"));
    REQUIRE(sat("1.2.3 - 2.3", "2.3.9"));
    REQUIRE_FALSE(sat("1.2.3 - 2.3", "2.4.0"));
}

TEST_CASE("disjunction", "[version][range]") {
    REQUIRE(sat("^1.0.0 || ^3.0.0", "3.2.0"));
    REQUIRE(sat("^1.0.0 || ^3.0.0", "1.0.1"));
    REQUIRE_FALSE(sat("^1.0.0 || ^3.0.0", "2.0.0"));
}

TEST_CASE("prereleases only match ranges that opt in on the same tuple", "[version][range]") {
    REQUIRE_FALSE(sat("^1.0.0", "1.1.0-beta.1"));
    REQUIRE(sat("^1.1.0-beta.0", "1.1.0-beta.1"));
    REQUIRE_FALSE(sat("^1.1.0-beta.0", "1.2.0-beta.1"));
    REQUIRE(sat("^1.1.0-beta.0", "1.2.0"));
    REQUIRE_FALSE(sat("^1.0.0", "2.0.0-0"));
}

TEST_CASE("normalized form", "[version][range]") {
    REQUIRE(VersionReq::parse("^1.2.3").value().normalized() == ">=1.2.3 <2.0.0-0");
    REQUIRE(VersionReq::parse("~1.2").value().normalized() == ">=1.2.0 <1.3.0-0");
    REQUIRE(VersionReq::parse("*").value().normalized() == "*");
    REQUIRE(VersionReq::parse("^1.2.3").value().to_string() == "^1.2.3");
}

TEST_CASE("invalid ranges", "[version][range]") {
    REQUIRE(VersionReq::parse("^").is_err());
    REQUIRE(VersionReq::parse(">=").is_err());
    REQUIRE(VersionReq::parse("latest").is_err());
    REQUIRE(VersionReq::parse("1.2.3.4").is_err());
    auto err = VersionReq::parse("^x.y").error();
    REQUIRE(err.code == CrabbyError::Version);
}

TEST_CASE("is_any", "[version][range]") {
    REQUIRE(VersionReq::any().is_any());
    REQUIRE(VersionReq::parse("").value().is_any());
    REQUIRE(VersionReq::parse("x").value().is_any());
    REQUIRE_FALSE(VersionReq::parse("^1").value().is_any());
}

// ===== max_satisfying =====

TEST_CASE("max_satisfying picks the highest match", "[version]") {
    std::vector<Version> versions = {V("1.0.0"), V("1.2.0"), V("1.3.1"), V("2.0.0"), V("2.1.0-rc.1")};

    auto best = max_satisfying(versions, {VersionReq::parse("^1.0.0").value()});
    REQUIRE(best.has_value());
    REQUIRE(best->to_string() == "1.3.1");

    auto joint = max_satisfying(versions, {VersionReq::parse("^1.0.0").value(),
                                           VersionReq::parse("<1.3.0").value()});
    REQUIRE(joint->to_string() == "1.2.0");

    auto none = max_satisfying(versions, {VersionReq::parse("^3").value()});
    REQUIRE_FALSE(none.has_value());

    auto latest = max_satisfying(versions, {VersionReq::any()});
    REQUIRE(latest->to_string() == "2.0.0");
}
