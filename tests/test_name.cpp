#include <catch2/catch.hpp>
#include <crabby/name.hpp>

using namespace crabby;

// ===== Valid names =====

TEST_CASE("plain package name", "[name]") {
    auto r = PkgName::parse("left-pad");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().is_scoped());
    REQUIRE(r.value().bare() == "left-pad");
    REQUIRE(r.value().scope().empty());
    REQUIRE(r.value().filename() == "left-pad");
}

TEST_CASE("scoped package name", "[name]") {
    auto r = PkgName::parse("@types/node");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_scoped());
    REQUIRE(r.value().scope() == "@types");
    REQUIRE(r.value().bare() == "node");
    REQUIRE(r.value().raw() == "@types/node");
    REQUIRE(r.value().filename() == "@types+node");
}

TEST_CASE("names with dots, underscores and tildes", "[name]") {
    REQUIRE(is_valid_package_name("lodash.merge"));
    REQUIRE(is_valid_package_name("a_b"));
    REQUIRE(is_valid_package_name("x~y"));
    REQUIRE(is_valid_package_name("JSONStream"));
}

// ===== Invalid names =====

TEST_CASE("empty and overlong names", "[name]") {
    REQUIRE_FALSE(is_valid_package_name(""));
    REQUIRE_FALSE(is_valid_package_name(std::string(215, 'a')));
    REQUIRE(is_valid_package_name(std::string(214, 'a')));
}

TEST_CASE("leading dot or underscore", "[name]") {
    REQUIRE_FALSE(is_valid_package_name(".hidden"));
    REQUIRE_FALSE(is_valid_package_name("_private"));
    REQUIRE_FALSE(is_valid_package_name("@scope/.x"));
}

TEST_CASE("names cannot escape node_modules", "[name]") {
    REQUIRE_FALSE(is_valid_package_name("../evil"));
    REQUIRE_FALSE(is_valid_package_name("a/b"));
    REQUIRE_FALSE(is_valid_package_name("@scope/a/b"));
    REQUIRE_FALSE(is_valid_package_name("a..b"));
    REQUIRE_FALSE(is_valid_package_name("a\\b"));
}

TEST_CASE("malformed scopes", "[name]") {
    REQUIRE_FALSE(is_valid_package_name("@scope"));
    REQUIRE_FALSE(is_valid_package_name("@/name"));
    REQUIRE_FALSE(is_valid_package_name("@scope/"));
}

TEST_CASE("reserved and special characters", "[name]") {
    REQUIRE_FALSE(is_valid_package_name("node_modules"));
    REQUIRE_FALSE(is_valid_package_name("favicon.ico"));
    REQUIRE_FALSE(is_valid_package_name("has space"));
    REQUIRE_FALSE(is_valid_package_name("semi;colon"));

    auto r = PkgName::parse("bad name");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrabbyError::InvalidArg);
    REQUIRE(r.error().message.find("bad name") != std::string::npos);
}

TEST_CASE("name equality", "[name]") {
    REQUIRE(PkgName::parse("a").value() == PkgName::parse("a").value());
    REQUIRE(PkgName::parse("@s/a").value() != PkgName::parse("a").value());
}
