#include <catch2/catch_test_macros.hpp>
#include "schema/attribute_resolver.hpp"

using namespace shapesql;

static Attribute attr(std::optional<std::string> ns, std::string key) {
    Attribute a;
    a.ns = std::move(ns);
    a.key = std::move(key);
    return a;
}

TEST_CASE("AttributeResolver: exact namespace and key", "[attributes]") {
    const auto f = shapes::field("id", shapes::u64(), {attr("psql", "primary_key")});
    REQUIRE(AttributeResolver::resolve(f));
    REQUIRE(AttributeResolver::resolve(
        shapes::field("id", shapes::u64(), {shapes::primary_key_attribute()})));
}

TEST_CASE("AttributeResolver: no attributes", "[attributes]") {
    REQUIRE_FALSE(AttributeResolver::resolve(shapes::field("id", shapes::u64())));
}

TEST_CASE("AttributeResolver: near misses do not match", "[attributes]") {
    SECTION("Namespace case differs") {
        REQUIRE_FALSE(AttributeResolver::resolve(
            shapes::field("id", shapes::u64(), {attr("PSQL", "primary_key")})));
    }

    SECTION("Key case differs") {
        REQUIRE_FALSE(AttributeResolver::resolve(
            shapes::field("id", shapes::u64(), {attr("psql", "Primary_Key")})));
    }

    SECTION("Other namespace") {
        REQUIRE_FALSE(AttributeResolver::resolve(
            shapes::field("id", shapes::u64(), {attr("serde", "primary_key")})));
    }

    SECTION("Partial key") {
        REQUIRE_FALSE(AttributeResolver::resolve(
            shapes::field("id", shapes::u64(), {attr("psql", "primary")})));
    }

    SECTION("Missing namespace") {
        REQUIRE_FALSE(AttributeResolver::resolve(
            shapes::field("id", shapes::u64(), {attr(std::nullopt, "primary_key")})));
    }

    SECTION("Empty namespace") {
        REQUIRE_FALSE(AttributeResolver::resolve(
            shapes::field("id", shapes::u64(), {attr("", "primary_key")})));
    }
}

TEST_CASE("AttributeResolver: scans every attribute", "[attributes]") {
    const auto f = shapes::field("id", shapes::u64(), {
        attr("serde", "rename"),
        attr(std::nullopt, "doc"),
        attr("psql", "primary_key"),
    });
    REQUIRE(AttributeResolver::resolve(f));
}

TEST_CASE("AttributeResolver: attribute value is ignored", "[attributes]") {
    auto a = attr("psql", "primary_key");
    a.value = "false";
    REQUIRE(AttributeResolver::resolve(shapes::field("id", shapes::u64(), {a})));
}
