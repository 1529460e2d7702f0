/**
 * @file test_plugin_registry.cpp
 * @brief Unit tests for plugin lookup by name
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "plugins/plugin_registry.h"

TEST_CASE("Registered plugin names", "[registry]") {
    auto names = PluginRegistry::available_plugin_names();
    REQUIRE(names == std::vector<std::string>{"sql_injection", "xss"});
}

TEST_CASE("Aliases resolve to the plugin name", "[registry]") {
    REQUIRE(PluginRegistry::canonical_name("sql_injection") == "sql_injection");
    REQUIRE(PluginRegistry::canonical_name("sqli") == "sql_injection");
    REQUIRE(PluginRegistry::canonical_name("SQL") == "sql_injection");
    REQUIRE(PluginRegistry::canonical_name("xss") == "xss");
    REQUIRE(PluginRegistry::canonical_name("cross_site_scripting") == "xss");
    REQUIRE(PluginRegistry::canonical_name("ldap").empty());
    REQUIRE(PluginRegistry::canonical_name("").empty());
}

TEST_CASE("Each create() returns a fresh instance", "[registry]") {
    auto a = PluginRegistry::create("sqli");
    auto b = PluginRegistry::create("sql_injection");
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(a.get() != b.get());
    REQUIRE(a->name() == "sql_injection");
    REQUIRE_FALSE(a->description().empty());
    REQUIRE_FALSE(a->ready());

    auto x = PluginRegistry::create("cross_site_scripting");
    REQUIRE(x);
    REQUIRE(x->name() == "xss");

    REQUIRE(PluginRegistry::create("nosql") == nullptr);
}
