/**
 * @file test_scan_config.cpp
 * @brief Unit tests for loading scan options from YAML and JSON
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "config/scan_config.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST_CASE("YAML settings and sections", "[config]") {
    const std::string yaml = R"(# scanner settings
---
max_depth: 2
max_urls: 40
request_delay_ms: 250   # slow target
confidence_threshold: 0.65
crawl: no
waf_bypass: yes
user_agent: "injscan-test # not a comment"

auth:
  login_url: http://app.test/login.php
  username: admin
  password: 'p#ss word'

headers:
  X-Scan: 1
cookies:
  security: low
log_level: debug
)";

    ScanOptions opts = config::parse_scan_config(yaml);
    REQUIRE(opts.max_depth == 2);
    REQUIRE(opts.max_urls == 40);
    REQUIRE(opts.request_delay_ms == 250);
    REQUIRE(opts.confidence_threshold == Approx(0.65));
    REQUIRE_FALSE(opts.crawl);
    REQUIRE(opts.waf_bypass);
    REQUIRE(opts.user_agent == "injscan-test # not a comment");
    REQUIRE(opts.auth.login_url == "http://app.test/login.php");
    REQUIRE(opts.auth.username == "admin");
    REQUIRE(opts.auth.password == "p#ss word");
    REQUIRE(opts.auth.token_field == "user_token");
    REQUIRE(opts.auth.enabled());
    REQUIRE(opts.headers.at("X-Scan") == "1");
    REQUIRE(opts.cookies.at("security") == "low");
    // A flat key after a section is top-level again
    REQUIRE(opts.log_level == "debug");

    // Untouched values keep their defaults
    REQUIRE(opts.max_concurrent == 5);
    REQUIRE(opts.union_max_columns == 5);
}

TEST_CASE("JSON settings with nested sections", "[config]") {
    const std::string doc = R"({
        "max_depth": 1,
        "verify_tls": false,
        "time_base_delay_seconds": 3.5,
        "union_max_columns": 8,
        "auth": {"login_url": "http://app.test/login", "username": "u", "token_field": "csrf"},
        "headers": {"Authorization": "Bearer abc"},
        "cookies": {"PHPSESSID": "xyz"},
        "unknown_key": [1, 2, 3]
    })";

    ScanOptions opts = config::parse_scan_config(doc);
    REQUIRE(opts.max_depth == 1);
    REQUIRE_FALSE(opts.verify_tls);
    REQUIRE(opts.time_base_delay_seconds == Approx(3.5));
    REQUIRE(opts.union_max_columns == 8);
    REQUIRE(opts.auth.token_field == "csrf");
    REQUIRE(opts.headers.at("Authorization") == "Bearer abc");
    REQUIRE(opts.cookies.at("PHPSESSID") == "xyz");
}

TEST_CASE("Config content is applied over a base", "[config]") {
    ScanOptions base;
    base.max_depth = 7;
    base.allow_private_targets = true;

    ScanOptions opts = config::parse_scan_config("max_urls: 5\n", base);
    REQUIRE(opts.max_depth == 7);
    REQUIRE(opts.allow_private_targets);
    REQUIRE(opts.max_urls == 5);
}

TEST_CASE("Single settings", "[config]") {
    ScanOptions opts;

    REQUIRE(config::apply_setting(opts, "respect_robots", "off"));
    REQUIRE_FALSE(opts.respect_robots);
    REQUIRE(config::apply_setting(opts, "respect_robots", "1"));
    REQUIRE(opts.respect_robots);
    REQUIRE(config::apply_setting(opts, "scan_timeout_seconds", "90"));
    REQUIRE(opts.scan_timeout_seconds == 90);
    REQUIRE(config::apply_setting(opts, "headers.X-Trace", "on"));
    REQUIRE(opts.headers.at("X-Trace") == "on");

    REQUIRE_FALSE(config::apply_setting(opts, "respect_robots", "maybe"));
    REQUIRE_FALSE(config::apply_setting(opts, "max_depth", "deep"));
    REQUIRE_FALSE(config::apply_setting(opts, "max_depth", "3x"));
    REQUIRE(opts.max_depth == 3);
    REQUIRE_FALSE(config::apply_setting(opts, "no_such_key", "1"));
}

TEST_CASE("Config files", "[config]") {
    SECTION("Missing file gives defaults") {
        ScanOptions opts = config::load_scan_config("does_not_exist_scanner.yaml");
        REQUIRE(opts.max_depth == ScanOptions().max_depth);
        REQUIRE(opts.request_delay_ms == 1000);
    }

    SECTION("File on disk") {
        std::string path = "test_scan_config.yaml";
        {
            std::ofstream out(path);
            out << "max_concurrent: 2\nallow_private_targets: true\n";
        }
        ScanOptions opts = config::load_scan_config(path);
        REQUIRE(opts.max_concurrent == 2);
        REQUIRE(opts.allow_private_targets);
        fs::remove(path);
    }
}
