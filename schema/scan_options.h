#pragma once
#include <map>
#include <string>

/**
 * @file scan_options.h
 * @brief Caller-supplied configuration for one scan
 *
 * Read-only once the scan has started. Defaults are tuned for a single
 * small web application and are all overridable from config/scanner.yaml.
 */

struct AuthOptions {
    std::string login_url;
    std::string username;
    std::string password;
    std::string token_field;     // name of the CSRF hidden input

    AuthOptions() : token_field("user_token") {}

    bool enabled() const { return !login_url.empty() && !username.empty(); }
};

struct ScanOptions {
    int max_depth;
    int max_urls;
    long max_requests;               // 0 = unlimited, per request executor
    long request_delay_ms;
    int max_concurrent;
    long timeout_seconds;            // per request
    long scan_timeout_seconds;       // whole scan
    bool follow_redirects;
    bool verify_tls;
    bool respect_robots;
    bool crawl;
    double confidence_threshold;
    double union_confidence_threshold;
    double stored_xss_threshold;
    double time_base_delay_seconds;
    int union_max_columns;
    bool waf_bypass;
    bool allow_private_targets;
    std::string user_agent;
    std::string log_level;
    std::string audit_log;
    std::string error_patterns_file;   // extra SQL error patterns (YAML)
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> cookies;
    AuthOptions auth;

    ScanOptions()
        : max_depth(3),
          max_urls(100),
          max_requests(0),
          request_delay_ms(1000),
          max_concurrent(5),
          timeout_seconds(30),
          scan_timeout_seconds(1800),
          follow_redirects(false),
          verify_tls(true),
          respect_robots(true),
          crawl(true),
          confidence_threshold(0.5),
          union_confidence_threshold(0.7),
          stored_xss_threshold(0.8),
          time_base_delay_seconds(2.0),
          union_max_columns(5),
          waf_bypass(false),
          allow_private_targets(false),
          user_agent("injscan/0.1 (Security Testing)"),
          log_level("info")
    {}
};
