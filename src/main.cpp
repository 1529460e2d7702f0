#include "core/http_client.h"
#include "config/scan_config.h"
#include "logging/chain.h"
#include "logging/console.h"
#include "plugins/plugin_registry.h"
#include "scan/scan_orchestrator.h"
#include <schema/finding.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

/**
 * @brief Generates a unique identifier for a program run based on current UTC datetime
 * @return A string representing the run identifier
 */
std::string generate_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << "run_" << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

/// Split a comma-separated list, dropping empty items.
std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

void print_usage() {
    std::cerr << "Usage:\n";
    std::cerr << "  injscan scan --target URL [--types sql_injection,xss] [--config FILE]\n";
    std::cerr << "               [--depth N] [--max-urls N] [--no-crawl] [--timeout SECONDS]\n";
    std::cerr << "               [--delay MS] [--concurrency N] [--waf-bypass] [--allow-private]\n";
    std::cerr << "               [--out FILE] [--audit-log FILE] [--log-level LEVEL]\n";
    std::cerr << "  injscan plugins\n";
    std::cerr << "  injscan verify <log-file.jsonl>\n";
}

/**
 * @brief Write findings as a JSON array
 * @param findings Findings to write
 * @param path Output file
 * @return true if the file was written
 */
bool write_findings(const std::vector<Finding>& findings, const std::string& path) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& f : findings) {
        out.push_back(finding_to_json(f));
    }

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        return false;
    }
    // Response snippets may contain invalid UTF-8
    ofs << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    return ofs.good();
}

/**
 * @brief Executes a full scan workflow on a specified target
 * @param argc Argument count from command line
 * @param argv Argument values from command line
 * @return 0 when no findings, 1 when findings exist, 2 on usage or configuration errors
 */
int run_scan(int argc, char** argv) {
    std::string target;
    std::string outfile = "out/findings.json";
    std::string config_path;
    std::vector<std::string> types;

    // Config file first so that flags override it
    for (int i = 2; i < argc; i++) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            config_path = argv[i + 1];
        }
    }
    ScanOptions opts = config_path.empty() ? ScanOptions() : config::load_scan_config(config_path);

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        bool has_value = i + 1 < argc;
        bool ok = true;
        if (a == "--target" && has_value) {
            target = argv[++i];
        } else if (a == "--types" && has_value) {
            types = split_list(argv[++i]);
        } else if (a == "--config" && has_value) {
            ++i;
        } else if (a == "--out" && has_value) {
            outfile = argv[++i];
        } else if (a == "--depth" && has_value) {
            ok = config::apply_setting(opts, "max_depth", argv[++i]);
        } else if (a == "--max-urls" && has_value) {
            ok = config::apply_setting(opts, "max_urls", argv[++i]);
        } else if (a == "--timeout" && has_value) {
            ok = config::apply_setting(opts, "scan_timeout_seconds", argv[++i]);
        } else if (a == "--delay" && has_value) {
            ok = config::apply_setting(opts, "request_delay_ms", argv[++i]);
        } else if (a == "--concurrency" && has_value) {
            ok = config::apply_setting(opts, "max_concurrent", argv[++i]);
        } else if (a == "--audit-log" && has_value) {
            opts.audit_log = argv[++i];
        } else if (a == "--log-level" && has_value) {
            opts.log_level = argv[++i];
        } else if (a == "--no-crawl") {
            opts.crawl = false;
        } else if (a == "--waf-bypass") {
            opts.waf_bypass = true;
        } else if (a == "--allow-private") {
            opts.allow_private_targets = true;
        } else {
            std::cerr << "Error: unknown or incomplete option " << a << "\n";
            return 2;
        }
        if (!ok) {
            std::cerr << "Error: invalid value for " << a << "\n";
            return 2;
        }
    }

    if (target.empty()) {
        std::cerr << "Error: --target required\n";
        print_usage();
        return 2;
    }

    logging::set_level(logging::parse_level(opts.log_level));

    HttpClient::Options copts;
    copts.timeout_seconds = opts.timeout_seconds;
    copts.follow_redirects = opts.follow_redirects;
    copts.verify_tls = opts.verify_tls;
    copts.user_agent = opts.user_agent;
    HttpClient client(copts);

    std::string run_id = generate_run_id();
    ScanOrchestrator scan(client, opts);

    std::string audit_path = opts.audit_log.empty() ? "out/reports/injscan_chain.jsonl" : opts.audit_log;
    std::filesystem::path audit_dir = std::filesystem::path(audit_path).parent_path();
    if (!audit_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(audit_dir, ec);
    }
    scan.set_audit_log(std::make_shared<logging::ChainLogger>(audit_path, run_id));

    try {
        scan.start(target, types);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    std::cout << "Starting scan: " << scan.scan_id() << " (" << run_id << ")\n";
    std::cout << "Target: " << target << "\n";

    // Progress line every few seconds while the scan runs
    while (!is_terminal(scan.status())) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        static auto last = std::chrono::steady_clock::now();
        auto now = std::chrono::steady_clock::now();
        if (now - last >= std::chrono::seconds(5)) {
            last = now;
            ScanStatistics s = scan.statistics();
            logging::info("[" + s.current_phase + "] " + std::to_string(s.requests_sent) + " requests, " +
                          std::to_string(s.vulnerabilities_found) + " findings, at " + s.current_url);
        }
    }
    scan.wait();

    ScanStatistics stats = scan.statistics();
    std::vector<Finding> findings = scan.findings();

    std::cout << "Scan " << scan_status_name(stats.status);
    if (stats.timed_out) std::cout << " (deadline reached, partial results)";
    std::cout << "\n";
    std::cout << "  URLs crawled:  " << stats.urls_crawled << "\n";
    std::cout << "  Forms tested:  " << stats.forms_tested << "\n";
    std::cout << "  Requests sent: " << stats.requests_sent << "\n";
    std::cout << "  Findings:      " << findings.size() << "\n";
    std::cout << "  Elapsed:       " << std::fixed << std::setprecision(1) << stats.elapsed_seconds << "s\n";
    if (stats.status == ScanStatus::FAILED) {
        std::cerr << "Error: " << scan.error() << "\n";
    }

    if (!write_findings(findings, outfile)) {
        std::cerr << "Error: could not write " << outfile << "\n";
        return 2;
    }
    std::cout << "Findings written to " << outfile << "\n";
    std::cout << "Audit log: " << audit_path << "\n";

    return findings.empty() ? 0 : 1;
}

/**
 * @brief List the registered scanner plugins
 * @return 0
 */
int cmd_plugins() {
    for (const auto& name : PluginRegistry::available_plugin_names()) {
        std::unique_ptr<ScannerPlugin> plugin = PluginRegistry::create(name);
        std::cout << std::left << std::setw(16) << name << (plugin ? plugin->description() : "") << "\n";
    }
    return 0;
}

/**
 * @brief Verifies the integrity of a JSONL log file
 * @param argc Argument count from the command line
 * @param argv Argument values from the command line; argv[2] should be the log file path
 * @return 0 if verification succeeds, 1 if it fails, 2 if usage is incorrect
 */
int cmd_verify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: injscan verify <log-file.jsonl>\n";
        return 2;
    }

    std::string log_path = argv[2];
    std::cout << "Verifying log: " << log_path << "\n";

    logging::ChainVerification v = logging::ChainLogger::check(log_path);
    if (v.ok) {
        std::cout << "Log verified: " << v.entries << " entries, chain intact\n";
        return 0;
    }
    std::cerr << "Verification failed";
    if (v.broken_at >= 0) std::cerr << " at entry " << v.broken_at;
    std::cerr << ": " << v.reason << "\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    std::string command = argv[1];

    if (command == "scan") {
        return run_scan(argc, argv);
    } else if (command == "plugins") {
        return cmd_plugins();
    } else if (command == "verify") {
        return cmd_verify(argc, argv);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 2;
    }
}
