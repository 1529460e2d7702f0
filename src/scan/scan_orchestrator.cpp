/**
 * @file scan_orchestrator.cpp
 * @brief Scan lifecycle: validate, crawl, fan out to plugins, aggregate
 */

#include "scan_orchestrator.h"
#include "core/crawler.h"
#include "core/request_executor.h"
#include "core/url_utils.h"
#include "logging/console.h"
#include "plugins/plugin_registry.h"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

using Clock = std::chrono::steady_clock;

namespace {

/// scan_<UTC datetime>_<4 hex digits>
std::string generate_scan_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pick(0, 0xFFFF);

    std::ostringstream oss;
    oss << "scan_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << "_"
        << std::hex << std::setw(4) << std::setfill('0') << pick(rng);
    return oss.str();
}

CrawlResult seed_surface(const std::string& target) {
    CrawlResult cr;
    cr.url = target;
    cr.method = "GET";
    cr.params = url::parse_query(target);
    cr.source = cr.params.empty() ? "page" : "query";
    cr.page_url = target;
    cr.discovery_path = {target};
    return cr;
}

} // namespace

ScanOrchestrator::ScanOrchestrator(const HttpTransport& transport, const ScanOptions& opts)
    : transport_(transport),
      opts_(opts),
      validator_(opts.allow_private_targets),
      cancel_(std::make_shared<CancelToken>()),
      budget_(std::make_shared<RequestBudget>(opts.max_requests)),
      aggregator_(opts.confidence_threshold),
      scan_id_(generate_scan_id()),
      started_(false),
      finished_(false),
      user_cancelled_(false),
      crawl_requests_(0),
      timed_out_(false)
{
    aggregator_.set_listener([this](const Finding& f) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            stats_.vulnerabilities_found += 1;
        }
        logging::info("[" + f.severity + "] " + f.title + ": " + f.method + " " + f.url +
                      " parameter '" + f.parameter + "' (confidence " + std::to_string(f.confidence) + ")");
        audit("finding_recorded", finding_to_json(f));
    });
}

ScanOrchestrator::~ScanOrchestrator() {
    cancel_->cancel();
    if (runner_.joinable()) runner_.join();
    if (watchdog_.joinable()) watchdog_.join();
}

std::vector<std::string> ScanOrchestrator::available_plugins() {
    return PluginRegistry::available_plugin_names();
}

void ScanOrchestrator::set_audit_log(std::shared_ptr<logging::ChainLogger> logger) {
    audit_ = std::move(logger);
    if (audit_) audit_->set_scan_id(scan_id_);
}

void ScanOrchestrator::set_target_validator(const TargetValidator& validator) {
    validator_ = validator;
}

void ScanOrchestrator::audit(const std::string& event, const nlohmann::json& payload) {
    if (audit_ && !audit_->append(event, payload)) {
        logging::warn("audit log: could not record " + event);
    }
}

void ScanOrchestrator::start(const std::string& target, const std::vector<std::string>& scan_types) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (started_) {
            throw std::logic_error("scan " + scan_id_ + " was already started");
        }
    }

    // Rejected synchronously; the scan never reaches RUNNING
    validator_.validate(target);

    std::vector<std::string> requested = scan_types;
    if (requested.empty()) {
        requested = PluginRegistry::available_plugin_names();
    }
    std::vector<std::string> types;
    for (const auto& t : requested) {
        std::string name = PluginRegistry::canonical_name(t);
        if (name.empty()) {
            logging::warn("unknown scan type '" + t + "' skipped (available: sql_injection, xss)");
            continue;
        }
        if (std::find(types.begin(), types.end(), name) == types.end()) {
            types.push_back(name);
        }
    }
    if (types.empty()) {
        throw std::invalid_argument("no usable scan type requested");
    }

    target_ = target;
    types_ = types;
    started_at_ = Clock::now();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        started_ = true;
        stats_.status = ScanStatus::RUNNING;
        stats_.current_phase = "starting";
        stats_.current_url = target;
    }

    nlohmann::json start_payload;
    start_payload["target"] = target;
    start_payload["scan_types"] = types;
    start_payload["max_depth"] = opts_.max_depth;
    start_payload["max_urls"] = opts_.max_urls;
    start_payload["crawl"] = opts_.crawl;
    start_payload["confidence_threshold"] = opts_.confidence_threshold;
    audit("scan_start", start_payload);
    logging::info("scan " + scan_id_ + " started on " + target);

    runner_ = std::thread(&ScanOrchestrator::run, this);
    watchdog_ = std::thread(&ScanOrchestrator::watch_deadline, this);
}

void ScanOrchestrator::wait() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    if (!started_) return;
    state_cv_.wait(lock, [this] { return finished_; });
}

void ScanOrchestrator::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (finished_) return;
        user_cancelled_ = true;
    }
    logging::info("scan " + scan_id_ + " cancellation requested");
    cancel_->cancel();
}

ScanStatus ScanOrchestrator::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stats_.status;
}

std::string ScanOrchestrator::error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return error_;
}

std::vector<Finding> ScanOrchestrator::findings() const {
    return aggregator_.snapshot();
}

ScanStatistics ScanOrchestrator::statistics() const {
    ScanStatistics s;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        s = stats_;
        if (started_) {
            auto end = finished_ ? finished_at_ : Clock::now();
            s.elapsed_seconds = std::chrono::duration<double>(end - started_at_).count();
        }
    }
    s.timed_out = timed_out_.load();

    long requests = crawl_requests_.load();
    {
        std::lock_guard<std::mutex> lock(plugins_mutex_);
        for (const auto& run : plugins_) {
            requests += run.plugin->requests_sent();
        }
    }
    s.requests_sent = requests;
    return s;
}

void ScanOrchestrator::set_phase(const std::string& phase) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stats_.current_phase = phase;
}

void ScanOrchestrator::set_current_url(const std::string& u) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stats_.current_url = u;
}

void ScanOrchestrator::watch_deadline() {
    if (opts_.scan_timeout_seconds <= 0) return;

    std::unique_lock<std::mutex> lock(state_mutex_);
    bool done = state_cv_.wait_for(lock, std::chrono::seconds(opts_.scan_timeout_seconds),
                                   [this] { return finished_; });
    if (done) return;
    lock.unlock();

    timed_out_.store(true);
    logging::warn("scan " + scan_id_ + " hit its " + std::to_string(opts_.scan_timeout_seconds) +
                  "s deadline, returning partial results");
    cancel_->cancel();
}

std::vector<CrawlResult> ScanOrchestrator::discover() {
    if (!opts_.crawl) {
        return {seed_surface(target_)};
    }

    set_phase("crawling");

    RequestExecutor::Options eo;
    eo.request_delay_ms = opts_.request_delay_ms;
    eo.max_concurrent = opts_.max_concurrent;
    eo.max_requests = opts_.max_requests;
    eo.adaptive = opts_.request_delay_ms > 0;
    eo.default_headers = opts_.headers;
    RequestExecutor executor(transport_, eo, cancel_, budget_);
    executor.set_request_observer([this](const HttpRequest&) { crawl_requests_.fetch_add(1); });
    executor.session().set_cookies(opts_.cookies);
    if (opts_.auth.enabled()) {
        executor.session().configure(opts_.auth);
        if (!executor.session().authenticate()) {
            logging::warn("crawler: login to " + opts_.auth.login_url + " failed, crawling anonymously");
        }
    }

    Crawler::Options co;
    co.max_depth = opts_.max_depth;
    co.max_urls = opts_.max_urls;
    co.respect_robots = opts_.respect_robots;
    co.parallel_fetches = opts_.max_concurrent;
    Crawler crawler(executor, co);
    crawler.set_page_observer([this](const std::string& u) { set_current_url(u); });

    std::set<std::string> found = crawler.crawl(target_);
    std::vector<CrawlResult> surface = crawler.surface();

    // The seed is always tested, even when the crawl could not fetch it
    std::string seed_norm = url::normalize(target_);
    bool seed_listed = std::any_of(surface.begin(), surface.end(), [&](const CrawlResult& cr) {
        return cr.source != "form" && url::normalize(cr.url) == seed_norm;
    });
    if (!seed_listed) {
        CrawlResult seed = seed_surface(target_);
        if (!seed.params.empty()) {
            surface.insert(surface.begin(), seed);
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stats_.urls_crawled = static_cast<long>(crawler.visited().size());
    }

    nlohmann::json payload;
    payload["urls_found"] = found.size();
    payload["pages_visited"] = crawler.visited().size();
    payload["forms_found"] = crawler.forms().size();
    payload["surface"] = surface.size();
    audit("crawl_complete", payload);
    return surface;
}

std::vector<ScanOrchestrator::PluginRun> ScanOrchestrator::prepare_plugins() {
    std::vector<PluginRun> runs;
    for (const auto& name : types_) {
        std::unique_ptr<ScannerPlugin> plugin = PluginRegistry::create(name);
        if (!plugin) {
            logging::warn("no plugin registered as '" + name + "'");
            continue;
        }
        try {
            plugin->setup(opts_, transport_, cancel_, budget_);
        } catch (const std::exception& e) {
            // Excluded, not fatal
            logging::error("plugin " + name + " failed to set up: " + e.what());
            audit("plugin_failed", {{"plugin", name}, {"stage", "setup"}, {"error", e.what()}});
            plugin->cleanup();
            continue;
        }
        runs.push_back(PluginRun{name, std::move(plugin)});
    }
    return runs;
}

void ScanOrchestrator::run_plugin(ScannerPlugin& plugin, const std::vector<CrawlResult>& surface) {
    std::atomic<size_t> next(0);
    const std::string name = plugin.name();

    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < surface.size(); i = next.fetch_add(1)) {
            if (cancel_->cancelled()) return;
            const CrawlResult& target = surface[i];
            set_current_url(target.url);
            try {
                for (auto& f : plugin.scan(target)) {
                    aggregator_.add(std::move(f));
                }
            } catch (const std::exception& e) {
                logging::warn(name + ": target " + target.url + " failed: " + e.what());
            }

            std::lock_guard<std::mutex> lock(state_mutex_);
            stats_.plugins_executed[name] += 1;
            if (target.source == "form" && forms_seen_.insert(target.method + " " + target.url).second) {
                stats_.forms_tested += 1;
            }
        }
    };

    size_t n_workers = std::min<size_t>(surface.size(), static_cast<size_t>(std::max(1, opts_.max_concurrent)));
    std::vector<std::thread> workers;
    for (size_t i = 1; i < n_workers; ++i) {
        workers.emplace_back(worker);
    }
    if (n_workers > 0) worker();
    for (auto& t : workers) {
        t.join();
    }
}

void ScanOrchestrator::run() {
    try {
        std::vector<CrawlResult> surface = discover();
        logging::info("scan surface: " + std::to_string(surface.size()) + " target(s)");

        if (!cancel_->cancelled()) {
            set_phase("scanning");
            std::vector<PluginRun> runs = prepare_plugins();

            // Publish for statistics() before any request goes out
            {
                std::lock_guard<std::mutex> lock(plugins_mutex_);
                plugins_ = std::move(runs);
            }

            std::vector<std::thread> threads;
            for (auto& run : plugins_) {
                ScannerPlugin* plugin = run.plugin.get();
                threads.emplace_back([this, plugin, &surface]() { run_plugin(*plugin, surface); });
            }
            for (auto& t : threads) {
                t.join();
            }

            for (auto& run : plugins_) {
                run.plugin->cleanup();
            }

            if (plugins_.empty()) {
                finish(ScanStatus::FAILED, "every requested plugin failed to set up");
                return;
            }
        }

        bool cancelled_by_user;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            cancelled_by_user = user_cancelled_;
        }
        // A deadline is not an error: partial results count as a completed scan
        finish(cancelled_by_user ? ScanStatus::CANCELLED : ScanStatus::COMPLETED, "");
    } catch (const std::exception& e) {
        logging::error("scan " + scan_id_ + " failed: " + e.what());
        {
            std::lock_guard<std::mutex> lock(plugins_mutex_);
            for (auto& run : plugins_) {
                run.plugin->cleanup();
            }
        }
        finish(ScanStatus::FAILED, e.what());
    }
}

void ScanOrchestrator::finish(ScanStatus status, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stats_.status = status;
        stats_.current_phase = "done";
        error_ = error;
        finished_at_ = Clock::now();
    }

    ScanStatistics s = statistics();
    nlohmann::json payload;
    payload["status"] = scan_status_name(status);
    payload["findings"] = s.vulnerabilities_found;
    payload["requests_sent"] = s.requests_sent;
    payload["urls_crawled"] = s.urls_crawled;
    payload["forms_tested"] = s.forms_tested;
    payload["plugins_executed"] = s.plugins_executed;
    payload["elapsed_seconds"] = s.elapsed_seconds;
    payload["timed_out"] = s.timed_out;
    if (!error.empty()) payload["error"] = error;
    audit("scan_complete", payload);

    logging::info("scan " + scan_id_ + " " + scan_status_name(status) + ": " +
                  std::to_string(s.vulnerabilities_found) + " finding(s), " +
                  std::to_string(s.requests_sent) + " request(s)");

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        finished_ = true;
    }
    state_cv_.notify_all();
}
