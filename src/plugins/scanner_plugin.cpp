// Injection plugin base implementation

#include "scanner_plugin.h"
#include "logging/console.h"
#include <algorithm>
#include <iterator>

InjectionPlugin::InjectionPlugin() : requests_sent_(0) {}

InjectionPlugin::~InjectionPlugin() = default;

void InjectionPlugin::setup(const ScanOptions& opts,
                            const HttpTransport& transport,
                            std::shared_ptr<CancelToken> cancel,
                            std::shared_ptr<RequestBudget> budget) {
    opts_ = opts;
    requests_sent_.store(0);

    RequestExecutor::Options eo;
    eo.request_delay_ms = opts.request_delay_ms;
    eo.max_concurrent = opts.max_concurrent;
    eo.max_requests = opts.max_requests;
    // A zero delay turns pacing off entirely
    eo.adaptive = opts.request_delay_ms > 0;
    eo.default_headers = opts.headers;

    executor_ = std::make_unique<RequestExecutor>(transport, eo, std::move(cancel), std::move(budget));
    executor_->set_request_observer([this](const HttpRequest&) { requests_sent_.fetch_add(1); });
    executor_->session().set_cookies(opts.cookies);

    if (opts.auth.enabled()) {
        executor_->session().configure(opts.auth);
        if (!executor_->session().authenticate()) {
            logging::warn(name() + ": login to " + opts.auth.login_url +
                          " failed, scanning without a fresh session");
        }
    }

    on_setup();
}

void InjectionPlugin::cleanup() {
    executor_.reset();
}

bool InjectionPlugin::cancelled() const {
    return !executor_ || executor_->cancelled();
}

double InjectionPlugin::threshold_for(Strategy s) const {
    switch (s) {
        case Strategy::UNION_BASED:
            return std::max(opts_.confidence_threshold, opts_.union_confidence_threshold);
        case Strategy::STORED:
            return std::max(opts_.confidence_threshold, opts_.stored_xss_threshold);
        default:
            break;
    }
    return opts_.confidence_threshold;
}

std::vector<Finding> InjectionPlugin::scan(const CrawlResult& target) {
    std::vector<Finding> findings;
    if (!executor_) {
        logging::warn(name() + ": scan() called before setup()");
        return findings;
    }

    for (const auto& point : injection_points(target, include_path_segments())) {
        if (cancelled()) break;
        try {
            auto found = scan_point(point);
            findings.insert(findings.end(),
                            std::make_move_iterator(found.begin()),
                            std::make_move_iterator(found.end()));
        } catch (const std::exception& e) {
            logging::warn(name() + ": testing '" + point.parameter + "' on " + point.url +
                          " failed: " + e.what());
        }
    }
    return findings;
}

std::vector<Finding> InjectionPlugin::scan_url(const std::string& target_url) {
    CrawlResult target;
    target.url = target_url;
    target.method = "GET";
    target.source = "query";
    target.params = url::parse_query(target_url);
    target.page_url = target_url;
    return scan(target);
}

SendResult InjectionPlugin::send_probe(const InjectionPoint& point, const std::string& value) {
    SendResult sent = executor_->send(build_probe_request(point, value, PayloadEncoding::STANDARD));

    bool url_borne = point.origin == ParamOrigin::QUERY || point.origin == ParamOrigin::PATH;
    if (!opts_.waf_bypass || !url_borne) {
        return sent;
    }

    for (PayloadEncoding alt : {PayloadEncoding::WAF, PayloadEncoding::WAF_DOUBLE}) {
        if (!sent.ok() || (sent.response.status != 403 && sent.response.status != 406)) {
            break;
        }
        logging::debug(name() + ": probe blocked with " + std::to_string(sent.response.status) +
                       ", retrying with alternate encoding");
        sent = executor_->send(build_probe_request(point, value, alt));
    }
    return sent;
}

std::string compose_value(const std::string& original, const std::string& payload) {
    if (payload.empty()) return original;
    switch (payload.front()) {
        case '\'':
        case '"':
        case ')':
        case '\\':
        case ' ':
        case ';':
            return original + payload;
        default:
            break;
    }
    return payload;
}
