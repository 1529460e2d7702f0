/**
 * @file fake_transport.cpp
 * @brief Implementation of the in-memory test transport
 */

#include "fake_transport.h"
#include "core/url_utils.h"

namespace test_helpers {

void FakeTransport::route(const std::string& path, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[path] = std::move(handler);
}

void FakeTransport::set_fallback(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    fallback_ = std::move(handler);
}

void FakeTransport::fail_next(int n, bool timed_out) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_left_ = n;
    fail_as_timeout_ = timed_out;
}

bool FakeTransport::perform(const HttpRequest& req, HttpResponse& resp) const {
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.push_back(req);

        if (failures_left_ > 0) {
            --failures_left_;
            resp.status = 0;
            resp.timed_out = fail_as_timeout_;
            resp.error = fail_as_timeout_ ? "Timeout was reached" : "Couldn't connect to server";
            return false;
        }

        auto it = routes_.find(url::path_of(req.url));
        if (it != routes_.end()) {
            handler = it->second;
        } else {
            handler = fallback_;
        }
    }

    // Handlers run unlocked so slow ones do not serialize concurrent callers
    if (handler) {
        handler(req, resp);
    } else {
        resp = html(404, "<html><body>Not Found</body></html>");
    }
    resp.effective_url = req.url;
    resp.body_bytes = resp.body.size();
    return true;
}

std::vector<HttpRequest> FakeTransport::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

size_t FakeTransport::request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.size();
}

size_t FakeTransport::count_for(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& req : log_) {
        if (url::path_of(req.url) == path) ++n;
    }
    return n;
}

HttpResponse html(long status, const std::string& body) {
    HttpResponse resp;
    resp.status = status;
    resp.headers.push_back({"content-type", "text/html; charset=utf-8"});
    resp.body = body;
    return resp;
}

HttpResponse redirect(long status, const std::string& location) {
    HttpResponse resp;
    resp.status = status;
    resp.headers.push_back({"location", location});
    resp.headers.push_back({"content-type", "text/html; charset=utf-8"});
    return resp;
}

std::string param(const HttpRequest& req, const std::string& name) {
    url::Params params = url::parse_query(req.url);
    if (!req.body.empty()) {
        url::Params body = url::parse_query(req.body);
        params.insert(params.end(), body.begin(), body.end());
    }
    for (const auto& [key, value] : params) {
        if (key == name) return value;
    }
    return "";
}

RequestExecutor::Options fast_executor_options() {
    RequestExecutor::Options opts;
    opts.request_delay_ms = 0;
    opts.adaptive = false;
    opts.retry.base_delay_ms = 1;
    opts.retry.max_delay_ms = 5;
    return opts;
}

ScanOptions fast_scan_options() {
    ScanOptions opts;
    opts.request_delay_ms = 0;
    opts.allow_private_targets = true;
    return opts;
}

} // namespace test_helpers
