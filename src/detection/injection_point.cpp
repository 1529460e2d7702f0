// Injection point enumeration and probe request construction

#include "injection_point.h"
#include "payloads/payload_catalog.h"
#include <algorithm>
#include <random>
#include <set>

namespace {

const std::set<std::string>& non_injectable_types() {
    static const std::set<std::string> types = {"submit", "button", "reset", "image", "file"};
    return types;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); });
    return s;
}

std::string encode_value(const std::string& value, PayloadEncoding encoding) {
    switch (encoding) {
        case PayloadEncoding::WAF: return waf_encode(value, false);
        case PayloadEncoding::WAF_DOUBLE: return waf_encode(value, true);
        case PayloadEncoding::STANDARD: break;
    }
    return url::encode(value);
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

} // namespace

std::string InjectionPoint::endpoint() const {
    return url::strip_query(url);
}

const char* param_origin_name(ParamOrigin origin) {
    switch (origin) {
        case ParamOrigin::QUERY: return "query";
        case ParamOrigin::FORM: return "form";
        case ParamOrigin::PATH: return "path";
        case ParamOrigin::NONE: break;
    }
    return "none";
}

std::vector<InjectionPoint> injection_points(const CrawlResult& target, bool include_path_segments) {
    std::vector<InjectionPoint> points;

    std::string method = upper(target.method.empty() ? "GET" : target.method);
    bool is_form = target.source == "form";
    ParamOrigin origin = (is_form && method != "GET") ? ParamOrigin::FORM : ParamOrigin::QUERY;

    url::Params params = target.params;
    if (params.empty() && !is_form) {
        params = url::parse_query(target.url);
    }

    // Input types per field name, to skip buttons and uploads
    std::set<std::string> skipped;
    for (const auto& field : target.fields) {
        if (non_injectable_types().count(url::to_lower(field.type))) {
            skipped.insert(field.name);
        }
    }

    for (auto& [name, value] : params) {
        if (value.empty() && !skipped.count(name)) {
            value = "1";
        }
    }

    // GET forms submit to the action without its own query
    std::string endpoint_url = target.url;
    if (is_form && origin == ParamOrigin::QUERY) {
        endpoint_url = url::strip_query(target.url);
    }

    for (const auto& [name, value] : params) {
        if (name.empty() || skipped.count(name)) continue;

        InjectionPoint p;
        p.url = endpoint_url;
        p.method = method;
        p.parameter = name;
        p.origin = origin;
        p.original_value = value;
        p.params = params;
        p.page_url = target.page_url.empty() ? target.url : target.page_url;
        points.push_back(std::move(p));
    }

    if (include_path_segments && !is_form) {
        auto segments = url::path_segments(target.url);
        for (size_t i = 0; i < segments.size(); ++i) {
            if (!url::is_numeric_segment(segments[i])) continue;

            InjectionPoint p;
            p.url = target.url;
            p.method = "GET";
            p.parameter = "path[" + std::to_string(i) + "]";
            p.origin = ParamOrigin::PATH;
            p.original_value = segments[i];
            p.params = url::parse_query(target.url);
            p.segment_index = i;
            p.page_url = target.url;
            points.push_back(std::move(p));
        }
    }

    return points;
}

HttpRequest build_probe_request(const InjectionPoint& point,
                                const std::string& value,
                                PayloadEncoding encoding) {
    HttpRequest req;
    req.method = point.method;
    req.url = point.url;
    req.target_param = point.parameter;
    req.target_origin = point.origin;
    req.headers["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";

    switch (point.origin) {
        case ParamOrigin::PATH:
            req.url = url::with_path_segment(point.url, point.segment_index, encode_value(value, encoding));
            break;

        case ParamOrigin::FORM: {
            // Form bodies are always standard-encoded; the server decodes once
            url::Params body = point.params;
            for (auto& [name, v] : body) {
                if (name == point.parameter) v = value;
            }
            req.body = url::build_query(body);
            req.headers["Content-Type"] = "application/x-www-form-urlencoded";
            break;
        }

        case ParamOrigin::QUERY:
        case ParamOrigin::NONE: {
            // Rebuild the query in its original order with the target swapped
            std::string query;
            for (const auto& [name, v] : point.params) {
                if (!query.empty()) query += '&';
                query += url::encode(name) + "=";
                query += (name == point.parameter) ? encode_value(value, encoding) : url::encode(v);
            }
            req.url = url::strip_query(point.url);
            if (!query.empty()) {
                req.url += "?" + query;
            }
            break;
        }
    }

    return req;
}

std::string make_marker() {
    static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

    std::string token;
    for (int i = 0; i < 8; ++i) {
        token += alphabet[pick(rng)];
    }
    return "XSSMARK" + token + "XSSMARK";
}

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string strip_echo(const std::string& body, const std::string& payload) {
    if (payload.empty()) return body;
    std::string out = replace_all(body, payload, "");
    out = replace_all(out, html_escape(payload), "");
    // Some frameworks escape the single quote as &#x27;
    out = replace_all(out, replace_all(html_escape(payload), "&#39;", "&#x27;"), "");
    out = replace_all(out, url::encode(payload), "");
    return out;
}
