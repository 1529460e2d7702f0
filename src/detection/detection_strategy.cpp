// Shared helpers for detection strategies

#include "detection_strategy.h"
#include <algorithm>

namespace {

struct Remediation {
    const char* id;
    const char* text;
};

Remediation remediation_for(Strategy s) {
    switch (s) {
        case Strategy::ERROR_BASED:
        case Strategy::BOOLEAN_BASED:
        case Strategy::UNION_BASED:
        case Strategy::TIME_BASED:
            return {"sql_injection",
                    "Use parameterized queries or prepared statements for every database call and never "
                    "concatenate request input into SQL. Run the application with a least-privilege "
                    "database account and do not display database errors to users."};
        case Strategy::REFLECTED:
        case Strategy::DOM:
            return {"xss",
                    "Encode untrusted data for the context it is written into (HTML body, attribute, "
                    "JavaScript, URL). Avoid innerHTML and document.write with URL-derived data and "
                    "deploy a Content-Security-Policy."};
        case Strategy::STORED:
            return {"stored_xss",
                    "Encode stored user content on output for its HTML context, validate it on input, "
                    "and deploy a Content-Security-Policy. Review existing stored records for injected markup."};
    }
    return {"generic", "Validate and encode untrusted input."};
}

const char* title_for(Strategy s) {
    switch (s) {
        case Strategy::ERROR_BASED: return "SQL Injection (error-based)";
        case Strategy::BOOLEAN_BASED: return "SQL Injection (boolean-based blind)";
        case Strategy::UNION_BASED: return "SQL Injection (UNION-based)";
        case Strategy::TIME_BASED: return "SQL Injection (time-based blind)";
        case Strategy::REFLECTED: return "Reflected Cross-Site Scripting";
        case Strategy::STORED: return "Stored Cross-Site Scripting";
        case Strategy::DOM: return "DOM-based Cross-Site Scripting";
    }
    return "Injection";
}

bool is_sqli(Strategy s) {
    return s == Strategy::ERROR_BASED || s == Strategy::BOOLEAN_BASED ||
           s == Strategy::UNION_BASED || s == Strategy::TIME_BASED;
}

} // namespace

double clamp_confidence(double c) {
    if (!(c > 0.0)) return 0.0;    // also catches NaN
    return std::min(1.0, c);
}

Finding build_finding(const InjectionPoint& point,
                      const Payload& payload,
                      const DetectionResult& result,
                      const HttpRequest& request,
                      const HttpResponse& response) {
    Finding f;
    f.title = title_for(payload.strategy);
    f.category = is_sqli(payload.strategy) ? "sql_injection" : "xss";
    f.sub_type = sub_type_for(payload.strategy);
    f.severity = payload.strategy == Strategy::STORED ? "critical" : risk_name(payload.risk);
    f.confidence = clamp_confidence(result.confidence);
    f.url = point.endpoint();
    f.parameter = point.parameter;
    f.method = point.method;
    f.payload = payload.payload;
    f.cwe_id = payload.cwe_id;

    f.description = std::string(f.title) + " in " + param_origin_name(point.origin) + " parameter '" +
                    point.parameter + "' of " + f.url + " (payload '" + payload.name + "': " +
                    payload.description + ")";

    f.evidence = result.evidence;
    f.evidence["strategy"] = strategy_name(payload.strategy);
    f.evidence["payload_name"] = payload.name;
    f.evidence["origin"] = param_origin_name(point.origin);
    f.evidence["probe_url"] = request.url;
    if (!payload.dialect.empty()) {
        f.evidence["dialect"] = payload.dialect;
    }

    f.headers = request.headers;
    f.body = request.body;

    std::string snippet = response.body.substr(0, std::min<size_t>(response.body.size(), 512));
    f.response = {
        {"status", response.status},
        {"length", response.body.size()},
        {"content_type", response.header("content-type")},
        {"body_snippet", snippet}
    };

    Remediation r = remediation_for(payload.strategy);
    f.remediation_id = r.id;
    f.remediation = r.text;
    return f;
}
