/**
 * @file xss_plugin.cpp
 * @brief Cross-site scripting scanner plugin
 */

#include "xss_plugin.h"
#include "logging/console.h"

XssPlugin::XssPlugin() : catalog_(PayloadCatalog::xss()) {}

std::vector<Finding> XssPlugin::scan_point(const InjectionPoint& point) {
    std::vector<Finding> findings;

    SendResult baseline = executor().send(build_baseline_request(point));
    if (!baseline.ok()) {
        logging::debug("xss: baseline for '" + point.parameter + "' inconclusive (" +
                       send_status_name(baseline.status) + ")");
        return findings;
    }

    run_reflected(point, baseline.response, reflected_, findings);
    if (cancelled()) return findings;

    // Client-side sinks read the URL, so only URL-borne values can reach them
    if (point.origin == ParamOrigin::QUERY || point.origin == ParamOrigin::PATH) {
        run_reflected(point, baseline.response, dom_, findings);
        if (cancelled()) return findings;
    }

    if (point.origin == ParamOrigin::FORM) {
        run_stored(point, findings);
    }
    return findings;
}

bool XssPlugin::run_reflected(const InjectionPoint& point, const HttpResponse& baseline,
                              const DetectionStrategy& strategy, std::vector<Finding>& findings) {
    for (const auto& payload : catalog_.by_strategy(strategy.strategy())) {
        if (cancelled()) return false;
        try {
            std::string marker = make_marker();
            std::string value = mark_payload(payload.payload, marker);
            SendResult probe = send_probe(point, value);
            if (!probe.ok()) continue;

            ProbeObservation obs(baseline, probe.response, payload);
            obs.injected = value;
            obs.marker = marker;
            obs.probe_url = probe.request.url;
            DetectionResult result = strategy.analyze(obs);
            if (!result.vulnerable || !passes_threshold(strategy.strategy(), result.confidence)) {
                continue;
            }

            Payload sent = payload;
            sent.payload = value;
            findings.push_back(build_finding(point, sent, result, probe.request, probe.response));
            logging::info("xss: " + std::string(sub_type_for(payload.strategy)) + " in '" +
                          point.parameter + "' at " + point.endpoint());
            return true;
        } catch (const std::exception& e) {
            logging::warn("xss: payload '" + payload.name + "' on '" + point.parameter +
                          "' failed: " + e.what());
        }
    }
    return false;
}

bool XssPlugin::run_stored(const InjectionPoint& point, std::vector<Finding>& findings) {
    HttpRequest page;
    page.method = "GET";
    page.url = point.page_url;

    for (const auto& payload : catalog_.by_strategy(Strategy::STORED)) {
        if (cancelled()) return false;
        try {
            SendResult before = executor().send(page);
            if (!before.ok()) return false;

            std::string marker = make_marker();
            std::string value = mark_payload(payload.payload, marker);
            SendResult submitted = send_probe(point, value);
            if (!submitted.ok()) continue;

            SendResult after = executor().send(page);
            if (!after.ok()) continue;

            ProbeObservation obs(before.response, after.response, payload);
            obs.injected = value;
            obs.marker = marker;
            obs.probe_url = page.url;
            DetectionResult result = stored_.analyze(obs);
            if (!result.vulnerable || !passes_threshold(Strategy::STORED, result.confidence)) {
                continue;
            }
            result.evidence["submitted_to"] = point.url;
            result.evidence["submit_status"] = submitted.response.status;
            result.evidence["refetched_page"] = page.url;

            Payload sent = payload;
            sent.payload = value;
            findings.push_back(build_finding(point, sent, result, submitted.request, after.response));
            logging::info("xss: xss_stored via '" + point.parameter + "' at " + point.endpoint() +
                          ", rendered on " + page.url);
            return true;
        } catch (const std::exception& e) {
            logging::warn("xss: stored payload '" + payload.name + "' on '" + point.parameter +
                          "' failed: " + e.what());
        }
    }
    return false;
}
