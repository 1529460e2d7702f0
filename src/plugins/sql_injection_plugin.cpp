/**
 * @file sql_injection_plugin.cpp
 * @brief SQL injection scanner plugin
 */

#include "sql_injection_plugin.h"
#include "core/baseline_comparator.h"
#include "core/timing_analyzer.h"
#include "logging/console.h"

SqlInjectionPlugin::SqlInjectionPlugin()
    : catalog_(PayloadCatalog::sql_injection()) {}

void SqlInjectionPlugin::on_setup() {
    PayloadCatalog::Options co;
    co.union_max_columns = options().union_max_columns;
    co.base_delay_seconds = options().time_base_delay_seconds;
    catalog_ = PayloadCatalog::sql_injection(co);

    if (options().error_patterns_file.empty()) {
        analyzer_ = std::make_unique<ResponseAnalyzer>();
    } else {
        analyzer_ = std::make_unique<ResponseAnalyzer>(options().error_patterns_file);
    }
    error_ = std::make_unique<ErrorBasedStrategy>(*analyzer_);
}

std::vector<Finding> SqlInjectionPlugin::scan_point(const InjectionPoint& point) {
    std::vector<Finding> findings;

    // Baseline strictly before any probe
    SendResult baseline = executor().send(build_baseline_request(point));
    if (!baseline.ok()) {
        logging::debug("sql_injection: baseline for '" + point.parameter + "' inconclusive (" +
                       send_status_name(baseline.status) + ")");
        return findings;
    }

    run_strategy(*error_, point, baseline, findings);
    if (cancelled()) return findings;
    run_strategy(boolean_, point, baseline, findings);
    if (cancelled()) return findings;
    run_strategy(union_, point, baseline, findings);
    if (cancelled()) return findings;
    run_time_based(point, baseline, findings);

    return findings;
}

bool SqlInjectionPlugin::run_strategy(const DetectionStrategy& strategy,
                                      const InjectionPoint& point,
                                      const SendResult& baseline,
                                      std::vector<Finding>& findings) {
    for (const auto& payload : catalog_.by_strategy(strategy.strategy())) {
        if (cancelled()) return false;
        try {
            std::string value = compose_value(point.original_value, payload.payload);
            SendResult probe = send_probe(point, value);
            if (!probe.ok()) {
                // Inconclusive, not clean
                continue;
            }

            ProbeObservation obs(baseline.response, probe.response, payload);
            obs.injected = value;
            obs.probe_url = probe.request.url;
            DetectionResult result = strategy.analyze(obs);
            if (!result.vulnerable || !passes_threshold(strategy.strategy(), result.confidence)) {
                continue;
            }

            if (payload.expectation == BooleanExpectation::AND_TRUE &&
                !confirm_boolean_pair(point, baseline, result.evidence)) {
                continue;
            }

            findings.push_back(build_finding(point, payload, result, probe.request, probe.response));
            logging::info("sql_injection: " + std::string(sub_type_for(payload.strategy)) + " in '" +
                          point.parameter + "' at " + point.endpoint());
            return true;
        } catch (const std::exception& e) {
            logging::warn("sql_injection: payload '" + payload.name + "' on '" + point.parameter +
                          "' failed: " + e.what());
        }
    }
    return false;
}

bool SqlInjectionPlugin::confirm_boolean_pair(const InjectionPoint& point,
                                              const SendResult& baseline,
                                              nlohmann::json& evidence) {
    auto payloads = catalog_.by_strategy(Strategy::BOOLEAN_BASED);
    for (const auto& p : payloads) {
        if (p.expectation != BooleanExpectation::AND_FALSE) continue;

        std::string value = compose_value(point.original_value, p.payload);
        SendResult probe = send_probe(point, value);
        if (!probe.ok()) return false;

        std::string body = strip_echo(probe.response.body, value);
        double ratio = BaselineComparator::length_ratio(baseline.response.body.size(), body.size());
        evidence["false_payload"] = p.payload;
        evidence["false_length"] = body.size();
        evidence["false_ratio"] = ratio;
        return ratio <= 0.8 || ratio >= 1.2 || probe.response.status != baseline.response.status;
    }
    return false;
}

bool SqlInjectionPlugin::run_time_based(const InjectionPoint& point,
                                        const SendResult& baseline,
                                        std::vector<Finding>& findings) {
    TimingAnalyzer::Options to;
    to.base_delay_ms = options().time_base_delay_seconds * 1000.0;
    TimingAnalyzer timing(executor(), to);

    TimingBaseline stats = timing.establish_baseline(build_baseline_request(point));
    if (!stats.valid()) {
        logging::debug("sql_injection: no timing baseline for '" + point.parameter + "'");
        return false;
    }

    // Plain delays for every dialect first, the heavy fallbacks once after
    std::vector<Payload> rounds[2] = {
        catalog_.by_strategy(Strategy::TIME_BASED, false),
        catalog_.aggressive()
    };

    for (const auto& round : rounds) {
        for (const auto& payload : round) {
            if (cancelled()) return false;
            try {
                std::string value = compose_value(point.original_value, payload.payload);
                HttpRequest req = build_probe_request(point, value,
                    options().waf_bypass ? PayloadEncoding::WAF : PayloadEncoding::STANDARD);
                TimingResult t = timing.test_probe(req, stats);
                if (t.inconclusive) continue;

                ProbeObservation obs(baseline.response, t.response, payload);
                obs.injected = value;
                obs.probe_url = t.request.url;
                obs.timing = &t;
                DetectionResult result = time_.analyze(obs);
                if (!result.vulnerable || !passes_threshold(Strategy::TIME_BASED, result.confidence)) {
                    continue;
                }
                result.evidence["baseline_stddev_ms"] = stats.standard_deviation_ms;
                result.evidence["baseline_samples"] = stats.sample_count;
                result.evidence["aggressive"] = payload.aggressive;

                findings.push_back(build_finding(point, payload, result, t.request, t.response));
                logging::info("sql_injection: time_based_sqli in '" + point.parameter + "' at " +
                              point.endpoint() + " (" + payload.dialect + ")");
                return true;
            } catch (const std::exception& e) {
                logging::warn("sql_injection: payload '" + payload.name + "' on '" + point.parameter +
                              "' failed: " + e.what());
            }
        }
    }
    return false;
}
