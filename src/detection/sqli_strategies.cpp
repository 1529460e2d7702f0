/**
 * @file sqli_strategies.cpp
 * @brief Error, boolean, union and time-based SQL injection verdicts
 */

#include "sqli_strategies.h"
#include "core/baseline_comparator.h"
#include "core/url_utils.h"
#include <algorithm>
#include <cstdlib>
#include <regex>

DetectionResult ErrorBasedStrategy::analyze(const ProbeObservation& obs) const {
    DetectionResult r;

    AnalysisResult probe_analysis = analyzer_.analyze(obs.probe.body);
    if (probe_analysis.has_sql_error) {
        // An error already on the baseline page, with the same text around it, is not the payload's
        AnalysisResult baseline_analysis = analyzer_.analyze(obs.baseline.body);
        std::vector<const PatternMatch*> fresh;
        for (const auto& m : probe_analysis.matches) {
            bool seen = std::any_of(baseline_analysis.matches.begin(), baseline_analysis.matches.end(),
                                    [&](const PatternMatch& b) {
                                        return b.pattern_name == m.pattern_name && b.context == m.context;
                                    });
            if (!seen) fresh.push_back(&m);
        }

        if (!fresh.empty()) {
            const PatternMatch* best = *std::max_element(fresh.begin(), fresh.end(),
                [](const PatternMatch* a, const PatternMatch* b) { return a->confidence < b->confidence; });
            r.vulnerable = true;
            r.confidence = clamp_confidence(std::max(0.9, best->confidence));
            r.evidence["signal"] = "sql_error";
            r.evidence["database"] = database_type_name(best->db_type);
            r.evidence["pattern"] = best->pattern_name;
            r.evidence["matched"] = best->evidence;
            r.evidence["context"] = best->context;
            r.evidence["status"] = obs.probe.status;
            return r;
        }
    }

    ComparisonResult cmp = BaselineComparator::compare(obs.baseline, obs.probe);
    std::string probe_body = strip_echo(obs.probe.body, obs.injected);
    auto keywords = BaselineComparator::new_sql_keywords(obs.baseline.body, probe_body);
    long length_difference = static_cast<long>(probe_body.size()) - static_cast<long>(obs.baseline.body.size());

    double confidence = 0.0;
    std::string signal;
    if (cmp.server_error) {
        confidence = 0.7;
        signal = "server_error";
    } else if (!keywords.empty()) {
        confidence = 0.6;
        signal = "new_sql_keywords";
    } else if (std::labs(length_difference) > 50) {
        confidence = 0.5;
        signal = "length_change";
    }

    if (confidence > 0.0) {
        r.vulnerable = true;
        r.confidence = confidence;
        r.evidence["signal"] = signal;
        r.evidence["baseline_status"] = cmp.baseline_status;
        r.evidence["status"] = cmp.test_status;
        r.evidence["new_keywords"] = keywords;
        r.evidence["baseline_length"] = cmp.baseline_length;
        r.evidence["malicious_length"] = cmp.test_length;
        r.evidence["length_difference"] = length_difference;
    }
    return r;
}

DetectionResult BooleanBasedStrategy::analyze(const ProbeObservation& obs) const {
    DetectionResult r;

    std::string probe_body = strip_echo(obs.probe.body, obs.injected);
    size_t baseline_length = obs.baseline.body.size();
    size_t probe_length = probe_body.size();
    long difference = static_cast<long>(probe_length) - static_cast<long>(baseline_length);
    double ratio = BaselineComparator::length_ratio(baseline_length, probe_length);

    switch (obs.payload.expectation) {
        case BooleanExpectation::OR_TRUE:
            if (ratio > 1.5) {
                r.confidence = 0.8;
            } else if (difference > 10) {
                r.confidence = 0.7;
            }
            break;
        case BooleanExpectation::AND_TRUE:
            if (ratio > 0.8 && ratio < 1.2) {
                r.confidence = 0.7;
            }
            break;
        case BooleanExpectation::AND_FALSE:
            if (ratio < 0.5) {
                r.confidence = 0.7;
            }
            break;
        case BooleanExpectation::NONE:
            break;
    }

    r.vulnerable = r.confidence > 0.0;
    r.evidence["baseline_length"] = baseline_length;
    r.evidence["malicious_length"] = probe_length;
    r.evidence["length_difference"] = difference;
    r.evidence["length_ratio"] = ratio;
    r.evidence["baseline_status"] = obs.baseline.status;
    r.evidence["status"] = obs.probe.status;
    return r;
}

DetectionResult UnionBasedStrategy::analyze(const ProbeObservation& obs) const {
    DetectionResult r;

    struct Marker {
        const char* name;
        std::regex rx;
    };
    static const std::vector<Marker> markers = {
        {"version()", std::regex(R"(version\(\))", std::regex::icase)},
        {"database()", std::regex(R"(database\(\))", std::regex::icase)},
        {"user()", std::regex(R"(user\(\))", std::regex::icase)},
        {"information_schema", std::regex(R"(information_schema)", std::regex::icase)},
        {"table_name", std::regex(R"(\btable_name\b)", std::regex::icase)},
        {"column_name", std::regex(R"(\bcolumn_name\b)", std::regex::icase)},
        {"mysql", std::regex(R"(\bmysql\b)", std::regex::icase)},
        {"mariadb", std::regex(R"(mariadb)", std::regex::icase)},
        {"version_number", std::regex(R"(\b\d+\.\d+\.\d+)")},
        {"db_user", std::regex(R"(\b[a-z_][a-z0-9_]*@(localhost|%|[0-9.]+)\b)", std::regex::icase)},
        // NULL column padding rendered back into the page
        {"null_placeholder", std::regex(R"(\bNULL\b)")},
    };

    // Echoed payload text is not evidence of execution
    std::string probe_body = strip_echo(obs.probe.body, obs.injected);

    // A failed UNION names the server in its error; that is the error-based signal
    static const std::regex failed_union(
        R"(error in your SQL syntax|different number of columns|SQLSTATE\[|mysqli_sql_exception)",
        std::regex::icase);
    if (std::regex_search(probe_body, failed_union)) {
        r.evidence["signal"] = "sql_error";
        return r;
    }

    std::vector<std::string> found;
    for (const auto& m : markers) {
        if (std::regex_search(probe_body, m.rx) && !std::regex_search(obs.baseline.body, m.rx)) {
            found.push_back(m.name);
        }
    }

    ComparisonResult cmp = BaselineComparator::compare(obs.baseline, obs.probe);
    long difference = static_cast<long>(probe_body.size()) - static_cast<long>(obs.baseline.body.size());

    r.evidence["baseline_length"] = cmp.baseline_length;
    r.evidence["malicious_length"] = cmp.test_length;
    r.evidence["length_difference"] = difference;
    r.evidence["baseline_status"] = cmp.baseline_status;
    r.evidence["status"] = cmp.test_status;
    if (obs.payload.columns > 0) {
        r.evidence["columns"] = obs.payload.columns;
    }

    if (!found.empty()) {
        r.vulnerable = true;
        r.confidence = 0.9;
        r.evidence["markers"] = found;
        return r;
    }

    if (cmp.status_changed || std::labs(difference) > 20) {
        r.vulnerable = true;
        r.confidence = 0.5;
        r.evidence["signal"] = cmp.status_changed ? "status_change" : "length_change";
    }
    return r;
}

DetectionResult TimeBasedStrategy::analyze(const ProbeObservation& obs) const {
    DetectionResult r;
    if (!obs.timing) {
        return r;
    }

    const TimingResult& t = *obs.timing;
    r.evidence["baseline_mean_ms"] = t.baseline_time_ms;
    r.evidence["threshold_ms"] = t.threshold_ms;
    r.evidence["first_ms"] = t.measured_time_ms;
    r.evidence["second_ms"] = t.verify_time_ms;
    r.evidence["expected_delay_s"] = obs.payload.delay_seconds;

    if (t.verified && !t.inconclusive) {
        r.vulnerable = true;
        r.confidence = clamp_confidence(t.confidence);
        r.evidence["excess_ms"] = t.excess_ms;
    }
    return r;
}
