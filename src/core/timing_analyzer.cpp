// Timing analysis implementation

#include "timing_analyzer.h"
#include <algorithm>
#include <numeric>
#include <cmath>

TimingAnalyzer::TimingAnalyzer(RequestExecutor& executor, const Options& opts)
    : executor_(executor), opts_(opts)
{
    // Ensure minimum baseline samples
    if (opts_.baseline_samples < 3) {
        opts_.baseline_samples = 3;
    }
}

TimingBaseline TimingAnalyzer::establish_baseline(const HttpRequest& req) {
    std::vector<double> measurements;

    // Sequential on purpose; overlapping requests would skew each other
    for (size_t i = 0; i < opts_.baseline_samples; ++i) {
        double time_ms = measure_request_time(req, 0);
        if (time_ms >= 0.0) {
            measurements.push_back(time_ms);
        }
    }

    return baseline_from_samples(measurements);
}

TimingBaseline TimingAnalyzer::baseline_from_samples(const std::vector<double>& measurements) {
    TimingBaseline baseline;
    if (measurements.empty()) {
        return baseline;
    }

    baseline.sample_count = measurements.size();

    double sum = std::accumulate(measurements.begin(), measurements.end(), 0.0);
    baseline.average_time_ms = sum / measurements.size();

    auto minmax = std::minmax_element(measurements.begin(), measurements.end());
    baseline.min_time_ms = *minmax.first;
    baseline.max_time_ms = *minmax.second;

    baseline.variance_ms = calculate_variance(measurements, baseline.average_time_ms);
    baseline.standard_deviation_ms = calculate_standard_deviation(baseline.variance_ms);

    return baseline;
}

double TimingAnalyzer::threshold_for(const TimingBaseline& baseline) const {
    return baseline.average_time_ms + 3.0 * baseline.standard_deviation_ms + opts_.base_delay_ms;
}

TimingResult TimingAnalyzer::test_probe(const HttpRequest& probe, const TimingBaseline& baseline) {
    TimingResult result;
    result.request = probe;
    result.baseline_time_ms = baseline.average_time_ms;
    result.threshold_ms = threshold_for(baseline);

    if (!baseline.valid()) {
        result.inconclusive = true;
        return result;
    }

    // Leave room for the delay to actually show up before the client gives up
    long timeout_ms = static_cast<long>(result.threshold_ms) + opts_.probe_timeout_margin_ms;

    SendResult first;
    double measured = measure_request_time(probe, timeout_ms, &first);
    if (measured < 0.0) {
        result.inconclusive = true;
        return result;
    }
    result.request = first.request;
    result.response = first.response;

    double verify = -1.0;
    if (measured >= result.threshold_ms) {
        // Independent second sample, strictly after the first completed
        SendResult second;
        verify = measure_request_time(probe, timeout_ms, &second);
        if (verify < 0.0) {
            TimingResult partial = analyze_timing(measured, -1.0, baseline);
            partial.request = first.request;
            partial.response = first.response;
            partial.inconclusive = true;
            return partial;
        }
        result.response = second.response;
    }

    TimingResult judged = analyze_timing(measured, verify, baseline);
    judged.request = result.request;
    judged.response = result.response;
    return judged;
}

TimingResult TimingAnalyzer::analyze_timing(double measured_ms, double verify_ms,
                                            const TimingBaseline& baseline) const {
    TimingResult result;
    result.measured_time_ms = measured_ms;
    result.verify_time_ms = verify_ms > 0.0 ? verify_ms : 0.0;
    result.baseline_time_ms = baseline.average_time_ms;
    result.threshold_ms = threshold_for(baseline);

    if (!baseline.valid() || measured_ms < 0.0) {
        return result;
    }

    result.is_anomaly = measured_ms >= result.threshold_ms;
    result.verified = result.is_anomaly && verify_ms >= result.threshold_ms;
    if (!result.verified) {
        return result;
    }

    result.excess_ms = std::min(measured_ms, verify_ms) - result.threshold_ms;
    result.confidence = confidence_for_excess(result.excess_ms);
    return result;
}

double TimingAnalyzer::confidence_for_excess(double excess_ms) {
    if (excess_ms >= 4000.0) {
        return 0.9;
    }
    if (excess_ms >= 2000.0) {
        return 0.7;
    }
    return 0.5;
}

double TimingAnalyzer::measure_request_time(const HttpRequest& req, long timeout_ms, SendResult* out) {
    SendResult sent = executor_.send(req, timeout_ms);
    if (!sent.ok()) {
        return -1.0;
    }
    double elapsed = sent.elapsed_ms;
    if (out) {
        *out = std::move(sent);
    }
    return elapsed;
}

double TimingAnalyzer::calculate_variance(const std::vector<double>& measurements, double mean) {
    if (measurements.empty()) {
        return 0.0;
    }

    double sum_squared_diff = 0.0;
    for (double value : measurements) {
        double diff = value - mean;
        sum_squared_diff += diff * diff;
    }

    return sum_squared_diff / static_cast<double>(measurements.size());
}

double TimingAnalyzer::calculate_standard_deviation(double variance) {
    return std::sqrt(variance);
}
