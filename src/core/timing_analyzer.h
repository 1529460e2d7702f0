#pragma once
#include "http_client.h"
#include "request_executor.h"
#include <string>
#include <vector>

// Timing analysis for detecting blind (time-based) SQL injection.
// Establishes a baseline of response times for the unmodified request, then
// flags a delay payload only when its response time clears
// mean + 3 * stddev + base_delay on two sequential measurements.

struct TimingBaseline {
    double average_time_ms;       // Average response time in milliseconds
    double variance_ms;           // Population variance
    double standard_deviation_ms; // Population standard deviation
    double min_time_ms;           // Minimum response time
    double max_time_ms;           // Maximum response time
    size_t sample_count;          // Number of samples used

    TimingBaseline()
        : average_time_ms(0.0),
          variance_ms(0.0),
          standard_deviation_ms(0.0),
          min_time_ms(0.0),
          max_time_ms(0.0),
          sample_count(0)
    {}

    bool valid() const { return sample_count > 0; }
};

struct TimingResult {
    double measured_time_ms;      // First probe measurement
    double verify_time_ms;        // Second probe measurement, 0 if not taken
    double baseline_time_ms;      // Baseline average time
    double threshold_ms;          // mean + 3 * stddev + base_delay
    double excess_ms;             // Smaller of the two measurements minus threshold
    double confidence;            // Confidence score (0.0-1.0)
    bool is_anomaly;              // First measurement cleared the threshold
    bool verified;                // Both measurements cleared the threshold
    bool inconclusive;            // A probe request failed
    std::string payload;          // Payload that caused the timing
    HttpRequest request;          // Probe as sent
    HttpResponse response;        // Response to the verifying probe

    TimingResult()
        : measured_time_ms(0.0),
          verify_time_ms(0.0),
          baseline_time_ms(0.0),
          threshold_ms(0.0),
          excess_ms(0.0),
          confidence(0.0),
          is_anomaly(false),
          verified(false),
          inconclusive(false)
    {}
};

class TimingAnalyzer {
public:
    struct Options {
        size_t baseline_samples;      // Number of requests for baseline (minimum 3)
        double base_delay_ms;         // Delay the payloads ask the database for
        long probe_timeout_margin_ms; // Extra per-request timeout on top of the threshold

        Options()
            : baseline_samples(3),
              base_delay_ms(2000.0),
              probe_timeout_margin_ms(10000)
        {}
    };

    /**
     * @brief Create a timing analyzer with options
     * @param executor Request executor used for every measurement
     * @param opts Timing analysis options
     */
    TimingAnalyzer(RequestExecutor& executor, const Options& opts = Options());

    /**
     * @brief Establish baseline response time for an endpoint
     * @param req Unmodified request
     * @return Baseline statistics; sample_count is 0 if every request failed
     */
    TimingBaseline establish_baseline(const HttpRequest& req);

    /**
     * @brief Send a delay probe, and repeat it once if it looks delayed
     * @param probe Request with the payload already substituted
     * @param baseline Baseline timing statistics
     * @return Timing result; only verified results should become findings
     */
    TimingResult test_probe(const HttpRequest& probe, const TimingBaseline& baseline);

    /**
     * @brief Judge two measurements against a baseline (no I/O)
     * @param measured_ms First probe time
     * @param verify_ms Second probe time, or a negative value if not taken
     * @param baseline Baseline timing statistics
     * @return Timing result with threshold, excess and confidence filled in
     */
    TimingResult analyze_timing(double measured_ms, double verify_ms, const TimingBaseline& baseline) const;

    /**
     * @brief mean + 3 * stddev + base_delay
     */
    double threshold_for(const TimingBaseline& baseline) const;

    /**
     * @brief Confidence from time over threshold
     * @param excess_ms Milliseconds over threshold, non-negative
     * @return 0.9 at 4s or more, 0.7 at 2s or more, 0.5 otherwise
     */
    static double confidence_for_excess(double excess_ms);

    /**
     * @brief Build baseline statistics from raw samples (public for testing)
     */
    static TimingBaseline baseline_from_samples(const std::vector<double>& measurements);

    /**
     * @brief Population variance of a set of measurements
     * @param measurements Vector of timing measurements
     * @param mean Mean value
     * @return Variance
     */
    static double calculate_variance(const std::vector<double>& measurements, double mean);

    static double calculate_standard_deviation(double variance);

    const Options& options() const { return opts_; }

private:
    RequestExecutor& executor_;
    Options opts_;

    /**
     * @brief Make a request and measure response time
     * @return Response time in milliseconds, or -1.0 on failure
     */
    double measure_request_time(const HttpRequest& req, long timeout_ms, SendResult* out = nullptr);
};
