#pragma once
#include "http_client.h"
#include <string>
#include <vector>

// Baseline comparison for detecting injection based on behavioral differences.
// Compares the response to the original parameter value against the response
// to a payload, looking at status, length and content.

struct ComparisonResult {
    // Status code comparison
    bool status_changed;
    long baseline_status;
    long test_status;
    bool server_error;               // test is 5xx and baseline was not

    // Response length comparison
    size_t baseline_length;
    size_t test_length;
    long length_difference;          // test - baseline
    double length_ratio;             // test / baseline

    // Content similarity
    double similarity_score;         // 0.0 (completely different) to 1.0 (identical)

    // SQL vocabulary that shows up in the test response only
    std::vector<std::string> new_sql_keywords;

    ComparisonResult()
        : status_changed(false),
          baseline_status(0),
          test_status(0),
          server_error(false),
          baseline_length(0),
          test_length(0),
          length_difference(0),
          length_ratio(1.0),
          similarity_score(1.0)
    {}
};

class BaselineComparator {
public:
    /**
     * @brief Compare baseline and test responses
     * @param baseline_response Response to the original value
     * @param test_response Response with the payload injected
     * @return Comparison metrics
     */
    static ComparisonResult compare(const HttpResponse& baseline_response,
                                    const HttpResponse& test_response);

    /**
     * @brief Length ratio used by the boolean strategy
     * @return test / baseline; an empty baseline counts as one byte
     */
    static double length_ratio(size_t baseline_length, size_t test_length);

    /**
     * @brief Calculate Jaccard similarity over lower-cased word tokens
     * @param str1 First string
     * @param str2 Second string
     * @return Similarity score (0.0 to 1.0)
     */
    static double calculate_jaccard_similarity(const std::string& str1, const std::string& str2);

    /**
     * @brief SQL-related keywords present in test but absent from baseline
     */
    static std::vector<std::string> new_sql_keywords(const std::string& baseline_body,
                                                     const std::string& test_body);
};
