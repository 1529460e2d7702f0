// Baseline comparison implementation

#include "baseline_comparator.h"
#include "url_utils.h"
#include <algorithm>
#include <sstream>
#include <unordered_set>

ComparisonResult BaselineComparator::compare(const HttpResponse& baseline_response,
                                             const HttpResponse& test_response) {
    ComparisonResult result;

    result.baseline_status = baseline_response.status;
    result.test_status = test_response.status;
    result.status_changed = baseline_response.status != test_response.status;
    result.server_error = test_response.status >= 500 && baseline_response.status < 500;

    result.baseline_length = baseline_response.body.size();
    result.test_length = test_response.body.size();
    result.length_difference = static_cast<long>(result.test_length) - static_cast<long>(result.baseline_length);
    result.length_ratio = length_ratio(result.baseline_length, result.test_length);

    result.similarity_score = calculate_jaccard_similarity(baseline_response.body, test_response.body);
    result.new_sql_keywords = new_sql_keywords(baseline_response.body, test_response.body);

    return result;
}

double BaselineComparator::length_ratio(size_t baseline_length, size_t test_length) {
    double denominator = baseline_length == 0 ? 1.0 : static_cast<double>(baseline_length);
    return static_cast<double>(test_length) / denominator;
}

double BaselineComparator::calculate_jaccard_similarity(const std::string& str1, const std::string& str2) {
    if (str1.empty() && str2.empty()) {
        return 1.0;
    }
    if (str1.empty() || str2.empty()) {
        return 0.0;
    }

    // Create sets of words (tokens)
    std::unordered_set<std::string> set1, set2;

    std::istringstream iss1(str1);
    std::string word;
    while (iss1 >> word) {
        set1.insert(url::to_lower(word));
    }

    std::istringstream iss2(str2);
    while (iss2 >> word) {
        set2.insert(url::to_lower(word));
    }

    size_t intersection = 0;
    for (const auto& w : set1) {
        if (set2.count(w) > 0) {
            intersection++;
        }
    }

    size_t union_size = set1.size() + set2.size() - intersection;
    if (union_size == 0) {
        return 1.0;
    }

    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

std::vector<std::string> BaselineComparator::new_sql_keywords(const std::string& baseline_body,
                                                              const std::string& test_body) {
    static const std::vector<std::string> keywords = {
        "syntax error", "mysql", "sql", "database", "table", "column",
        "select", "union", "where", "from", "error", "warning"
    };

    std::string baseline_lower = url::to_lower(baseline_body);
    std::string test_lower = url::to_lower(test_body);

    std::vector<std::string> found;
    for (const auto& kw : keywords) {
        if (test_lower.find(kw) != std::string::npos && baseline_lower.find(kw) == std::string::npos) {
            found.push_back(kw);
        }
    }
    return found;
}
