/**
 * @file test_baseline_comparator.cpp
 * @brief Unit tests for BaselineComparator
 *
 * Tests baseline comparison including:
 * - Status code change and server error detection
 * - Response length difference and ratio
 * - Content similarity calculation
 * - SQL vocabulary that appears only in the test response
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "core/baseline_comparator.h"
#include "core/http_client.h"
#include <algorithm>
#include <string>
#include <vector>

namespace {

HttpResponse make_response(long status, const std::string& body) {
    HttpResponse resp;
    resp.status = status;
    resp.body = body;
    return resp;
}

} // namespace

TEST_CASE("Status code change detection", "[baseline_comparator][status]") {
    HttpResponse baseline_resp = make_response(200, "Normal response");
    HttpResponse test_resp = make_response(500, "Internal Server Error");

    ComparisonResult result = BaselineComparator::compare(baseline_resp, test_resp);

    REQUIRE(result.status_changed);
    REQUIRE(result.baseline_status == 200);
    REQUIRE(result.test_status == 500);
    REQUIRE(result.server_error);
}

TEST_CASE("Status code change - 200 to 404", "[baseline_comparator][status]") {
    ComparisonResult result = BaselineComparator::compare(make_response(200, "Found"),
                                                          make_response(404, "Not Found"));

    REQUIRE(result.status_changed);
    REQUIRE_FALSE(result.server_error);
}

TEST_CASE("Server error already on the baseline is not new", "[baseline_comparator][status]") {
    ComparisonResult result = BaselineComparator::compare(make_response(500, "broken"),
                                                          make_response(503, "still broken"));

    REQUIRE(result.status_changed);
    REQUIRE_FALSE(result.server_error);
}

TEST_CASE("Response length change detection", "[baseline_comparator][length]") {
    HttpResponse baseline_resp = make_response(200, std::string(100, 'a'));
    HttpResponse test_resp = make_response(200, std::string(250, 'a'));

    ComparisonResult result = BaselineComparator::compare(baseline_resp, test_resp);

    REQUIRE_FALSE(result.status_changed);
    REQUIRE(result.baseline_length == 100);
    REQUIRE(result.test_length == 250);
    REQUIRE(result.length_difference == 150);
    REQUIRE(result.length_ratio == Approx(2.5));
}

TEST_CASE("Response length change - decrease", "[baseline_comparator][length]") {
    ComparisonResult result = BaselineComparator::compare(make_response(200, std::string(200, 'x')),
                                                          make_response(200, std::string(50, 'x')));

    REQUIRE(result.length_difference == -150);
    REQUIRE(result.length_ratio == Approx(0.25));
}

TEST_CASE("Length ratio with an empty baseline", "[baseline_comparator][length]") {
    REQUIRE(BaselineComparator::length_ratio(0, 0) == Approx(0.0));
    REQUIRE(BaselineComparator::length_ratio(0, 40) == Approx(40.0));
    REQUIRE(BaselineComparator::length_ratio(11, 33) == Approx(3.0));
}

TEST_CASE("Content similarity calculation - identical", "[baseline_comparator][similarity]") {
    REQUIRE(BaselineComparator::calculate_jaccard_similarity("Hello world", "Hello world") == 1.0);
    REQUIRE(BaselineComparator::calculate_jaccard_similarity("Hello World", "hello world") == 1.0);
    REQUIRE(BaselineComparator::calculate_jaccard_similarity("", "") == 1.0);
}

TEST_CASE("Content similarity calculation - completely different", "[baseline_comparator][similarity]") {
    REQUIRE(BaselineComparator::calculate_jaccard_similarity("Hello", "World") == 0.0);
    REQUIRE(BaselineComparator::calculate_jaccard_similarity("", "World") == 0.0);
}

TEST_CASE("Content similarity calculation - partial overlap", "[baseline_comparator][similarity]") {
    // {hello, world} vs {hello, there}: one shared word out of three
    double similarity = BaselineComparator::calculate_jaccard_similarity("Hello world", "Hello there");

    REQUIRE(similarity == Approx(1.0 / 3.0));
}

TEST_CASE("Content similarity - significant difference", "[baseline_comparator][similarity]") {
    HttpResponse baseline_resp = make_response(200, "Normal HTML content with lots of text");
    HttpResponse test_resp = make_response(200, "SQLException: Table 'users' doesn't exist");

    ComparisonResult result = BaselineComparator::compare(baseline_resp, test_resp);

    REQUIRE(result.similarity_score < 0.7);
    REQUIRE(result.similarity_score >= 0.0);
}

TEST_CASE("New SQL keywords in the test response", "[baseline_comparator][keywords]") {
    auto keywords = BaselineComparator::new_sql_keywords(
        "<p>Welcome back, error-free page</p>",
        "<p>Warning: mysql_fetch_array() expects parameter 1, SQL syntax error</p>");

    auto has = [&](const std::string& k) {
        return std::find(keywords.begin(), keywords.end(), k) != keywords.end();
    };
    REQUIRE(has("mysql"));
    REQUIRE(has("warning"));
    REQUIRE(has("syntax error"));
    // Present on the baseline too
    REQUIRE_FALSE(has("error"));
}

TEST_CASE("Normal variation - no new keywords", "[baseline_comparator][false_positive]") {
    HttpResponse baseline_resp = make_response(200, "<html><body>Product: Widget, price 9.99</body></html>");
    HttpResponse test_resp = make_response(200, "<html><body>Product: Gadget, price 4.75</body></html>");

    ComparisonResult result = BaselineComparator::compare(baseline_resp, test_resp);

    REQUIRE_FALSE(result.status_changed);
    REQUIRE_FALSE(result.server_error);
    REQUIRE(result.new_sql_keywords.empty());
    REQUIRE(result.length_difference == 0);
}
