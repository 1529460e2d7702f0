/**
 * @file test_sql_injection.cpp
 * @brief Unit tests for the SQL injection plugin and its strategies
 *
 * Each endpoint of the fake target is vulnerable to exactly one technique:
 * - /user: quote breaks produce a MySQL syntax error
 * - /product: OR conditions return every row
 * - /catalog: LIMIT 1 hides OR, but AND false empties the page
 * - /search: UNION with two columns renders its values
 * - /report: SLEEP() delays the response
 * - /archive: UNION NULL padding with two columns renders as "NULL NULL"
 * - /guarded: a filter rejects encoded quotes, raw ones still reach the query
 * - /audit: only the heavy cross-join query is slow
 * - /item/<n>: numeric path segment spliced into the query
 * - /static: ignores its input entirely
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "plugins/sql_injection_plugin.h"
#include "core/url_utils.h"
#include "helpers/fake_transport.h"
#include <algorithm>
#include <cctype>
#include <memory>

using test_helpers::FakeTransport;

namespace {

const char* kMysqlError =
    "<b>Warning</b>: You have an error in your SQL syntax; check the manual that corresponds to "
    "your MySQL server version for the right syntax to use near ''' at line 1";

bool breaks_literal(const std::string& v) {
    auto singles = std::count(v.begin(), v.end(), '\'');
    auto doubles = std::count(v.begin(), v.end(), '"');
    return singles % 2 == 1 || doubles % 2 == 1 || v.find('\\') != std::string::npos;
}

std::string product_page(int rows) {
    static const char* names[] = {"Widget - 9.99", "Gadget - 4.75", "Doohickey - 12.50", "Gizmo - 7.25"};
    std::string body = "<h1>Products</h1><ul>";
    for (int i = 0; i < rows; ++i) {
        body += std::string("<li>") + names[i] + "</li>";
    }
    return body + "</ul>";
}

bool is_true_or(const std::string& v) {
    std::string l = url::to_lower(v);
    return l.find(" or ") != std::string::npos &&
           (l.find("'1'='1") != std::string::npos || l.find("1=1") != std::string::npos);
}

bool is_false_and(const std::string& v) {
    std::string l = url::to_lower(v);
    return l.find("'1'='2") != std::string::npos || l.find("1=2") != std::string::npos;
}

// Value that comes back from the simulated UNION, or empty when not a UNION
std::string union_row(const std::string& v, bool& column_mismatch) {
    column_mismatch = false;
    std::string l = url::to_lower(v);
    size_t pos = l.find("union select ");
    if (pos == std::string::npos) return "";

    std::string cols = l.substr(pos + 13);
    for (const char* stop : {" from ", "--"}) {
        size_t cut = cols.find(stop);
        if (cut != std::string::npos) cols = cols.substr(0, cut);
    }
    std::vector<std::string> values;
    size_t start = 0;
    while (true) {
        size_t comma = cols.find(',', start);
        std::string c = cols.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        c.erase(0, c.find_first_not_of(' '));
        c.erase(c.find_last_not_of(' ') + 1);
        values.push_back(c);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    if (values.size() != 2) {
        column_mismatch = true;
        return "";
    }

    std::string row;
    for (const auto& c : values) {
        std::string shown;
        if (c == "version()" || c == "@@version") shown = "8.0.32";
        else if (c == "database()") shown = "shop";
        else if (c == "user()") shown = "app@localhost";
        else if (c == "table_name") shown = "products";
        if (!row.empty()) row += " ";
        row += shown;
    }
    return "<li>" + row + "</li>";
}

void serve_target(FakeTransport& transport) {
    transport.route("/user", [](const HttpRequest& req, HttpResponse& resp) {
        std::string id = test_helpers::param(req, "id");
        if (breaks_literal(id)) {
            resp = test_helpers::html(500, kMysqlError);
        } else {
            resp = test_helpers::html(200, "<p>User 1: alice</p>");
        }
    });

    transport.route("/product", [](const HttpRequest& req, HttpResponse& resp) {
        std::string id = test_helpers::param(req, "id");
        int rows = is_true_or(id) ? 4 : (is_false_and(id) ? 0 : 1);
        resp = test_helpers::html(200, product_page(rows));
    });

    transport.route("/catalog", [](const HttpRequest& req, HttpResponse& resp) {
        std::string id = test_helpers::param(req, "id");
        resp = test_helpers::html(200, product_page(is_false_and(id) ? 0 : 1));
    });

    transport.route("/search", [](const HttpRequest& req, HttpResponse& resp) {
        std::string q = test_helpers::param(req, "q");
        bool mismatch = false;
        std::string extra = union_row(q, mismatch);
        if (mismatch) {
            resp = test_helpers::html(500,
                "SQLSTATE[21000]: Cardinality violation: 1222 The used SELECT statements have a "
                "different number of columns");
        } else if (extra.empty() && breaks_literal(q)) {
            resp = test_helpers::html(500, kMysqlError);
        } else {
            resp = test_helpers::html(200, "<h1>Results</h1><ul><li>Phone 199.00</li>" + extra + "</ul>");
        }
    });

    transport.route("/report", [](const HttpRequest& req, HttpResponse& resp) {
        resp = test_helpers::html(200, "<p>report queued</p>");
        bool sleeps = test_helpers::param(req, "id").find("SLEEP(") != std::string::npos;
        resp.total_time = sleeps ? 6.5 : 0.1;
    });

    transport.route("/archive", [](const HttpRequest& req, HttpResponse& resp) {
        std::string id = test_helpers::param(req, "id");
        std::string l = url::to_lower(id);
        std::string body = "<h1>Archive</h1><ul><li>2019 report</li>";
        if (l.find("union select null,null--") != std::string::npos) {
            body += "<li>NULL NULL</li>";
        }
        resp = test_helpers::html(200, body + "</ul>");
    });

    transport.route("/guarded", [](const HttpRequest& req, HttpResponse& resp) {
        const std::string& u = req.url;
        if (u.find("%27") != std::string::npos || u.find("%22") != std::string::npos ||
            u.find("%5C") != std::string::npos) {
            resp = test_helpers::html(403, "<h1>Forbidden</h1>");
            return;
        }
        std::string id = test_helpers::param(req, "id");
        resp = breaks_literal(id) ? test_helpers::html(500, kMysqlError)
                                  : test_helpers::html(200, "<p>Order 1: shipped</p>");
    });

    transport.route("/audit", [](const HttpRequest& req, HttpResponse& resp) {
        resp = test_helpers::html(200, "<p>audit log</p>");
        bool heavy = test_helpers::param(req, "id").find("information_schema.columns A") != std::string::npos;
        resp.total_time = heavy ? 6.5 : 0.1;
    });

    transport.route("/static", [](const HttpRequest&, HttpResponse& resp) {
        resp = test_helpers::html(200, "<p>Nothing here depends on the id parameter.</p>");
    });

    transport.set_fallback([](const HttpRequest& req, HttpResponse& resp) {
        std::string path = url::path_of(req.url);
        if (path.rfind("/item/", 0) != 0) {
            resp = test_helpers::html(404, "not found");
            return;
        }
        std::string segment = url::decode(path.substr(6));
        bool numeric = !segment.empty() && std::all_of(segment.begin(), segment.end(), ::isdigit);
        resp = numeric ? test_helpers::html(200, "<p>Item " + segment + "</p>")
                       : test_helpers::html(500, kMysqlError);
    });
}

const Finding* find_sub_type(const std::vector<Finding>& findings, const std::string& sub_type) {
    for (const auto& f : findings) {
        if (f.sub_type == sub_type) return &f;
    }
    return nullptr;
}

struct PluginFixture {
    FakeTransport transport;
    SqlInjectionPlugin plugin;

    PluginFixture() {
        serve_target(transport);
        plugin.setup(test_helpers::fast_scan_options(), transport, std::make_shared<CancelToken>(), nullptr);
    }
};

Payload payload_with(BooleanExpectation e) {
    Payload p;
    p.strategy = Strategy::BOOLEAN_BASED;
    p.payload = "x";
    p.expectation = e;
    return p;
}

HttpResponse page(long status, const std::string& body) {
    HttpResponse r;
    r.status = status;
    r.body = body;
    return r;
}

} // namespace

TEST_CASE("Payload composition with the original value", "[sql_injection]") {
    REQUIRE(compose_value("1", "'") == "1'");
    REQUIRE(compose_value("phone", "' UNION SELECT NULL-- ") == "phone' UNION SELECT NULL-- ");
    REQUIRE(compose_value("5", " AND 1=1") == "5 AND 1=1");
    REQUIRE(compose_value("5", "1 OR 1=1") == "1 OR 1=1");
    REQUIRE(compose_value("abc", "") == "abc");
}

TEST_CASE("Error-based strategy", "[sql_injection][error]") {
    ResponseAnalyzer analyzer;
    ErrorBasedStrategy strategy(analyzer);
    Payload p;
    p.payload = "'";

    SECTION("Database error absent from the baseline") {
        HttpResponse base = page(200, "<p>User 1</p>");
        HttpResponse probe = page(500, kMysqlError);
        DetectionResult r = strategy.analyze(ProbeObservation(base, probe, p));
        REQUIRE(r.vulnerable);
        REQUIRE(r.confidence >= 0.9);
        REQUIRE(r.evidence["database"] == "mysql");
        REQUIRE(r.evidence["signal"] == "sql_error");
    }

    SECTION("Error already on the baseline is not the payload's doing") {
        HttpResponse base = page(500, kMysqlError);
        HttpResponse probe = page(500, kMysqlError);
        DetectionResult r = strategy.analyze(ProbeObservation(base, probe, p));
        REQUIRE_FALSE(r.vulnerable);
        REQUIRE(r.confidence == 0.0);
    }

    SECTION("Different error text than the baseline's keeps full confidence") {
        HttpResponse base = page(500, "<p>Query failed: You have an error in your SQL syntax near 'ORDER BY'</p>");
        HttpResponse probe = page(500, "<p>Query failed: You have an error in your SQL syntax near '1'''</p>");
        DetectionResult r = strategy.analyze(ProbeObservation(base, probe, p));
        REQUIRE(r.vulnerable);
        REQUIRE(r.confidence >= 0.9);
        REQUIRE(r.evidence["signal"] == "sql_error");
    }

    SECTION("New server error without a signature is a weaker signal") {
        HttpResponse base = page(200, "<p>User 1</p>");
        HttpResponse probe = page(500, "<p>Internal Server Error</p>");
        DetectionResult r = strategy.analyze(ProbeObservation(base, probe, p));
        REQUIRE(r.vulnerable);
        REQUIRE(r.confidence == Approx(0.7));
        REQUIRE(r.evidence["signal"] == "server_error");
    }
}

TEST_CASE("Boolean-based strategy", "[sql_injection][boolean]") {
    BooleanBasedStrategy strategy;
    HttpResponse base = page(200, std::string(11, 'a'));

    SECTION("OR true triples the page") {
        Payload p = payload_with(BooleanExpectation::OR_TRUE);
        HttpResponse probe = page(200, std::string(33, 'a'));
        DetectionResult r = strategy.analyze(ProbeObservation(base, probe, p));
        REQUIRE(r.vulnerable);
        REQUIRE(r.confidence > 0.6);
        REQUIRE(r.evidence["length_ratio"].get<double>() == Approx(3.0));
    }

    SECTION("OR true with a small growth") {
        Payload p = payload_with(BooleanExpectation::OR_TRUE);
        HttpResponse big_base = page(200, std::string(100, 'a'));
        HttpResponse probe = page(200, std::string(112, 'a'));
        DetectionResult r = strategy.analyze(ProbeObservation(big_base, probe, p));
        REQUIRE(r.confidence == Approx(0.7));
    }

    SECTION("AND false shrinks the page") {
        Payload p = payload_with(BooleanExpectation::AND_FALSE);
        HttpResponse probe = page(200, std::string(4, 'a'));
        REQUIRE(strategy.analyze(ProbeObservation(base, probe, p)).vulnerable);
    }

    SECTION("Echoed payload does not count as content") {
        Payload p = payload_with(BooleanExpectation::OR_TRUE);
        HttpResponse probe = page(200, std::string(11, 'a') + "1' OR '1'='1 1' OR '1'='1");
        ProbeObservation obs(base, probe, p);
        obs.injected = "1' OR '1'='1";
        REQUIRE_FALSE(strategy.analyze(obs).vulnerable);
    }
}

TEST_CASE("Time-based strategy needs timing data", "[sql_injection][time]") {
    TimeBasedStrategy strategy;
    Payload p;
    p.strategy = Strategy::TIME_BASED;
    HttpResponse r = page(200, "ok");
    REQUIRE_FALSE(strategy.analyze(ProbeObservation(r, r, p)).vulnerable);
}

TEST_CASE("Plugin lifecycle", "[sql_injection][plugin]") {
    FakeTransport transport;
    serve_target(transport);
    SqlInjectionPlugin plugin;

    REQUIRE(plugin.name() == "sql_injection");
    REQUIRE_FALSE(plugin.ready());
    REQUIRE(plugin.scan_url("http://target.test/user?id=1").empty());
    REQUIRE(transport.request_count() == 0);

    plugin.setup(test_helpers::fast_scan_options(), transport, std::make_shared<CancelToken>(), nullptr);
    REQUIRE(plugin.ready());
    plugin.scan_url("http://target.test/static?id=1");
    long sent = plugin.requests_sent();
    REQUIRE(sent > 0);

    plugin.cleanup();
    plugin.cleanup();
    REQUIRE_FALSE(plugin.ready());
    REQUIRE(plugin.requests_sent() == sent);
}

TEST_CASE("Error-based SQL injection", "[sql_injection][plugin]") {
    PluginFixture fx;
    auto findings = fx.plugin.scan_url("http://target.test/user?id=1");

    REQUIRE(findings.size() == 1);
    const Finding& f = findings[0];
    REQUIRE(f.sub_type == "error_based_sqli");
    REQUIRE(f.category == "sql_injection");
    REQUIRE(f.confidence >= 0.8);
    REQUIRE(f.parameter == "id");
    REQUIRE(f.method == "GET");
    REQUIRE(f.url == "http://target.test/user");
    REQUIRE(f.cwe_id == "CWE-89");
    REQUIRE(f.evidence["database"] == "mysql");
    REQUIRE(f.response["status"] == 500);
    REQUIRE_FALSE(f.remediation.empty());
}

TEST_CASE("Boolean-based blind SQL injection", "[sql_injection][plugin]") {
    PluginFixture fx;

    SECTION("OR true lists every row") {
        auto findings = fx.plugin.scan_url("http://target.test/product?id=1");
        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].sub_type == "boolean_blind_sqli");
        REQUIRE(findings[0].confidence >= 0.7);
        REQUIRE(findings[0].evidence["length_ratio"].get<double>() > 1.5);
    }

    SECTION("AND true is confirmed by its false counterpart") {
        auto findings = fx.plugin.scan_url("http://target.test/catalog?id=1");
        const Finding* f = find_sub_type(findings, "boolean_blind_sqli");
        REQUIRE(f != nullptr);
        REQUIRE(f->payload == "1' AND '1'='1");
        REQUIRE(f->evidence["false_payload"] == "1' AND '1'='2");
        REQUIRE(f->evidence["false_ratio"].get<double>() <= 0.8);
    }
}

TEST_CASE("Input-insensitive page yields no findings", "[sql_injection][false_positive]") {
    PluginFixture fx;
    auto findings = fx.plugin.scan_url("http://target.test/static?id=1");
    REQUIRE(findings.empty());
}

TEST_CASE("UNION-based SQL injection", "[sql_injection][plugin]") {
    PluginFixture fx;
    auto findings = fx.plugin.scan_url("http://target.test/search?q=phone");

    const Finding* f = find_sub_type(findings, "union_based_sqli");
    REQUIRE(f != nullptr);
    REQUIRE(f->confidence == Approx(0.9));
    REQUIRE(f->payload == "1' UNION SELECT null,version()-- ");
    auto markers = f->evidence["markers"].get<std::vector<std::string>>();
    REQUIRE(std::find(markers.begin(), markers.end(), "version_number") != markers.end());

    // Failed column counts are errors, reported by the error strategy only
    REQUIRE(find_sub_type(findings, "error_based_sqli") != nullptr);
}

TEST_CASE("UNION NULL padding rendered back is a UNION finding", "[sql_injection][plugin]") {
    PluginFixture fx;
    auto findings = fx.plugin.scan_url("http://target.test/archive?id=1");

    REQUIRE(findings.size() == 1);
    const Finding& f = findings[0];
    REQUIRE(f.sub_type == "union_based_sqli");
    REQUIRE(f.confidence == Approx(0.9));
    REQUIRE(f.payload == "' UNION SELECT NULL,NULL-- ");
    REQUIRE(f.evidence["columns"] == 2);
    auto markers = f.evidence["markers"].get<std::vector<std::string>>();
    REQUIRE(markers == std::vector<std::string>{"null_placeholder"});
}

TEST_CASE("Length change alone stays below the UNION threshold", "[sql_injection][union]") {
    UnionBasedStrategy strategy;
    Payload p;
    p.strategy = Strategy::UNION_BASED;
    p.columns = 2;
    HttpResponse base = page(200, "<ul><li>2019 report</li></ul>");
    HttpResponse probe = page(200, "<ul><li>2019 report</li><li>an extra empty row here</li></ul>");

    DetectionResult r = strategy.analyze(ProbeObservation(base, probe, p));
    REQUIRE(r.confidence == Approx(0.5));
    REQUIRE(r.evidence.count("markers") == 0);
}

TEST_CASE("Time-based blind SQL injection", "[sql_injection][plugin][time]") {
    PluginFixture fx;
    auto findings = fx.plugin.scan_url("http://target.test/report?id=1");

    REQUIRE(findings.size() == 1);
    const Finding& f = findings[0];
    REQUIRE(f.sub_type == "time_based_sqli");
    REQUIRE(f.confidence == Approx(0.9));
    REQUIRE(f.evidence["dialect"] == "mysql");
    REQUIRE(f.evidence["baseline_samples"] == 3);
    REQUIRE(f.evidence["first_ms"].get<double>() == Approx(6500.0));
    REQUIRE(f.evidence["second_ms"].get<double>() == Approx(6500.0));
}

TEST_CASE("Heavy fallback round finds a delay the plain payloads miss", "[sql_injection][plugin][time]") {
    PluginFixture fx;
    auto findings = fx.plugin.scan_url("http://target.test/audit?id=1");

    REQUIRE(findings.size() == 1);
    const Finding& f = findings[0];
    REQUIRE(f.sub_type == "time_based_sqli");
    REQUIRE(f.evidence["aggressive"] == true);
    REQUIRE(f.evidence["dialect"] == "mysql");
    REQUIRE(f.payload.find("information_schema.columns A") != std::string::npos);

    // Every plain delay was tried before the heavy one
    auto sent = fx.transport.requests();
    auto first_heavy = std::find_if(sent.begin(), sent.end(), [](const HttpRequest& r) {
        return test_helpers::param(r, "id").find("information_schema.columns A") != std::string::npos;
    });
    REQUIRE(first_heavy != sent.end());
    REQUIRE(std::any_of(sent.begin(), first_heavy, [](const HttpRequest& r) {
        return test_helpers::param(r, "id").find("WAITFOR DELAY") != std::string::npos;
    }));
}

TEST_CASE("Blocked payloads are resent with the alternate encoding", "[sql_injection][plugin][waf]") {
    FakeTransport transport;
    serve_target(transport);
    ScanOptions opts = test_helpers::fast_scan_options();

    SECTION("Without the bypass the filter hides the flaw") {
        SqlInjectionPlugin plugin;
        plugin.setup(opts, transport, std::make_shared<CancelToken>(), nullptr);
        REQUIRE(find_sub_type(plugin.scan_url("http://target.test/guarded?id=1"), "error_based_sqli") == nullptr);
    }

    SECTION("With the bypass the resent payload reaches the query") {
        opts.waf_bypass = true;
        SqlInjectionPlugin plugin;
        plugin.setup(opts, transport, std::make_shared<CancelToken>(), nullptr);
        auto findings = plugin.scan_url("http://target.test/guarded?id=1");

        const Finding* f = find_sub_type(findings, "error_based_sqli");
        REQUIRE(f != nullptr);
        REQUIRE(f->response["status"] == 500);
        REQUIRE(f->evidence["database"] == "mysql");

        auto sent = transport.requests();
        bool blocked_then_resent = false;
        for (size_t i = 0; i + 1 < sent.size(); ++i) {
            if (sent[i].url.find("id=1%27") != std::string::npos &&
                sent[i + 1].url.find("id=1'") != std::string::npos) {
                blocked_then_resent = true;
            }
        }
        REQUIRE(blocked_then_resent);
    }
}

TEST_CASE("Numeric path segments are probed", "[sql_injection][plugin][path]") {
    PluginFixture fx;
    CrawlResult target;
    target.url = "http://target.test/item/5";
    target.method = "GET";
    target.source = "page";

    auto findings = fx.plugin.scan(target);

    const Finding* f = find_sub_type(findings, "error_based_sqli");
    REQUIRE(f != nullptr);
    REQUIRE(f->parameter == "path[1]");
    REQUIRE(f->evidence["origin"] == "path");
    REQUIRE(fx.transport.count_for("/item/5") >= 1);
}

TEST_CASE("Cancelled scan stops probing", "[sql_injection][plugin]") {
    FakeTransport transport;
    serve_target(transport);
    auto cancel = std::make_shared<CancelToken>();
    SqlInjectionPlugin plugin;
    plugin.setup(test_helpers::fast_scan_options(), transport, cancel, nullptr);

    cancel->cancel();
    REQUIRE(plugin.scan_url("http://target.test/user?id=1").empty());
    REQUIRE(transport.request_count() == 0);
}
