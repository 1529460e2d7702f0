/**
 * @file test_xss.cpp
 * @brief Unit tests for the cross-site scripting plugin and strategies
 *
 * Fake target endpoints:
 * - /greet: echoes the name parameter raw into the body
 * - /link: echoes the parameter raw inside an href attribute
 * - /safe: echoes the parameter HTML-escaped
 * - /dom: static page whose script copies location.search into innerHTML
 * - /guestbook: stores POSTed entries and renders them raw
 * - /notes: stores POSTed entries and renders them escaped
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "plugins/xss_plugin.h"
#include "helpers/fake_transport.h"
#include <memory>
#include <mutex>
#include <regex>
#include <vector>

using test_helpers::FakeTransport;

namespace {

const char* kDomPage = R"(<html><body>
<div id="out"></div>
<script>
  var q = new URLSearchParams(location.search).get('q');
  document.getElementById('out').innerHTML = q;
</script>
</body></html>)";

struct Board {
    std::mutex mutex;
    std::vector<std::string> entries;
};

void serve_board(FakeTransport& transport, const std::string& path,
                 std::shared_ptr<Board> board, bool escape) {
    transport.route(path, [path, board, escape](const HttpRequest& req, HttpResponse& resp) {
        std::lock_guard<std::mutex> lock(board->mutex);
        if (req.method == "POST") {
            std::string entry = test_helpers::param(req, "name") + ": " + test_helpers::param(req, "message");
            board->entries.push_back(entry);
            resp = test_helpers::redirect(302, path);
            return;
        }
        std::string body = "<h1>Entries</h1>";
        for (const auto& e : board->entries) {
            body += "<div class=\"entry\">" + (escape ? html_escape(e) : e) + "</div>";
        }
        body += "<form method=\"post\"><input name=\"name\"><textarea name=\"message\"></textarea></form>";
        resp = test_helpers::html(200, body);
    });
}

void serve_target(FakeTransport& transport) {
    transport.route("/greet", [](const HttpRequest& req, HttpResponse& resp) {
        resp = test_helpers::html(200, "<p>Hello " + test_helpers::param(req, "name") + "</p>");
    });
    transport.route("/link", [](const HttpRequest& req, HttpResponse& resp) {
        resp = test_helpers::html(200, "<a href=\"" + test_helpers::param(req, "to") + "\">continue</a>");
    });
    transport.route("/safe", [](const HttpRequest& req, HttpResponse& resp) {
        resp = test_helpers::html(200, "<p>Hello " + html_escape(test_helpers::param(req, "name")) + "</p>");
    });
    transport.route("/dom", [](const HttpRequest&, HttpResponse& resp) {
        resp = test_helpers::html(200, kDomPage);
    });
}

CrawlResult board_form(const std::string& path) {
    CrawlResult form;
    form.url = "http://target.test" + path;
    form.method = "POST";
    form.source = "form";
    form.page_url = "http://target.test" + path;
    form.params = {{"name", ""}, {"message", ""}, {"sign", "Sign"}};
    form.fields = {{"name", "text", ""}, {"message", "textarea", ""}, {"sign", "submit", "Sign"}};
    return form;
}

struct PluginFixture {
    FakeTransport transport;
    XssPlugin plugin;

    PluginFixture() {
        serve_target(transport);
        plugin.setup(test_helpers::fast_scan_options(), transport, std::make_shared<CancelToken>(), nullptr);
    }
};

} // namespace

TEST_CASE("Markers are unique and well-formed", "[xss]") {
    std::string a = make_marker();
    std::string b = make_marker();
    REQUIRE(std::regex_match(a, std::regex("XSSMARK[A-Za-z0-9]{8}XSSMARK")));
    REQUIRE(a != b);
}

TEST_CASE("Executable reflection is decided on the parsed page", "[xss][context]") {
    const std::string m = "XSSMARKabcd1234XSSMARK";

    SECTION("Script element") {
        auto r = find_executable_reflection("<p><script>alert('" + m + "')</script></p>", m);
        REQUIRE(r.found);
        REQUIRE(r.context == "script");
    }

    SECTION("Event handler attribute") {
        auto r = find_executable_reflection("<img src=x onerror=alert('" + m + "')>", m);
        REQUIRE(r.found);
        REQUIRE(r.context == "event_handler");
        REQUIRE(r.tag == "img");
        REQUIRE(r.attribute == "onerror");
    }

    SECTION("javascript: URL") {
        auto r = find_executable_reflection("<a href=\" javascript:alert('" + m + "')\">x</a>", m);
        REQUIRE(r.found);
        REQUIRE(r.context == "url");
        REQUIRE(r.attribute == "href");
    }

    SECTION("Escaped echo is only text") {
        std::string escaped = html_escape("<script>alert('" + m + "')</script>");
        REQUIRE_FALSE(find_executable_reflection("<p>" + escaped + "</p>", m).found);
    }

    SECTION("Inert attribute") {
        REQUIRE_FALSE(find_executable_reflection("<input value=\"alert('" + m + "')\">", m).found);
        REQUIRE_FALSE(find_executable_reflection("<a href=\"/search?q=" + m + "\">x</a>", m).found);
    }

    SECTION("Marker absent") {
        REQUIRE_FALSE(find_executable_reflection("<script>alert(1)</script>", m).found);
    }
}

TEST_CASE("Reflected strategy scores by context", "[xss][reflected]") {
    ReflectedXssStrategy strategy;
    const std::string m = "XSSMARKzzzz0000XSSMARK";
    Payload p;
    p.strategy = Strategy::REFLECTED;
    p.context = "url";

    HttpResponse base;
    base.status = 200;
    base.body = "<a href=\"/\">home</a>";
    HttpResponse probe = base;
    probe.body = "<a href=\"javascript:alert('" + m + "')\">home</a>";

    ProbeObservation obs(base, probe, p);
    obs.marker = m;
    DetectionResult r = strategy.analyze(obs);
    REQUIRE(r.vulnerable);
    REQUIRE(r.confidence == Approx(0.8));
    REQUIRE(r.evidence["context"] == "url");
}

TEST_CASE("Reflected XSS in the page body", "[xss][plugin]") {
    PluginFixture fx;
    auto findings = fx.plugin.scan_url("http://target.test/greet?name=bob");

    REQUIRE(findings.size() == 1);
    const Finding& f = findings[0];
    REQUIRE(f.sub_type == "xss_reflected");
    REQUIRE(f.category == "xss");
    REQUIRE(f.cwe_id == "CWE-79");
    REQUIRE(f.confidence == Approx(0.9));
    REQUIRE(f.parameter == "name");
    REQUIRE(f.evidence["context"] == "script");

    // The reported payload is the marked value that was actually sent
    std::string marker = f.evidence["marker"];
    REQUIRE(f.payload.find(marker) != std::string::npos);
}

TEST_CASE("Reflected XSS breaking out of an attribute", "[xss][plugin]") {
    PluginFixture fx;
    auto findings = fx.plugin.scan_url("http://target.test/link?to=home");

    REQUIRE(findings.size() == 1);
    REQUIRE(findings[0].evidence["payload_name"] == "tag_breakout_script");
}

TEST_CASE("Escaped echo is not reported", "[xss][false_positive]") {
    PluginFixture fx;
    auto findings = fx.plugin.scan_url("http://target.test/safe?name=bob");

    REQUIRE(findings.empty());
    REQUIRE(fx.plugin.requests_sent() > 1);
}

TEST_CASE("DOM-based XSS through location.search", "[xss][plugin][dom]") {
    PluginFixture fx;
    auto findings = fx.plugin.scan_url("http://target.test/dom?q=hello");

    REQUIRE(findings.size() == 1);
    const Finding& f = findings[0];
    REQUIRE(f.sub_type == "xss_dom");
    REQUIRE(f.confidence >= 0.7);
    REQUIRE(f.evidence["payload_in_url"] == true);
    REQUIRE(f.evidence["payload_in_body"] == false);
}

TEST_CASE("DOM strategy needs a source-to-sink flow", "[xss][dom]") {
    DomXssStrategy strategy;
    Payload p;
    p.strategy = Strategy::DOM;

    HttpResponse base;
    base.status = 200;
    HttpResponse probe;
    probe.status = 200;
    // Reads the URL but never writes HTML
    probe.body = "<script>console.log(location.search)</script>";

    ProbeObservation obs(base, probe, p);
    obs.marker = "XSSMARKaaaa1111XSSMARK";
    obs.probe_url = "http://target.test/page?q=" + obs.marker;
    DetectionResult r = strategy.analyze(obs);
    REQUIRE_FALSE(r.vulnerable);
    REQUIRE(r.confidence == 0.0);
}

TEST_CASE("Stored XSS through a guestbook form", "[xss][plugin][stored]") {
    PluginFixture fx;
    auto board = std::make_shared<Board>();
    serve_board(fx.transport, "/guestbook", board, false);

    auto findings = fx.plugin.scan(board_form("/guestbook"));

    REQUIRE_FALSE(findings.empty());
    for (const auto& f : findings) {
        REQUIRE(f.sub_type == "xss_stored");
        REQUIRE(f.severity == "critical");
        REQUIRE(f.method == "POST");
        REQUIRE(f.confidence >= 0.8);
        REQUIRE(f.evidence["refetched_page"] == "http://target.test/guestbook");
        REQUIRE(f.evidence["submit_status"] == 302);
        REQUIRE(f.parameter != "sign");
    }
    REQUIRE(fx.transport.count_for("/guestbook") > 3);
}

TEST_CASE("Stored but escaped entries are not reported", "[xss][stored][false_positive]") {
    PluginFixture fx;
    auto board = std::make_shared<Board>();
    serve_board(fx.transport, "/notes", board, true);

    auto findings = fx.plugin.scan(board_form("/notes"));

    REQUIRE(findings.empty());
    std::lock_guard<std::mutex> lock(board->mutex);
    REQUIRE_FALSE(board->entries.empty());
}
