/**
 * @file test_crawler.cpp
 * @brief Unit tests for the breadth-first crawler
 *
 * Tests:
 * - Link and form extraction from HTML
 * - Registrable-domain scope and ignored resources
 * - robots.txt handling
 * - Depth and URL budget limits
 * - The scan surface handed to plugins
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "core/crawler.h"
#include "helpers/fake_transport.h"
#include <algorithm>

using test_helpers::FakeTransport;

namespace {

void serve(FakeTransport& transport, const std::string& path, const std::string& body) {
    transport.route(path, [body](const HttpRequest&, HttpResponse& resp) {
        resp = test_helpers::html(200, body);
    });
}

const char* kHomePage = R"HTML(
<html><body>
  <a href="/a">A</a>
  <a href="products?id=7#reviews">Products</a>
  <a href="http://other.com/x">Elsewhere</a>
  <a href="http://blog.site.test/post">Blog</a>
  <a href="/admin/panel">Admin</a>
  <a href="/static/logo.png">Logo</a>
  <a href="/node_modules/lib/index.html">Dependency</a>
  <a href="mailto:root@site.test">Mail</a>
  <a href="javascript:void(0)">Nothing</a>
  <a href="#top">Top</a>
  <form method="post" action="/guestbook">
    <input type="text" name="name" value="">
    <textarea name="message">hello</textarea>
    <select name="mood"><option value="sad">Sad</option><option value="glad" selected>Glad</option></select>
    <input type="submit" name="sign" value="Sign">
  </form>
</body></html>
)HTML";

} // namespace

TEST_CASE("robots.txt rules for all agents are parsed", "[crawler][robots]") {
    std::string robots =
        "User-agent: googlebot\n"
        "Disallow: /google-only\n"
        "\n"
        "User-agent: bingbot\n"
        "User-agent: *\n"
        "Disallow: /admin   # back office\n"
        "Disallow: /private/\n"
        "Disallow:\n"
        "Allow: /public\n";

    auto rules = Crawler::parse_robots(robots);
    REQUIRE(rules.size() == 2);
    REQUIRE(rules[0] == "/admin");
    REQUIRE(rules[1] == "/private/");
}

TEST_CASE("Links are resolved, normalized and filtered", "[crawler][links]") {
    auto links = Crawler::extract_links(kHomePage, "http://site.test/");

    REQUIRE(links.count("http://site.test/a"));
    REQUIRE(links.count("http://site.test/products?id=7"));
    REQUIRE(links.count("http://other.com/x"));
    REQUIRE(links.count("http://site.test/guestbook"));
    for (const auto& link : links) {
        REQUIRE(link.find("mailto:") == std::string::npos);
        REQUIRE(link.find("javascript:") == std::string::npos);
        REQUIRE(link.find('#') == std::string::npos);
    }

    auto script_links = Crawler::extract_links(
        "<script>window.location = '/next?step=2';</script><style>body{background:url(/bg.css)}</style>",
        "http://site.test/dir/");
    REQUIRE(script_links.count("http://site.test/next?step=2"));
    REQUIRE(script_links.count("http://site.test/bg.css"));
}

TEST_CASE("Static assets and dependency directories are ignored", "[crawler]") {
    REQUIRE(Crawler::is_ignored("http://site.test/static/logo.PNG"));
    REQUIRE(Crawler::is_ignored("http://site.test/app.js?v=3"));
    REQUIRE(Crawler::is_ignored("http://site.test/.git/config"));
    REQUIRE(Crawler::is_ignored("http://site.test/node_modules/lib/index.html"));
    REQUIRE_FALSE(Crawler::is_ignored("http://site.test/products?id=7"));
    REQUIRE_FALSE(Crawler::is_ignored("http://site.test/report.php"));
}

TEST_CASE("Forms are extracted with their fields", "[crawler][forms]") {
    auto forms = Crawler::extract_forms(kHomePage, "http://site.test/");
    REQUIRE(forms.size() == 1);

    const CrawlResult& form = forms[0];
    REQUIRE(form.url == "http://site.test/guestbook");
    REQUIRE(form.method == "POST");
    REQUIRE(form.source == "form");
    REQUIRE(form.page_url == "http://site.test/");
    REQUIRE(form.hash.rfind("sha256:", 0) == 0);

    REQUIRE(form.fields.size() == 4);
    REQUIRE(form.fields[0].name == "name");
    REQUIRE(form.fields[0].type == "text");
    REQUIRE(form.fields[1].type == "textarea");
    REQUIRE(form.fields[1].value == "hello");
    REQUIRE(form.fields[2].type == "select");
    REQUIRE(form.fields[2].value == "glad");
    REQUIRE(form.fields[3].type == "submit");
    REQUIRE(form.params.size() == 4);

    SECTION("Missing action submits to the page itself") {
        auto self = Crawler::extract_forms("<form><input name=\"q\"></form>", "http://site.test/search?x=1");
        REQUIRE(self.size() == 1);
        REQUIRE(self[0].url == "http://site.test/search?x=1");
        REQUIRE(self[0].method == "GET");
        REQUIRE(self[0].fields[0].type == "text");
    }
}

TEST_CASE("Crawl stays on the registrable domain and honours robots.txt", "[crawler]") {
    FakeTransport transport;
    transport.route("/robots.txt", [](const HttpRequest&, HttpResponse& resp) {
        resp.status = 200;
        resp.headers.push_back({"content-type", "text/plain"});
        resp.body = "User-agent: *\nDisallow: /admin\n";
    });
    serve(transport, "/", kHomePage);
    serve(transport, "/a", "<a href=\"/a/deeper\">deeper</a>");
    serve(transport, "/products", "<p>product 7</p>");
    serve(transport, "/guestbook", "<p>entries</p>");

    RequestExecutor executor(transport, test_helpers::fast_executor_options());
    Crawler crawler(executor);
    auto found = crawler.crawl("http://site.test/");

    REQUIRE(found.count("http://site.test/"));
    REQUIRE(found.count("http://site.test/a"));
    REQUIRE(found.count("http://site.test/products?id=7"));
    REQUIRE(found.count("http://blog.site.test/post"));
    REQUIRE(found.count("http://site.test/a/deeper"));
    REQUIRE_FALSE(found.count("http://other.com/x"));
    REQUIRE_FALSE(found.count("http://site.test/admin/panel"));
    REQUIRE_FALSE(found.count("http://site.test/static/logo.png"));

    REQUIRE(transport.count_for("/admin/panel") == 0);
    REQUIRE(crawler.visited().count("http://site.test/a"));
    REQUIRE(crawler.forms().size() == 1);
    REQUIRE_FALSE(crawler.robots_allows("http://site.test/admin"));
    REQUIRE(crawler.robots_allows("http://site.test/a"));

    SECTION("Surface lists query URLs and forms") {
        auto surface = crawler.surface();
        bool has_query = std::any_of(surface.begin(), surface.end(), [](const CrawlResult& r) {
            return r.source == "query" && r.url == "http://site.test/products?id=7";
        });
        bool has_form = std::any_of(surface.begin(), surface.end(), [](const CrawlResult& r) {
            return r.source == "form" && r.method == "POST";
        });
        bool has_plain_page = std::any_of(surface.begin(), surface.end(), [](const CrawlResult& r) {
            return r.url == "http://site.test/a";
        });
        REQUIRE(has_query);
        REQUIRE(has_form);
        REQUIRE_FALSE(has_plain_page);
    }
}

TEST_CASE("Seed disallowed by robots.txt is never fetched", "[crawler][robots]") {
    FakeTransport transport;
    transport.route("/robots.txt", [](const HttpRequest&, HttpResponse& resp) {
        resp.status = 200;
        resp.body = "User-agent: *\nDisallow: /\n";
    });
    serve(transport, "/", kHomePage);

    RequestExecutor executor(transport, test_helpers::fast_executor_options());
    Crawler crawler(executor);
    auto found = crawler.crawl("http://site.test/");

    REQUIRE(found.empty());
    REQUIRE(transport.count_for("/") == 0);

    SECTION("Ignoring robots.txt crawls it anyway") {
        Crawler::Options opts;
        opts.respect_robots = false;
        Crawler permissive(executor, opts);
        permissive.crawl("http://site.test/");
        REQUIRE(transport.count_for("/") == 1);
        REQUIRE(transport.count_for("/robots.txt") == 1);
    }
}

TEST_CASE("Depth and URL budget bound the crawl", "[crawler][limits]") {
    FakeTransport transport;
    serve(transport, "/", "<a href=\"/l1\">1</a>");
    serve(transport, "/l1", "<a href=\"/l2\">2</a>");
    serve(transport, "/l2", "<a href=\"/l3\">3</a>");
    serve(transport, "/l3", "<p>end</p>");

    RequestExecutor executor(transport, test_helpers::fast_executor_options());

    SECTION("max_depth") {
        Crawler::Options opts;
        opts.max_depth = 1;
        Crawler crawler(executor, opts);
        auto found = crawler.crawl("http://site.test/");

        REQUIRE(crawler.visited().size() == 2);
        REQUIRE(found.count("http://site.test/l2"));
        REQUIRE(transport.count_for("/l2") == 0);
    }

    SECTION("max_urls") {
        Crawler::Options opts;
        opts.max_urls = 2;
        Crawler crawler(executor, opts);
        crawler.crawl("http://site.test/");

        REQUIRE(crawler.visited().size() == 2);
        REQUIRE(transport.count_for("/l2") == 0);
    }
}

TEST_CASE("Non-HTML and error pages are not parsed for links", "[crawler]") {
    FakeTransport transport;
    serve(transport, "/", "<a href=\"/data\">data</a><a href=\"/broken\">broken</a>");
    transport.route("/data", [](const HttpRequest&, HttpResponse& resp) {
        resp.status = 200;
        resp.headers.push_back({"content-type", "application/octet-stream"});
        resp.body = "<a href=\"/hidden-in-binary\">x</a>";
    });
    transport.route("/broken", [](const HttpRequest&, HttpResponse& resp) {
        resp = test_helpers::html(500, "<a href=\"/hidden-in-error\">x</a>");
    });

    RequestExecutor executor(transport, test_helpers::fast_executor_options());
    Crawler crawler(executor);
    auto found = crawler.crawl("http://site.test/");

    REQUIRE(found.count("http://site.test/data"));
    REQUIRE_FALSE(found.count("http://site.test/hidden-in-binary"));
    REQUIRE_FALSE(found.count("http://site.test/hidden-in-error"));
}
