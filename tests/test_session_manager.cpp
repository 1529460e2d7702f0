/**
 * @file test_session_manager.cpp
 * @brief Unit tests for SessionManager
 *
 * Tests session management functionality including:
 * - Set-Cookie parsing and cookie merging
 * - CSRF token extraction from login forms
 * - Login redirect recognition
 * - The form login flow against a fake target
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "core/session_manager.h"
#include "core/http_client.h"
#include "helpers/fake_transport.h"

using test_helpers::FakeTransport;

namespace {

// Login endpoint that hands out a CSRF token and checks it on submit
void serve_login(FakeTransport& transport) {
    transport.route("/login", [](const HttpRequest& req, HttpResponse& resp) {
        if (req.method == "GET") {
            resp = test_helpers::html(200, R"(
                <form method="POST" action="/login">
                  <input type="text" name="username">
                  <input type="password" name="password">
                  <input type="hidden" name="user_token" value="a1b2c3">
                </form>)");
            resp.headers.push_back({"set-cookie", "csrf=pre; Path=/"});
            return;
        }
        auto csrf = req.cookies.find("csrf");
        bool ok = csrf != req.cookies.end() && csrf->second == "pre" &&
                  test_helpers::param(req, "user_token") == "a1b2c3" &&
                  test_helpers::param(req, "username") == "admin" &&
                  test_helpers::param(req, "password") == "password";
        if (ok) {
            resp = test_helpers::redirect(302, "/index.php");
            resp.headers.push_back({"set-cookie", "session_id=s3ss10n; Path=/; HttpOnly"});
        } else {
            resp = test_helpers::redirect(302, "/login.php?failed=1");
        }
    });
}

AuthOptions admin_auth(const std::string& password = "password") {
    AuthOptions auth;
    auth.login_url = "http://target.test/login";
    auth.username = "admin";
    auth.password = password;
    return auth;
}

} // namespace

TEST_CASE("SessionManager construction", "[session_manager]") {
    FakeTransport transport;
    SessionManager manager(transport);

    REQUIRE_FALSE(manager.has_credentials());
    REQUIRE(manager.cookies().empty());

    SECTION("Authentication without credentials fails without traffic") {
        REQUIRE_FALSE(manager.authenticate());
        REQUIRE(transport.request_count() == 0);
    }
}

TEST_CASE("Cookie parsing", "[session_manager]") {
    auto cookies = SessionManager::parse_cookies("session_id=abc123; Path=/; HttpOnly; Secure");
    REQUIRE(cookies.size() == 1);
    REQUIRE(cookies["session_id"] == "abc123");

    REQUIRE(SessionManager::parse_cookies(" theme = dark ")["theme"] == "dark");
    REQUIRE(SessionManager::parse_cookies("HttpOnly").empty());
    REQUIRE(SessionManager::parse_cookies("=orphan; Path=/").empty());
}

TEST_CASE("Session cookie management", "[session_manager]") {
    FakeTransport transport;
    SessionManager manager(transport);
    manager.set_cookies({{"theme", "dark"}, {"user", "guest"}});

    HttpResponse response;
    response.status = 200;
    response.headers.push_back({"set-cookie", "session_id=abc123; Path=/; HttpOnly"});
    response.headers.push_back({"set-cookie", "user=testuser; Path=/"});
    response.headers.push_back({"x-other", "ignored=1"});

    manager.update_from_response(response);

    auto cookies = manager.cookies();
    REQUIRE(cookies.size() == 3);
    REQUIRE(cookies["session_id"] == "abc123");
    REQUIRE(cookies["user"] == "testuser");
    REQUIRE(cookies["theme"] == "dark");
}

TEST_CASE("CSRF token extraction", "[session_manager][csrf]") {
    SECTION("Configured field name") {
        std::string html = R"(<input type="hidden" name="user_token" value="tok-42">)";
        REQUIRE(SessionManager::extract_csrf_token(html, "user_token") == "tok-42");
    }

    SECTION("Value before name") {
        std::string html = R"(<input value='rev-99' type='hidden' name='user_token'>)";
        REQUIRE(SessionManager::extract_csrf_token(html, "user_token") == "rev-99");
    }

    SECTION("Common framework names") {
        REQUIRE(SessionManager::extract_csrf_token(
                    R"(<input type="hidden" name="csrf_token" value="csrf_abc123">)", "user_token") == "csrf_abc123");
        REQUIRE(SessionManager::extract_csrf_token(
                    R"(<input type="hidden" name="_token" value="laravel">)", "") == "laravel");
        REQUIRE(SessionManager::extract_csrf_token(
                    R"(<meta name="csrf-token" content="from-meta">)", "") == "from-meta");
    }

    SECTION("DOM fallback finds other attribute orders") {
        std::string html = R"(<form><input
            type="hidden"
            value="rails-tok" id="t" name="authenticity_token"></form>)";
        REQUIRE(SessionManager::extract_csrf_token(html, "user_token") == "rails-tok");
    }

    SECTION("No token") {
        REQUIRE(SessionManager::extract_csrf_token("<form><input name=\"q\"></form>", "user_token").empty());
    }
}

TEST_CASE("Login redirect detection", "[session_manager]") {
    REQUIRE(SessionManager::is_login_redirect(test_helpers::redirect(302, "/login.php")));
    REQUIRE(SessionManager::is_login_redirect(test_helpers::redirect(303, "http://target.test/Account/LOGIN?next=/")));
    REQUIRE_FALSE(SessionManager::is_login_redirect(test_helpers::redirect(302, "/dashboard")));

    HttpResponse page = test_helpers::html(200, "please login");
    REQUIRE_FALSE(SessionManager::is_login_redirect(page));
}

TEST_CASE("Form login flow", "[session_manager][auth]") {
    FakeTransport transport;
    serve_login(transport);
    SessionManager manager(transport);

    SECTION("Valid credentials") {
        manager.configure(admin_auth());
        REQUIRE(manager.has_credentials());
        REQUIRE(manager.authenticate());

        auto cookies = manager.cookies();
        REQUIRE(cookies["session_id"] == "s3ss10n");
        REQUIRE(cookies["csrf"] == "pre");

        auto requests = transport.requests();
        REQUIRE(requests.size() == 2);
        REQUIRE(requests[0].method == "GET");
        REQUIRE(requests[1].method == "POST");
        REQUIRE(requests[1].body.find("Login=Login") != std::string::npos);
        REQUIRE(requests[1].headers.at("Referer") == "http://target.test/login");
    }

    SECTION("Wrong password bounces back to the login page") {
        manager.configure(admin_auth("letmein"));
        REQUIRE_FALSE(manager.authenticate());
        REQUIRE(manager.cookies().count("session_id") == 0);
    }

    SECTION("Unreachable login page") {
        manager.configure(admin_auth());
        transport.fail_next(1);
        REQUIRE_FALSE(manager.authenticate());
        REQUIRE(transport.request_count() == 1);
    }
}

TEST_CASE("HttpClient build_cookie_header", "[http_client]") {
    std::map<std::string, std::string> cookies;
    cookies["session_id"] = "abc123";
    cookies["user"] = "testuser";
    cookies["token"] = "xyz789";

    std::string header = HttpClient::build_cookie_header(cookies);

    REQUIRE_FALSE(header.empty());
    REQUIRE(header.find("session_id=abc123") != std::string::npos);
    REQUIRE(header.find("user=testuser") != std::string::npos);
    REQUIRE(header.find("token=xyz789") != std::string::npos);
}

TEST_CASE("HttpClient build_cookie_header empty", "[http_client]") {
    std::map<std::string, std::string> cookies;
    std::string header = HttpClient::build_cookie_header(cookies);
    REQUIRE(header.empty());
}
