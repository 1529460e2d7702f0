#pragma once
#include "http_client.h"
#include <schema/scan_options.h>
#include <functional>
#include <string>
#include <map>
#include <mutex>

// Session state for scanning an authenticated target.
// Holds the cookies that are replayed on every request, merges Set-Cookie
// headers from responses, and re-runs a form login (with CSRF token
// extraction) when the target bounces a request to its login page.

class SessionManager {
public:
    using Sender = std::function<bool(HttpRequest&, HttpResponse&)>;

    /**
     * @brief Create a session manager that logs in through the given transport
     * @param transport Transport for login requests until a sender is set
     */
    explicit SessionManager(const HttpTransport& transport);

    /**
     * @brief Route login requests through a request layer
     * @param sender Sends one request, filling in the response; the owning
     *        RequestExecutor installs one that paces, budgets and retries
     */
    void set_sender(Sender sender);

    /**
     * @brief Store credentials used by authenticate()
     * @param auth Login URL, username, password and CSRF field name
     */
    void configure(const AuthOptions& auth);

    bool has_credentials() const;

    /**
     * @brief Perform the form login flow
     *
     * GET login page, extract CSRF token, POST credentials. Cookies from both
     * responses are merged into the session.
     *
     * @return true if the login POST was accepted and did not bounce back to
     *         the login page
     */
    bool authenticate();

    /**
     * @brief Snapshot of the cookies to send with the next request
     */
    std::map<std::string, std::string> cookies() const;

    /**
     * @brief Merge caller-supplied cookies into the session
     * @param cookies Cookie name -> value
     */
    void set_cookies(const std::map<std::string, std::string>& cookies);

    /**
     * @brief Add cookies from Set-Cookie headers of a response
     * @param response HTTP response containing Set-Cookie headers
     */
    void update_from_response(const HttpResponse& response);

    /**
     * @brief Check whether a response redirects to a login page
     * @param response Response to inspect
     * @return true for a 3xx whose Location mentions "login"
     */
    static bool is_login_redirect(const HttpResponse& response);

    /**
     * @brief Extract a CSRF token from HTML
     * @param html HTML content containing the login form
     * @param field_name Preferred hidden input name (e.g. "user_token")
     * @return Token value, or empty string if none found
     */
    static std::string extract_csrf_token(const std::string& html, const std::string& field_name);

    /**
     * @brief Parse a Set-Cookie header value into name and value
     * @param set_cookie_header Set-Cookie header value
     * @return Map with at most one cookie name -> value
     */
    static std::map<std::string, std::string> parse_cookies(const std::string& set_cookie_header);

private:
    const HttpTransport& transport_;
    Sender sender_;
    AuthOptions auth_;
    std::map<std::string, std::string> cookies_;
    mutable std::mutex mutex_;
    std::mutex login_mutex_;

    bool send(HttpRequest& req, HttpResponse& resp) const;

    static std::string extract_csrf_from_gumbo(void* node, const std::string& field_name);  // GumboNode*
};
