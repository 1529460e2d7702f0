// Session management implementation

#include "session_manager.h"
#include "url_utils.h"
#include "logging/console.h"
#include <gumbo.h>
#include <algorithm>
#include <regex>
#include <vector>

SessionManager::SessionManager(const HttpTransport& transport)
    : transport_(transport) {}

void SessionManager::set_sender(Sender sender) {
    sender_ = std::move(sender);
}

bool SessionManager::send(HttpRequest& req, HttpResponse& resp) const {
    if (sender_) {
        return sender_(req, resp);
    }
    return transport_.perform(req, resp);
}

void SessionManager::configure(const AuthOptions& auth) {
    std::lock_guard<std::mutex> lock(mutex_);
    auth_ = auth;
}

bool SessionManager::has_credentials() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return auth_.enabled();
}

std::map<std::string, std::string> SessionManager::cookies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cookies_;
}

void SessionManager::set_cookies(const std::map<std::string, std::string>& cookies) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, value] : cookies) {
        cookies_[name] = value;
    }
}

void SessionManager::update_from_response(const HttpResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& header : response.headers) {
        if (header.first == "set-cookie") {
            for (const auto& cookie : parse_cookies(header.second)) {
                cookies_[cookie.first] = cookie.second;
            }
        }
    }
}

bool SessionManager::is_login_redirect(const HttpResponse& response) {
    if (!response.is_redirect()) return false;
    std::string location = url::to_lower(response.header("location"));
    return location.find("login") != std::string::npos;
}

bool SessionManager::authenticate() {
    // One login at a time; concurrent callers wait and reuse the fresh cookies
    std::lock_guard<std::mutex> login_lock(login_mutex_);

    AuthOptions auth;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auth = auth_;
    }
    if (!auth.enabled()) {
        return false;
    }

    // Step 1: Fetch login page to get CSRF token
    HttpRequest req;
    req.method = "GET";
    req.url = auth.login_url;
    req.headers["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
    req.cookies = cookies();

    HttpResponse resp;
    if (!send(req, resp) || resp.status != 200) {
        logging::warn("login page fetch failed: " + auth.login_url +
                      (resp.error.empty() ? "" : " (" + resp.error + ")"));
        return false;
    }
    update_from_response(resp);

    std::string csrf_token = extract_csrf_token(resp.body, auth.token_field);

    // Step 2: Submit login form
    url::Params form = {
        {"username", auth.username},
        {"password", auth.password},
        {"Login", "Login"},
    };
    if (!csrf_token.empty()) {
        form.emplace_back(auth.token_field, csrf_token);
    }

    HttpRequest login_req;
    login_req.method = "POST";
    login_req.url = auth.login_url;
    login_req.headers["Content-Type"] = "application/x-www-form-urlencoded";
    login_req.headers["Referer"] = auth.login_url;
    login_req.body = url::build_query(form);
    login_req.cookies = cookies();

    HttpResponse login_resp;
    if (!send(login_req, login_resp)) {
        logging::warn("login submit failed: " + login_resp.error);
        return false;
    }
    update_from_response(login_resp);

    // Being sent back to the login page means the credentials were refused
    if (is_login_redirect(login_resp)) {
        return false;
    }
    return login_resp.status == 200 || login_resp.status == 302 || login_resp.status == 303;
}

std::string SessionManager::extract_csrf_token(const std::string& html, const std::string& field_name) {
    std::vector<std::regex> patterns;
    if (!field_name.empty()) {
        // Escape regex metacharacters in the configured name
        static const std::regex meta(R"([.^$|()\[\]{}*+?\\])");
        std::string escaped = std::regex_replace(field_name, meta, R"(\$&)");
        patterns.emplace_back(R"(name=["'])" + escaped + R"(["'][^>]*value=["']([^"']+)["'])", std::regex::icase);
        patterns.emplace_back(R"(value=["']([^"']+)["'][^>]*name=["'])" + escaped + R"(["'])", std::regex::icase);
    }
    patterns.emplace_back(R"(<input[^>]*name=["']csrf_token["'][^>]*value=["']([^"']+)["'])", std::regex::icase);
    patterns.emplace_back(R"(<input[^>]*name=["']_token["'][^>]*value=["']([^"']+)["'])", std::regex::icase);
    patterns.emplace_back(R"(<meta[^>]*name=["']csrf-token["'][^>]*content=["']([^"']+)["'])", std::regex::icase);

    for (const auto& pattern : patterns) {
        std::smatch match;
        if (std::regex_search(html, match, pattern) && match.size() > 1) {
            return match[1].str();
        }
    }

    // Fall back to a DOM walk for attribute orders the regexes miss
    GumboOutput* output = gumbo_parse(html.c_str());
    if (output) {
        std::string token = extract_csrf_from_gumbo(static_cast<void*>(output->root), field_name);
        gumbo_destroy_output(&kGumboDefaultOptions, output);
        if (!token.empty()) {
            return token;
        }
    }

    return "";
}

std::string SessionManager::extract_csrf_from_gumbo(void* node_ptr, const std::string& field_name) {
    GumboNode* node = static_cast<GumboNode*>(node_ptr);
    if (node->type != GUMBO_NODE_ELEMENT) {
        return "";
    }

    GumboElement* element = &node->v.element;

    if (element->tag == GUMBO_TAG_INPUT) {
        GumboAttribute* name_attr = gumbo_get_attribute(&element->attributes, "name");
        GumboAttribute* value_attr = gumbo_get_attribute(&element->attributes, "value");

        if (name_attr && value_attr) {
            std::string lower_name = url::to_lower(name_attr->value);
            if (lower_name == url::to_lower(field_name) ||
                lower_name.find("csrf") != std::string::npos ||
                lower_name == "_token" ||
                lower_name == "authenticity_token") {
                return value_attr->value;
            }
        }
    }

    GumboVector* children = &element->children;
    for (unsigned int i = 0; i < children->length; ++i) {
        std::string token = extract_csrf_from_gumbo(children->data[i], field_name);
        if (!token.empty()) {
            return token;
        }
    }

    return "";
}

std::map<std::string, std::string> SessionManager::parse_cookies(const std::string& set_cookie_header) {
    std::map<std::string, std::string> cookies;

    // Parse Set-Cookie header: name=value; Path=/; Domain=example.com; Secure; HttpOnly
    size_t eq_pos = set_cookie_header.find('=');
    if (eq_pos == std::string::npos) {
        return cookies;
    }

    std::string name = set_cookie_header.substr(0, eq_pos);
    name.erase(0, name.find_first_not_of(" \t"));
    name.erase(name.find_last_not_of(" \t") + 1);

    size_t semi_pos = set_cookie_header.find(';', eq_pos);
    std::string value;
    if (semi_pos != std::string::npos) {
        value = set_cookie_header.substr(eq_pos + 1, semi_pos - eq_pos - 1);
    } else {
        value = set_cookie_header.substr(eq_pos + 1);
    }

    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t") + 1);

    if (!name.empty()) {
        cookies[name] = value;
    }

    return cookies;
}
