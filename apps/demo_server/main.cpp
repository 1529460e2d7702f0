#include <httplib.h>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <mutex>
#include <random>
#include <regex>
#include <string>
#include <thread>
#include <vector>

using namespace httplib;

// Deliberately vulnerable target for manual end-to-end runs of injscan.
// Queries are simulated against an in-memory table; nothing here is safe to
// expose beyond localhost.

struct Product {
  int id;
  std::string name;
  std::string price;
};

static const std::vector<Product> kProducts = {
  {1, "Widget", "9.99"},
  {2, "Gadget", "24.50"},
  {3, "Doohickey", "4.75"},
  {4, "Thingamajig", "99.00"},
};

static std::mutex g_guestbook_mutex;
static std::vector<std::pair<std::string, std::string>> g_guestbook;

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

static std::string param(const Request& req, const char* name, const char* defv = "") {
  return req.has_param(name) ? req.get_param_value(name) : std::string(defv);
}

static std::string escape_html(const std::string& s) {
  std::string out;
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default: out += c;
    }
  }
  return out;
}

static std::string page(const std::string& title, const std::string& body) {
  return "<!doctype html><html><head><title>" + title + "</title></head><body>"
         "<h1>" + title + "</h1>" + body + "</body></html>";
}

static void mysql_error(Response& res, const std::string& near) {
  res.status = 500;
  res.set_content(page("Database error",
    "<p>You have an error in your SQL syntax; check the manual that corresponds to your "
    "MySQL server version for the right syntax to use near '" + escape_html(near) + "' at line 1</p>"),
    "text/html");
}

// Unbalanced single quotes break the simulated string literal
static bool breaks_literal(const std::string& v) {
  return std::count(v.begin(), v.end(), '\'') % 2 == 1 || v.find('\\') != std::string::npos;
}

static std::string product_rows(const std::vector<Product>& rows) {
  std::string html = "<table>";
  for (const auto& p : rows) {
    html += "<tr><td>" + std::to_string(p.id) + "</td><td>" + p.name + "</td><td>" + p.price + "</td></tr>";
  }
  return html + "</table>";
}

// Sleep for SLEEP(n) / pg_sleep(n) / WAITFOR DELAY '0:0:n' found in the value
static void simulate_delay(const std::string& v) {
  static const std::regex sleep_re(R"((?:sleep|pg_sleep)\s*\(\s*(\d+))", std::regex::icase);
  static const std::regex waitfor_re(R"(waitfor\s+delay\s+'0:0:(\d+)')", std::regex::icase);
  std::smatch m;
  int seconds = 0;
  if (std::regex_search(v, m, sleep_re) || std::regex_search(v, m, waitfor_re)) {
    seconds = std::min(10, std::stoi(m[1].str()));
  }
  if (seconds > 0) {
    std::this_thread::sleep_for(std::chrono::seconds(seconds));
  }
}

int main() {
  Server svr;

  svr.Get("/robots.txt", [](const Request&, Response& res) {
    res.status = 200;
    res.set_content("User-agent: *\nDisallow: /admin\n", "text/plain");
  });

  svr.Get("/healthz", [](const Request&, Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  svr.Get("/", [](const Request&, Response& res) {
    std::string body =
      "<ul>"
      "<li><a href=\"/user?id=1\">Error-based SQLi</a></li>"
      "<li><a href=\"/product?id=1\">Boolean-based SQLi</a></li>"
      "<li><a href=\"/search?q=widget\">UNION-based SQLi</a></li>"
      "<li><a href=\"/report?id=1\">Time-based SQLi</a></li>"
      "<li><a href=\"/item/2\">Path segment SQLi</a></li>"
      "<li><a href=\"/greet?name=guest\">Reflected XSS</a></li>"
      "<li><a href=\"/safe?name=guest\">Escaped output (not vulnerable)</a></li>"
      "<li><a href=\"/dom?page=home\">DOM XSS</a></li>"
      "<li><a href=\"/guestbook\">Stored XSS</a></li>"
      "<li><a href=\"/login\">Login</a></li>"
      "<li><a href=\"/admin?id=1\">Admin (robots disallowed)</a></li>"
      "</ul>";
    res.status = 200;
    res.set_content(page("injscan demo target", body), "text/html");
  });

  // Error-based: SELECT * FROM users WHERE id='<id>'
  svr.Get("/user", [](const Request& req, Response& res) {
    std::string id = param(req, "id", "1");
    if (breaks_literal(id)) {
      mysql_error(res, "'" + id + "' LIMIT 0,1");
      return;
    }
    res.status = 200;
    res.set_content(page("User", "<p>User #" + escape_html(id) + ": alice</p>"), "text/html");
  });

  // Boolean-based: errors are swallowed, only the row count leaks
  svr.Get("/product", [](const Request& req, Response& res) {
    std::string id = param(req, "id", "1");
    std::string l = lower(id);
    std::vector<Product> rows;
    bool always_true = l.find("or '1'='1") != std::string::npos || l.find("or 1=1") != std::string::npos;
    bool always_false = l.find("and '1'='2") != std::string::npos || l.find("and 1=2") != std::string::npos;
    if (always_true) {
      rows = kProducts;
    } else if (!always_false && !breaks_literal(id)) {
      int n = std::atoi(id.c_str());
      for (const auto& p : kProducts) {
        if (p.id == n) rows.push_back(p);
      }
    }
    res.status = 200;
    res.set_content(page("Product", rows.empty() ? "<p>No product.</p>" : product_rows(rows)), "text/html");
  });

  // UNION-based: three columns, metadata functions answered MariaDB-style
  svr.Get("/search", [](const Request& req, Response& res) {
    std::string q = param(req, "q");
    std::string l = lower(q);
    size_t pos = l.find("union select");
    if (pos == std::string::npos) {
      std::vector<Product> rows;
      for (const auto& p : kProducts) {
        if (!q.empty() && lower(p.name).find(l) != std::string::npos) rows.push_back(p);
      }
      res.status = 200;
      res.set_content(page("Search", product_rows(rows)), "text/html");
      return;
    }

    std::string select = q.substr(pos + 12);
    size_t comment = select.find("--");
    if (comment != std::string::npos) select.erase(comment);
    int columns = static_cast<int>(std::count(select.begin(), select.end(), ',')) + 1;
    if (columns != 3) {
      res.status = 500;
      res.set_content(page("Database error",
        "<p>The used SELECT statements have a different number of columns</p>"), "text/html");
      return;
    }

    std::string ls = lower(select);
    std::string cell = "NULL";
    if (ls.find("@@version") != std::string::npos || ls.find("version()") != std::string::npos) {
      cell = "10.11.6-MariaDB-0+deb12u1";
    } else if (ls.find("database()") != std::string::npos) {
      cell = "shopdb";
    } else if (ls.find("user()") != std::string::npos) {
      cell = "shop@localhost";
    }
    res.status = 200;
    res.set_content(page("Search", "<table><tr><td>" + cell + "</td><td>" + cell + "</td><td>" +
                                   cell + "</td></tr></table>"), "text/html");
  });

  // Time-based: blind, identical output whatever happens
  svr.Get("/report", [](const Request& req, Response& res) {
    simulate_delay(param(req, "id", "1"));
    res.status = 200;
    res.set_content(page("Report", "<p>Your report is being generated.</p>"), "text/html");
  });

  // Numeric path segment: SELECT * FROM items WHERE id=<segment>
  svr.Get(R"(/item/([^/]+))", [](const Request& req, Response& res) {
    std::string id = req.matches[1];
    bool numeric = !id.empty() && std::all_of(id.begin(), id.end(), [](unsigned char c){ return std::isdigit(c); });
    if (!numeric) {
      mysql_error(res, id);
      return;
    }
    res.status = 200;
    res.set_content(page("Item", "<p>Item " + id + "</p>"), "text/html");
  });

  svr.Get("/greet", [](const Request& req, Response& res) {
    std::string name = param(req, "name", "guest");
    res.status = 200;
    res.set_content(page("Greeting",
      "<p>Hello, " + name + "!</p>"
      "<form method=\"GET\" action=\"/greet\"><input type=\"text\" name=\"name\" value=\"\">"
      "<input type=\"submit\" value=\"Greet\"></form>"), "text/html");
  });

  svr.Get("/safe", [](const Request& req, Response& res) {
    std::string name = param(req, "name", "guest");
    res.status = 200;
    res.set_content(page("Greeting", "<p>Hello, " + escape_html(name) + "!</p>"), "text/html");
  });

  svr.Get("/dom", [](const Request&, Response& res) {
    res.status = 200;
    res.set_content(page("Welcome",
      "<div id=\"out\"></div>"
      "<script>"
      "var p = new URLSearchParams(location.search).get('page');"
      "document.getElementById('out').innerHTML = 'Section: ' + p;"
      "</script>"), "text/html");
  });

  svr.Get("/guestbook", [](const Request&, Response& res) {
    std::string entries;
    {
      std::lock_guard<std::mutex> lock(g_guestbook_mutex);
      for (const auto& [name, message] : g_guestbook) {
        entries += "<div class=\"entry\"><b>" + escape_html(name) + "</b>: " + message + "</div>";
      }
    }
    res.status = 200;
    res.set_content(page("Guestbook",
      entries +
      "<form method=\"POST\" action=\"/guestbook\">"
      "<input type=\"text\" name=\"name\" value=\"\">"
      "<textarea name=\"message\"></textarea>"
      "<input type=\"submit\" name=\"sign\" value=\"Sign\">"
      "</form>"), "text/html");
  });

  svr.Post("/guestbook", [](const Request& req, Response& res) {
    {
      std::lock_guard<std::mutex> lock(g_guestbook_mutex);
      g_guestbook.emplace_back(param(req, "name", "anonymous"), param(req, "message"));
    }
    res.status = 302;
    res.set_header("Location", "/guestbook");
  });

  // Login with a CSRF token, the flow the session manager replays
  svr.Get("/login", [](const Request&, Response& res) {
    std::string token = "tok" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count());
    res.status = 200;
    res.set_header("Set-Cookie", "csrf=" + token + "; Path=/; HttpOnly");
    res.set_content(page("Login",
      "<form method=\"POST\" action=\"/login\">"
      "<input type=\"hidden\" name=\"user_token\" value=\"" + token + "\">"
      "<input type=\"text\" name=\"username\">"
      "<input type=\"password\" name=\"password\">"
      "<input type=\"submit\" name=\"Login\" value=\"Login\">"
      "</form>"), "text/html");
  });

  svr.Post("/login", [](const Request& req, Response& res) {
    std::string cookie = req.get_header_value("Cookie");
    std::string token = param(req, "user_token");
    bool token_ok = !token.empty() && cookie.find("csrf=" + token) != std::string::npos;
    if (token_ok && param(req, "username") == "admin" && param(req, "password") == "password") {
      res.status = 302;
      res.set_header("Location", "/admin?id=1");
      res.set_header("Set-Cookie", "session_id=s" + token + "; Path=/; HttpOnly; SameSite=Lax");
      return;
    }
    res.status = 302;
    res.set_header("Location", "/login?failed=1");
  });

  // Requires a session; bounces to the login page otherwise
  svr.Get("/admin", [](const Request& req, Response& res) {
    if (req.get_header_value("Cookie").find("session_id=") == std::string::npos) {
      res.status = 302;
      res.set_header("Location", "/login");
      return;
    }
    std::string id = param(req, "id", "1");
    if (breaks_literal(id)) {
      mysql_error(res, id);
      return;
    }
    res.status = 200;
    res.set_content(page("Admin", "<p>Order #" + escape_html(id) + "</p>"), "text/html");
  });

  std::cout << "Attempting to bind to http://127.0.0.1:8080\n";
  if (!svr.bind_to_port("127.0.0.1", 8080)) {
    std::fprintf(stderr, "ERROR: failed to bind 127.0.0.1:8080\n");
    return 1;
  }
  std::cout << "Listening for requests...\n";
  svr.listen_after_bind();
  return 0;
}
