/**
 * @file crawler.cpp
 * @brief Web crawler using gumbo and the request executor
 */

#include "crawler.h"
#include "url_utils.h"
#include "logging/console.h"
#include <gumbo.h>
#include <openssl/evp.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <regex>
#include <sstream>
#include <thread>

namespace {

/// Get current timestamp in ISO8601 format.
std::string current_utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.';
    ss << std::setw(3) << std::setfill('0') << ms.count() << "Z";
    return ss.str();
}

/// Hash string using sha256.
std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx, data.data(), data.size());
    EVP_DigestFinal_ex(ctx, digest, &digest_len);
    EVP_MD_CTX_free(ctx);

    std::ostringstream ss;
    ss << "sha256:";
    ss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; i++) {
        ss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

const std::set<std::string>& ignored_extensions() {
    static const std::set<std::string> exts = {
        "jpg", "jpeg", "png", "gif", "bmp", "ico", "svg", "webp",
        "css", "less", "scss", "sass",
        "js", "map", "json", "xml", "woff", "woff2", "ttf", "eot",
        "pdf", "doc", "docx", "xls", "xlsx", "ppt", "pptx",
        "zip", "rar", "tar", "gz", "7z",
        "mp3", "mp4", "avi", "mov", "wmv", "flv", "ogg", "webm",
        "exe", "dll", "bin", "dat", "dmg", "iso",
        "jar", "war", "ear",
        "swf", "torrent"
    };
    return exts;
}

const std::set<std::string>& ignored_dirs() {
    static const std::set<std::string> dirs = {
        "__macosx",
        ".git", ".svn", ".hg", ".bzr", ".idea", ".vscode",
        "node_modules", "bower_components", "vendor",
        "logs", "log", "temp", "tmp",
        "cache", "caches"
    };
    return dirs;
}

bool skipped_reference(const std::string& ref) {
    if (ref.empty() || ref[0] == '#') return true;
    std::string lower = url::to_lower(ref);
    static const char* schemes[] = {"javascript:", "mailto:", "tel:", "data:", "sms:", "ftp:"};
    for (const char* s : schemes) {
        if (lower.rfind(s, 0) == 0) return true;
    }
    return false;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool is_html(const HttpResponse& resp) {
    std::string ct = url::to_lower(resp.header("content-type"));
    return ct.find("text/html") != std::string::npos ||
           ct.find("application/xhtml+xml") != std::string::npos;
}

std::string attribute(const GumboElement& el, const char* name) {
    GumboAttribute* attr = gumbo_get_attribute(&el.attributes, name);
    return (attr && attr->value) ? attr->value : "";
}

std::string node_text(const GumboNode* node) {
    std::string text;
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        const GumboNode* child = static_cast<const GumboNode*>(children.data[i]);
        if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_WHITESPACE) {
            text += child->v.text.text;
        }
    }
    return text;
}

/// Default value of a <select>: the selected option, else the first one.
std::string select_default(const GumboNode* select) {
    std::string first;
    bool have_first = false;
    std::vector<const GumboNode*> stack{select};
    std::vector<const GumboNode*> options;
    while (!stack.empty()) {
        const GumboNode* n = stack.back();
        stack.pop_back();
        if (n->type != GUMBO_NODE_ELEMENT) continue;
        if (n->v.element.tag == GUMBO_TAG_OPTION) {
            options.push_back(n);
        }
        const GumboVector& children = n->v.element.children;
        for (unsigned int i = children.length; i > 0; --i) {
            stack.push_back(static_cast<const GumboNode*>(children.data[i - 1]));
        }
    }
    for (const GumboNode* opt : options) {
        GumboAttribute* value_attr = gumbo_get_attribute(&opt->v.element.attributes, "value");
        std::string value = value_attr ? value_attr->value : trim(node_text(opt));
        if (gumbo_get_attribute(&opt->v.element.attributes, "selected")) {
            return value;
        }
        if (!have_first) {
            first = value;
            have_first = true;
        }
    }
    return first;
}

/// Collect named fields of one form in document order.
void collect_fields(const GumboNode* form, CrawlResult& out) {
    std::vector<const GumboNode*> stack{form};
    while (!stack.empty()) {
        const GumboNode* n = stack.back();
        stack.pop_back();
        if (n->type != GUMBO_NODE_ELEMENT) continue;

        const GumboElement& el = n->v.element;
        if (el.tag == GUMBO_TAG_INPUT || el.tag == GUMBO_TAG_TEXTAREA || el.tag == GUMBO_TAG_SELECT) {
            // Ignore nameless inputs
            std::string name = attribute(el, "name");
            if (!name.empty()) {
                FormField field;
                field.name = name;
                if (el.tag == GUMBO_TAG_TEXTAREA) {
                    field.type = "textarea";
                    field.value = node_text(n);
                } else if (el.tag == GUMBO_TAG_SELECT) {
                    field.type = "select";
                    field.value = select_default(n);
                } else {
                    field.type = url::to_lower(attribute(el, "type"));
                    if (field.type.empty()) field.type = "text";
                    field.value = attribute(el, "value");
                }
                // Unchecked boxes are not submitted by a browser, but their
                // parameter is still worth probing
                out.params.emplace_back(field.name, field.value);
                out.fields.push_back(std::move(field));
            }
        }

        // Reverse push keeps document order
        const GumboVector& children = el.children;
        for (unsigned int i = children.length; i > 0; --i) {
            stack.push_back(static_cast<const GumboNode*>(children.data[i - 1]));
        }
    }
}

} // namespace

/// Init Crawler with a request executor and config options.
Crawler::Crawler(RequestExecutor& executor, const Options& opts)
    : executor_(executor), opts_(opts) {}

std::vector<std::string> Crawler::parse_robots(const std::string& body) {
    std::vector<std::string> disallows;
    std::istringstream ss(body);
    std::string line;
    std::string agent;
    bool in_star = false;
    bool last_was_agent = false;

    while (std::getline(ss, line)) {
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string directive = url::to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (directive == "user-agent") {
            // Consecutive User-agent lines share one group
            if (!last_was_agent) in_star = false;
            if (value == "*") in_star = true;
            last_was_agent = true;
            continue;
        }
        last_was_agent = false;

        if (directive == "disallow" && in_star && !value.empty()) {
            disallows.push_back(value);
        }
    }
    return disallows;
}

void Crawler::load_robots() {
    disallowed_.clear();
    if (!opts_.respect_robots) return;

    HttpRequest r;
    r.method = "GET";
    r.url = url::origin_of(seed_) + "/robots.txt";
    SendResult sent = executor_.send(r);
    if (!sent.ok()) {
        logging::debug("crawler: robots.txt unreachable (" + std::string(send_status_name(sent.status)) +
                       "), crawling without rules");
        return;
    }
    if (sent.response.status != 200) return;

    disallowed_ = parse_robots(sent.response.body);
    if (!disallowed_.empty()) {
        logging::debug("crawler: " + std::to_string(disallowed_.size()) + " robots.txt disallow rule(s)");
    }
}

bool Crawler::robots_allows(const std::string& u) const {
    if (!opts_.respect_robots) return true;

    std::string path = url::path_of(u);
    for (const auto& d : disallowed_) {
        if (d == "/") {
            // Site wide disallow
            return false;
        }
        if (path.rfind(d, 0) == 0) {
            // Path prefix match
            return false;
        }
    }
    return true;
}

bool Crawler::is_ignored(const std::string& u) {
    std::string path = url::to_lower(url::path_of(u));

    size_t slash = path.find_last_of('/');
    std::string last = slash == std::string::npos ? path : path.substr(slash + 1);
    size_t dot = last.find_last_of('.');
    if (dot != std::string::npos && ignored_extensions().count(last.substr(dot + 1))) {
        return true;
    }

    for (const auto& segment : url::path_segments(path)) {
        if (ignored_dirs().count(segment)) return true;
    }
    return false;
}

bool Crawler::in_scope(const std::string& u) const {
    url::UrlParts parts;
    if (!url::split(u, parts)) return false;
    if (parts.scheme != "http" && parts.scheme != "https") return false;
    return url::same_site(seed_, u);
}

std::set<std::string> Crawler::extract_links(const std::string& html, const std::string& base_url) {
    static const std::regex attr_re(R"((href|src|action|data|location)\s*=\s*["']([^"']+)["'])",
                                    std::regex::icase);
    static const std::regex js_re(R"((url|location)\s*[:=]\s*["']([^"']+)["'])", std::regex::icase);
    static const std::regex css_re(R"(url\(['"]?([^'")]+)['"]?\))", std::regex::icase);

    std::set<std::string> out;
    auto add = [&](const std::string& raw) {
        std::string ref = trim(raw);
        if (skipped_reference(ref)) return;
        std::string abs = url::resolve(base_url, ref);
        if (abs.empty()) return;
        std::string norm = url::normalize(abs);
        if (!norm.empty()) out.insert(norm);
    };

    for (auto it = std::sregex_iterator(html.begin(), html.end(), attr_re); it != std::sregex_iterator(); ++it) {
        add((*it)[2].str());
    }
    for (auto it = std::sregex_iterator(html.begin(), html.end(), js_re); it != std::sregex_iterator(); ++it) {
        add((*it)[2].str());
    }
    for (auto it = std::sregex_iterator(html.begin(), html.end(), css_re); it != std::sregex_iterator(); ++it) {
        add((*it)[1].str());
    }
    return out;
}

std::vector<CrawlResult> Crawler::extract_forms(const std::string& html, const std::string& page_url) {
    std::vector<CrawlResult> forms;
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    if (!output) return forms;

    // Begin iterative DFS
    std::vector<const GumboNode*> stack{output->root};
    while (!stack.empty()) {
        const GumboNode* node = stack.back();
        stack.pop_back();
        if (node->type != GUMBO_NODE_ELEMENT) continue;

        if (node->v.element.tag == GUMBO_TAG_FORM) {
            CrawlResult form;
            std::string action = trim(attribute(node->v.element, "action"));
            // Empty action submits to the page itself
            form.url = action.empty() ? page_url : url::resolve(page_url, action);
            std::string method = url::to_lower(attribute(node->v.element, "method"));
            form.method = method == "post" ? "POST" : "GET";
            form.source = "form";
            form.page_url = page_url;
            form.discovery_path = {page_url, form.url};
            collect_fields(node, form);

            if (!form.url.empty()) {
                std::string key = form.method + " " + url::strip_query(form.url);
                for (const auto& f : form.fields) {
                    key += " " + f.name;
                }
                form.hash = sha256_hex(key);
                form.timestamp = current_utc_timestamp();
                forms.push_back(std::move(form));
            }
            // Nested forms are not valid HTML
            continue;
        }

        const GumboVector& children = node->v.element.children;
        for (unsigned int i = children.length; i > 0; --i) {
            stack.push_back(static_cast<const GumboNode*>(children.data[i - 1]));
        }
    }

    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return forms;
}

void Crawler::visit(const std::string& u, int depth) {
    if (observer_) observer_(u);

    HttpRequest req;
    req.method = "GET";
    req.url = u;
    req.headers["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
    SendResult sent = executor_.send(req);
    if (!sent.ok()) {
        // Not crawlable, not fatal
        logging::debug("crawler: " + u + " not crawlable (" + send_status_name(sent.status) + ")");
        return;
    }
    const HttpResponse& resp = sent.response;

    std::vector<std::string> path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path = discovery_[u];
    }

    CrawlResult page;
    page.url = u;
    page.method = "GET";
    page.headers = resp.headers;
    for (const auto& [name, value] : resp.headers) {
        if (name == "set-cookie") page.cookies.push_back(value);
    }
    page.source = "page";
    page.page_url = u;
    page.discovery_path = path;
    page.depth = depth;
    page.timestamp = current_utc_timestamp();
    page.hash = sha256_hex(u);
    page.params = url::parse_query(u);
    if (!page.params.empty()) page.source = "query";

    if (resp.status < 200 || resp.status >= 400 || !is_html(resp) || resp.body.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        pages_.push_back(std::move(page));
        return;
    }

    std::set<std::string> links = extract_links(resp.body, u);
    std::vector<CrawlResult> forms = extract_forms(resp.body, u);

    std::lock_guard<std::mutex> lock(mutex_);
    pages_.push_back(std::move(page));

    auto discover = [&](const std::string& link) {
        if (!in_scope(link) || is_ignored(link) || !robots_allows(link)) return;
        if (found_.insert(link).second) {
            std::vector<std::string> child = path;
            child.push_back(link);
            discovery_[link] = std::move(child);
        }
    };

    for (const auto& link : links) {
        discover(link);
    }
    for (auto& form : forms) {
        if (!in_scope(form.url)) continue;
        form.depth = depth;
        if (form.method == "GET") {
            discover(url::normalize(url::strip_query(form.url)));
        } else {
            discover(url::normalize(form.url));
        }
        if (form_hashes_.insert(form.hash).second) {
            forms_.push_back(std::move(form));
        }
    }
}

/// Perform web crawl process starting from the seed.
std::set<std::string> Crawler::crawl(const std::string& seed) {
    seed_ = url::normalize(seed);
    found_.clear();
    visited_.clear();
    pages_.clear();
    forms_.clear();
    form_hashes_.clear();
    discovery_.clear();
    if (seed_.empty()) {
        logging::warn("crawler: invalid seed URL '" + seed + "'");
        return found_;
    }

    load_robots();

    if (robots_allows(seed_)) {
        found_.insert(seed_);
        discovery_[seed_] = {seed_};
    } else {
        logging::info("crawler: seed " + seed_ + " is disallowed by robots.txt");
    }

    long processed = 0;
    for (int depth = 0; depth <= opts_.max_depth; ++depth) {
        if (executor_.cancelled()) break;

        std::vector<std::string> level;
        for (const auto& u : found_) {
            if (!visited_.count(u)) level.push_back(u);
        }
        if (level.empty()) {
            break;
        }

        long remaining = opts_.max_urls - processed;
        if (remaining <= 0) break;
        if (static_cast<long>(level.size()) > remaining) {
            level.resize(static_cast<size_t>(remaining));
        }
        for (const auto& u : level) {
            visited_.insert(u);
        }
        logging::debug("crawler: depth " + std::to_string(depth) + ", " + std::to_string(level.size()) +
                       " page(s)");

        // Fetch the level in parallel; the executor caps what is in flight
        std::atomic<size_t> next(0);
        auto worker = [&]() {
            for (size_t i = next.fetch_add(1); i < level.size(); i = next.fetch_add(1)) {
                if (executor_.cancelled()) return;
                visit(level[i], depth);
            }
        };
        size_t n_workers = std::min<size_t>(level.size(), static_cast<size_t>(std::max(1, opts_.parallel_fetches)));
        std::vector<std::thread> workers;
        for (size_t i = 1; i < n_workers; ++i) {
            workers.emplace_back(worker);
        }
        worker();
        for (auto& t : workers) {
            t.join();
        }

        processed += static_cast<long>(level.size());
        if (processed >= opts_.max_urls) {
            logging::info("crawler: URL budget of " + std::to_string(opts_.max_urls) + " reached");
            break;
        }
    }

    logging::info("crawler: " + std::to_string(found_.size()) + " URL(s), " +
                  std::to_string(forms_.size()) + " form(s) on " + seed_);
    return found_;
}

std::vector<CrawlResult> Crawler::surface() const {
    std::vector<CrawlResult> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& page : pages_) {
        bool numeric_path = false;
        for (const auto& seg : url::path_segments(page.url)) {
            if (url::is_numeric_segment(seg)) numeric_path = true;
        }
        if (!page.params.empty() || numeric_path) {
            out.push_back(page);
        }
    }
    out.insert(out.end(), forms_.begin(), forms_.end());
    return out;
}
