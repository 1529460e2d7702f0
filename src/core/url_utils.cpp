/**
 * @file url_utils.cpp
 * @brief URL parsing, resolution and normalization
 */

#include "url_utils.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <set>
#include <sstream>

namespace url {

// Public suffixes made of two labels. A host ending in one of these keeps
// three labels for its registrable domain.
static const std::set<std::string>& multi_label_suffixes() {
    static const std::set<std::string> suffixes = {
        "co.uk", "org.uk", "ac.uk", "gov.uk", "ltd.uk", "me.uk", "net.uk",
        "com.au", "net.au", "org.au", "edu.au", "gov.au",
        "co.jp", "ne.jp", "or.jp", "ac.jp",
        "co.nz", "org.nz", "net.nz",
        "com.br", "net.br", "org.br",
        "co.in", "net.in", "org.in",
        "co.za", "org.za",
        "com.cn", "net.cn", "org.cn",
        "com.tr", "com.mx", "com.ar", "com.sg", "com.hk", "com.tw",
        "co.kr", "or.kr", "co.id", "or.id", "ac.id", "go.id", "web.id",
        "com.my", "com.ph", "com.vn", "com.ua", "com.pl", "co.il",
    };
    return suffixes;
}

static std::string get_part(CURLU* h, CURLUPart part) {
    char* p = nullptr;
    std::string out;
    if (curl_url_get(h, part, &p, 0) == CURLUE_OK && p) {
        out = p;
    }
    if (p) curl_free(p);
    return out;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

bool split(const std::string& u, UrlParts& out) {
    if (u.empty()) return false;
    CURLU* h = curl_url();
    if (!h) return false;
    if (curl_url_set(h, CURLUPART_URL, u.c_str(), 0) != CURLUE_OK) {
        curl_url_cleanup(h);
        return false;
    }
    out.scheme = to_lower(get_part(h, CURLUPART_SCHEME));
    out.host = to_lower(get_part(h, CURLUPART_HOST));
    out.port = get_part(h, CURLUPART_PORT);
    out.path = get_part(h, CURLUPART_PATH);
    out.query = get_part(h, CURLUPART_QUERY);
    out.fragment = get_part(h, CURLUPART_FRAGMENT);
    curl_url_cleanup(h);
    if (out.path.empty()) out.path = "/";
    return !out.scheme.empty() && !out.host.empty();
}

/// Assemble full URL from components.
static std::string join(const UrlParts& p) {
    std::string out = p.scheme + "://" + p.host;
    if (!p.port.empty()) out += ":" + p.port;
    if (p.path.empty() || p.path.front() != '/') out += '/';
    out += p.path;
    if (!p.query.empty()) out += "?" + p.query;
    return out;
}

std::string resolve(const std::string& base, const std::string& href) {
    if (href.empty()) return {};
    CURLU* h = curl_url();
    if (!h) return {};
    std::string resolved;
    if (curl_url_set(h, CURLUPART_URL, base.c_str(), 0) == CURLUE_OK &&
        curl_url_set(h, CURLUPART_URL, href.c_str(), 0) == CURLUE_OK) {
        curl_url_set(h, CURLUPART_FRAGMENT, nullptr, 0);
        char* full = nullptr;
        if (curl_url_get(h, CURLUPART_URL, &full, 0) == CURLUE_OK && full) {
            resolved = full;
        }
        if (full) curl_free(full);
    }
    curl_url_cleanup(h);
    return resolved;
}

std::string normalize(const std::string& u) {
    UrlParts p;
    if (!split(u, p)) return {};

    if ((p.scheme == "http" && p.port == "80") || (p.scheme == "https" && p.port == "443")) {
        p.port.clear();
    }
    while (p.path.size() > 1 && p.path.back() == '/') {
        p.path.pop_back();
    }

    // Sort raw query tokens by name; values stay exactly as sent
    if (!p.query.empty()) {
        std::vector<std::string> tokens;
        std::stringstream ss(p.query);
        std::string tok;
        while (std::getline(ss, tok, '&')) {
            if (!tok.empty()) tokens.push_back(tok);
        }
        std::stable_sort(tokens.begin(), tokens.end(), [](const std::string& a, const std::string& b) {
            return a.substr(0, a.find('=')) < b.substr(0, b.find('='));
        });
        std::string q;
        for (const auto& t : tokens) {
            if (!q.empty()) q += '&';
            q += t;
        }
        p.query = q;
    }
    p.fragment.clear();
    return join(p);
}

std::string origin_of(const std::string& u) {
    UrlParts p;
    if (!split(u, p)) return {};
    std::string origin = p.scheme + "://" + p.host;
    if (!p.port.empty()) origin += ":" + p.port;
    return origin;
}

std::string host_of(const std::string& u) {
    UrlParts p;
    if (!split(u, p)) return {};
    return p.host;
}

std::string path_of(const std::string& u) {
    UrlParts p;
    if (!split(u, p)) return "/";
    return p.path;
}

std::string strip_query(const std::string& u) {
    UrlParts p;
    if (!split(u, p)) return u;
    p.query.clear();
    return join(p);
}

static bool is_ip_literal(const std::string& host) {
    if (host.find(':') != std::string::npos) return true;
    return !host.empty() && std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '.';
    });
}

std::string registrable_domain(const std::string& host_in) {
    std::string host = to_lower(host_in);
    while (!host.empty() && host.back() == '.') host.pop_back();
    if (host.size() > 1 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.empty() || is_ip_literal(host)) return host;

    std::vector<std::string> labels;
    std::stringstream ss(host);
    std::string label;
    while (std::getline(ss, label, '.')) {
        if (!label.empty()) labels.push_back(label);
    }
    if (labels.size() <= 2) return host;

    size_t n = labels.size();
    std::string last_two = labels[n - 2] + "." + labels[n - 1];
    size_t keep = multi_label_suffixes().count(last_two) ? 3 : 2;
    keep = std::min(keep, n);

    std::string out;
    for (size_t i = n - keep; i < n; ++i) {
        if (!out.empty()) out += '.';
        out += labels[i];
    }
    return out;
}

bool same_site(const std::string& a, const std::string& b) {
    std::string ha = host_of(a);
    std::string hb = host_of(b);
    if (ha.empty() || hb.empty()) return false;
    return registrable_domain(ha) == registrable_domain(hb);
}

std::string encode(const std::string& s) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

std::string decode(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); i++) {
        if (str[i] == '%' && i + 2 < str.size() &&
            std::isxdigit(static_cast<unsigned char>(str[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(str[i + 2]))) {
            result.push_back(static_cast<char>(std::stoi(str.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else if (str[i] == '+') {
            result.push_back(' ');
        } else {
            result.push_back(str[i]);
        }
    }
    return result;
}

Params parse_query(const std::string& u) {
    Params params;
    std::string query = u;
    size_t qpos = u.find('?');
    if (qpos != std::string::npos) {
        query = u.substr(qpos + 1);
    } else if (u.find("://") != std::string::npos) {
        return params;
    }
    size_t hash = query.find('#');
    if (hash != std::string::npos) query = query.substr(0, hash);

    size_t start = 0;
    while (start < query.size()) {
        size_t amp = query.find('&', start);
        std::string token = (amp == std::string::npos) ?
            query.substr(start) :
            query.substr(start, amp - start);

        size_t eq = token.find('=');
        std::string key = decode(eq == std::string::npos ? token : token.substr(0, eq));
        std::string val = (eq == std::string::npos) ? "" : decode(token.substr(eq + 1));

        if (!key.empty())
            params.emplace_back(key, val);

        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return params;
}

std::string build_query(const Params& params) {
    std::string out;
    for (const auto& [k, v] : params) {
        if (!out.empty()) out += '&';
        out += encode(k) + "=" + encode(v);
    }
    return out;
}

std::string with_query_param(const std::string& u, const std::string& name, const std::string& raw_value) {
    std::string base = u;
    std::string fragment;
    size_t hash = base.find('#');
    if (hash != std::string::npos) {
        fragment = base.substr(hash);
        base = base.substr(0, hash);
    }
    std::string query;
    size_t qpos = base.find('?');
    if (qpos != std::string::npos) {
        query = base.substr(qpos + 1);
        base = base.substr(0, qpos);
    }

    std::string rebuilt;
    bool replaced = false;
    size_t start = 0;
    while (start < query.size()) {
        size_t amp = query.find('&', start);
        std::string token = (amp == std::string::npos) ? query.substr(start) : query.substr(start, amp - start);
        if (!token.empty()) {
            std::string key = decode(token.substr(0, token.find('=')));
            if (!rebuilt.empty()) rebuilt += '&';
            if (key == name && !replaced) {
                rebuilt += encode(name) + "=" + raw_value;
                replaced = true;
            } else {
                rebuilt += token;
            }
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    if (!replaced) {
        if (!rebuilt.empty()) rebuilt += '&';
        rebuilt += encode(name) + "=" + raw_value;
    }
    return base + "?" + rebuilt + fragment;
}

std::vector<std::string> path_segments(const std::string& u) {
    std::vector<std::string> segments;
    std::stringstream ss(path_of(u));
    std::string seg;
    while (std::getline(ss, seg, '/')) {
        if (!seg.empty()) segments.push_back(seg);
    }
    return segments;
}

std::string with_path_segment(const std::string& u, size_t index, const std::string& raw_value) {
    UrlParts p;
    if (!split(u, p)) return u;
    std::vector<std::string> segments = path_segments(u);
    if (index >= segments.size()) return u;
    segments[index] = raw_value;
    std::string path;
    for (const auto& s : segments) path += "/" + s;
    if (p.path.size() > 1 && p.path.back() == '/') path += '/';
    p.path = path.empty() ? "/" : path;
    return join(p);
}

bool is_numeric_segment(const std::string& segment) {
    if (segment.empty()) return false;
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

} // namespace url
