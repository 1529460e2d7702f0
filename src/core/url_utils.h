#pragma once
#include <string>
#include <utility>
#include <vector>

// URL helpers shared by the crawler, the request executor and the detection
// strategies. Parsing goes through libcurl's CURLU API so that relative
// reference resolution follows RFC 3986.

namespace url {

using Params = std::vector<std::pair<std::string, std::string>>;

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

/**
 * @brief Split an absolute URL into components
 * @param u URL to parse
 * @param out Populated on success
 * @return false if the URL is malformed or not absolute
 */
bool split(const std::string& u, UrlParts& out);

/**
 * @brief Resolve a (possibly relative) reference against a base URL
 * @param base Absolute URL of the referring page
 * @param href Reference found in the page
 * @return Absolute URL without fragment, or empty on failure
 */
std::string resolve(const std::string& base, const std::string& href);

/**
 * @brief Canonical form used for dedup: lower-case scheme and host, default
 *        port dropped, empty path becomes "/", trailing slash removed from
 *        non-root paths, query parameters sorted by name, fragment stripped.
 *        Applying it twice yields the same string.
 * @param u URL to normalize
 * @return Normalized URL, or empty if the URL is malformed
 */
std::string normalize(const std::string& u);

/**
 * @brief Extract the origin (scheme + host + port) from a URL
 * @return Origin string, or empty if URL is invalid
 */
std::string origin_of(const std::string& u);

std::string host_of(const std::string& u);

/// Path component, "/" when empty.
std::string path_of(const std::string& u);

/// URL with query and fragment removed.
std::string strip_query(const std::string& u);

/**
 * @brief Registrable domain (effective TLD + 1) of a host name
 *
 * Uses a built-in table of multi-label public suffixes. IP literals and
 * single-label hosts are returned unchanged.
 */
std::string registrable_domain(const std::string& host);

/// True when both URLs share the same registrable domain.
bool same_site(const std::string& a, const std::string& b);

std::string to_lower(std::string s);

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string encode(const std::string& s);

/// Decode %XX escapes and '+' as space.
std::string decode(const std::string& s);

/// Parse the query component of a URL (or a bare query string) into pairs.
Params parse_query(const std::string& u);

/// Build an application/x-www-form-urlencoded string.
std::string build_query(const Params& params);

/**
 * @brief Set one query parameter, keeping the position of existing ones
 * @param u URL to modify
 * @param name Parameter name
 * @param raw_value Value already encoded for the query string
 * @return Modified URL
 */
std::string with_query_param(const std::string& u, const std::string& name, const std::string& raw_value);

/// Path segments without empty entries.
std::vector<std::string> path_segments(const std::string& u);

/// Replace the path segment at index with value (already encoded).
std::string with_path_segment(const std::string& u, size_t index, const std::string& raw_value);

/// True if the segment consists of digits only.
bool is_numeric_segment(const std::string& segment);

} // namespace url
