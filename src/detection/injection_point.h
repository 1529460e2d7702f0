#pragma once
#include "core/http_client.h"
#include "core/url_utils.h"
#include <schema/crawl_result.h>
#include <string>
#include <vector>

// One value a probe can replace: a query parameter, a form field or a
// numeric path segment, plus everything needed to rebuild the request
// around it.

enum class PayloadEncoding {
    STANDARD,       // RFC 3986 percent-encoding
    WAF,            // markup encoded, quotes and parentheses literal
    WAF_DOUBLE      // WAF encoding with every '%' encoded again
};

struct InjectionPoint {
    std::string url;               // endpoint, query included for GET targets
    std::string method;            // upper-case
    std::string parameter;         // name, or "path[<index>]" for path segments
    ParamOrigin origin;
    std::string original_value;
    url::Params params;            // every parameter sent with the request
    size_t segment_index;          // PATH only
    std::string page_url;          // page a form was found on

    InjectionPoint()
        : method("GET"),
          origin(ParamOrigin::NONE),
          segment_index(0)
    {}

    /// Endpoint without query, used for dedup and reporting.
    std::string endpoint() const;
};

/**
 * @brief Enumerate the injectable values of a crawl result
 *
 * Query parameters and form fields become one point each. Submit, button,
 * reset, image and file inputs are sent with their default values but never
 * probed. Empty form values are filled with "1" so the baseline returns data.
 *
 * @param target Crawl result to expand
 * @param include_path_segments Also probe numeric path segments
 * @return Injection points in parameter order
 */
std::vector<InjectionPoint> injection_points(const CrawlResult& target, bool include_path_segments);

/**
 * @brief Build the request that carries a value for the injection point
 * @param point Where to put the value
 * @param value Raw (unencoded) value
 * @param encoding How the value is encoded into the query or path
 * @return Request with target_param and target_origin set
 */
HttpRequest build_probe_request(const InjectionPoint& point,
                                const std::string& value,
                                PayloadEncoding encoding = PayloadEncoding::STANDARD);

/// Request carrying the original value.
inline HttpRequest build_baseline_request(const InjectionPoint& point) {
    return build_probe_request(point, point.original_value);
}

/**
 * @brief Unique marker for XSS probes: XSSMARK + 8 alphanumerics + XSSMARK
 */
std::string make_marker();

/**
 * @brief Remove echoes of the payload (raw, HTML-escaped and URL-encoded)
 *        from a body, so that reflection is not mistaken for a side effect
 */
std::string strip_echo(const std::string& body, const std::string& payload);

/// Minimal HTML escaping of & < > " '
std::string html_escape(const std::string& s);

const char* param_origin_name(ParamOrigin origin);
