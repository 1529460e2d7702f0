/**
 * @file xss_strategies.cpp
 * @brief Reflected, DOM and stored XSS verdicts using gumbo
 */

#include "xss_strategies.h"
#include "core/url_utils.h"
#include <gumbo.h>
#include <algorithm>

namespace {

std::string tag_name(const GumboElement& el) {
    if (el.tag != GUMBO_TAG_UNKNOWN) {
        return gumbo_normalized_tagname(el.tag);
    }
    GumboStringPiece piece = el.original_tag;
    gumbo_tag_from_original_text(&piece);
    return url::to_lower(std::string(piece.data, piece.length));
}

std::string script_text(const GumboNode* node) {
    std::string text;
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        const GumboNode* child = static_cast<const GumboNode*>(children.data[i]);
        if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_CDATA ||
            child->type == GUMBO_NODE_WHITESPACE) {
            text += child->v.text.text;
        }
    }
    return text;
}

bool is_url_attribute(const std::string& name) {
    return name == "href" || name == "src" || name == "action" ||
           name == "formaction" || name == "data";
}

} // namespace

ExecutableReflection find_executable_reflection(const std::string& html, const std::string& marker) {
    ExecutableReflection out;
    if (marker.empty() || html.find(marker) == std::string::npos) {
        return out;
    }

    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    if (!output) {
        return out;
    }

    const std::string call = "alert('" + marker + "')";

    // Iterative DFS over elements
    std::vector<const GumboNode*> stack{output->root};
    while (!stack.empty() && !out.found) {
        const GumboNode* node = stack.back();
        stack.pop_back();
        if (node->type != GUMBO_NODE_ELEMENT) continue;

        const GumboElement& el = node->v.element;

        if (el.tag == GUMBO_TAG_SCRIPT) {
            if (script_text(node).find(call) != std::string::npos) {
                out.found = true;
                out.context = "script";
                out.tag = "script";
                break;
            }
        }

        for (unsigned int i = 0; i < el.attributes.length; ++i) {
            const GumboAttribute* attr = static_cast<const GumboAttribute*>(el.attributes.data[i]);
            std::string name = url::to_lower(attr->name);
            std::string value = attr->value ? attr->value : "";
            if (value.find(marker) == std::string::npos) continue;

            if (name.size() > 2 && name.compare(0, 2, "on") == 0) {
                out.found = true;
                out.context = "event_handler";
            } else if (is_url_attribute(name)) {
                std::string v = url::to_lower(value);
                v.erase(0, v.find_first_not_of(" \t\r\n"));
                if (v.rfind("javascript:", 0) == 0) {
                    out.found = true;
                    out.context = "url";
                }
            }
            if (out.found) {
                out.tag = tag_name(el);
                out.attribute = name;
                break;
            }
        }

        for (unsigned int i = 0; i < el.children.length; ++i) {
            stack.push_back(static_cast<const GumboNode*>(el.children.data[i]));
        }
    }

    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return out;
}

std::string snippet_around(const std::string& body, const std::string& needle) {
    size_t pos = body.find(needle);
    if (pos == std::string::npos) return "";
    size_t start = pos > 60 ? pos - 60 : 0;
    size_t end = std::min(body.size(), pos + needle.size() + 60);
    return body.substr(start, end - start);
}

DetectionResult ReflectedXssStrategy::analyze(const ProbeObservation& obs) const {
    DetectionResult r;

    bool reflected = !obs.marker.empty() && obs.probe.body.find(obs.marker) != std::string::npos;
    r.evidence["marker"] = obs.marker;
    r.evidence["reflected"] = reflected;
    r.evidence["payload_context"] = obs.payload.context;
    if (!reflected) {
        return r;
    }

    ExecutableReflection exec = find_executable_reflection(obs.probe.body, obs.marker);
    r.evidence["snippet"] = snippet_around(obs.probe.body, obs.marker);
    if (!exec.found) {
        // Present only as text or escaped; the browser would not run it
        r.evidence["context"] = "text";
        return r;
    }

    r.vulnerable = true;
    r.confidence = exec.context == "url" ? 0.8 : 0.9;
    r.evidence["context"] = exec.context;
    r.evidence["tag"] = exec.tag;
    if (!exec.attribute.empty()) {
        r.evidence["attribute"] = exec.attribute;
    }
    return r;
}

DetectionResult DomXssStrategy::analyze(const ProbeObservation& obs) const {
    DetectionResult r;

    static const std::vector<std::string> sources = {
        "location.hash", "location.search", "location.href", "document.url",
        "document.location", "window.location", "document.referrer"
    };
    static const std::vector<std::string> sinks = {
        "document.write", "innerhtml", "outerhtml", "insertadjacenthtml", "eval("
    };

    std::string lower = url::to_lower(obs.probe.body);
    std::vector<std::string> found_sources, found_sinks;
    for (const auto& s : sources) {
        if (lower.find(s) != std::string::npos) found_sources.push_back(s);
    }
    for (const auto& s : sinks) {
        if (lower.find(s) != std::string::npos) found_sinks.push_back(s);
    }

    size_t indicators = found_sources.size() + found_sinks.size();
    r.evidence["sources"] = found_sources;
    r.evidence["sinks"] = found_sinks;
    if (indicators == 0) {
        return r;
    }

    double confidence = 0.3 * static_cast<double>(std::min<size_t>(indicators, 2));

    bool in_body = !obs.marker.empty() && obs.probe.body.find(obs.marker) != std::string::npos;
    bool in_url = !obs.marker.empty() && obs.probe_url.find(obs.marker) != std::string::npos;
    // URL presence only matters when the page both reads the URL and writes HTML
    bool flows = in_body || (in_url && !found_sources.empty() && !found_sinks.empty());
    if (flows) {
        confidence += 0.4;
    }

    ExecutableReflection exec = find_executable_reflection(obs.probe.body, obs.marker);
    if (exec.found && exec.context == "script") {
        confidence += 0.5;
    }

    r.confidence = clamp_confidence(confidence);
    r.vulnerable = flows && r.confidence >= kThreshold;
    r.evidence["marker"] = obs.marker;
    r.evidence["payload_in_body"] = in_body;
    r.evidence["payload_in_url"] = in_url;
    r.evidence["script_pattern"] = exec.found && exec.context == "script";
    if (!r.vulnerable) {
        r.confidence = 0.0;
    }
    return r;
}

DetectionResult StoredXssStrategy::analyze(const ProbeObservation& obs) const {
    DetectionResult r;
    r.evidence["marker"] = obs.marker;

    if (obs.marker.empty() || obs.baseline.body.find(obs.marker) != std::string::npos) {
        return r;
    }

    bool persisted = obs.probe.body.find(obs.marker) != std::string::npos;
    r.evidence["persisted"] = persisted;
    if (!persisted) {
        return r;
    }

    ExecutableReflection exec = find_executable_reflection(obs.probe.body, obs.marker);
    r.evidence["snippet"] = snippet_around(obs.probe.body, obs.marker);
    if (!exec.found) {
        r.evidence["context"] = "escaped";
        return r;
    }

    r.vulnerable = true;
    r.confidence = 0.95;
    r.evidence["context"] = exec.context;
    r.evidence["tag"] = exec.tag;
    r.evidence["refetch_status"] = obs.probe.status;
    return r;
}
