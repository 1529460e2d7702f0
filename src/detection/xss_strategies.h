#pragma once
#include "detection_strategy.h"
#include <string>
#include <vector>

// Cross-site scripting strategies: reflected, DOM-based and stored.
// Every XSS probe carries a unique marker inside its alert() call. A probe
// counts only when the marker lands somewhere a browser would execute it,
// which is decided on the parsed document rather than on raw text, so an
// HTML-escaped echo never qualifies.

struct ExecutableReflection {
    bool found = false;
    std::string context;       // "script", "event_handler" or "url"
    std::string tag;
    std::string attribute;
};

/**
 * @brief Find the marker in an executable position of an HTML document
 *
 * Script elements count when their text calls alert('<marker>') verbatim,
 * on* attributes when their value contains the marker, and href/src/action
 * attributes when they hold a javascript: URL containing the marker.
 *
 * @param html Response body
 * @param marker Unique probe marker
 * @return First executable position found
 */
ExecutableReflection find_executable_reflection(const std::string& html, const std::string& marker);

/// Up to 60 characters either side of the first occurrence of needle.
std::string snippet_around(const std::string& body, const std::string& needle);

class ReflectedXssStrategy : public DetectionStrategy {
public:
    Strategy strategy() const override { return Strategy::REFLECTED; }
    DetectionResult analyze(const ProbeObservation& obs) const override;
};

class DomXssStrategy : public DetectionStrategy {
public:
    Strategy strategy() const override { return Strategy::DOM; }

    /**
     * @brief Sources and sinks in the page (0.3 each, two at most), the
     *        marker reaching the page or its URL (0.4) and an executable
     *        script reflection (0.5); vulnerable at 0.7
     */
    DetectionResult analyze(const ProbeObservation& obs) const override;

    static constexpr double kThreshold = 0.7;
};

class StoredXssStrategy : public DetectionStrategy {
public:
    Strategy strategy() const override { return Strategy::STORED; }

    /**
     * @brief obs.baseline is the page before submission, obs.probe the same
     *        page fetched again after it
     */
    DetectionResult analyze(const ProbeObservation& obs) const override;
};
