#pragma once
#include "core/http_client.h"
#include "injection_point.h"
#include "payloads/payload_catalog.h"
#include <schema/finding.h>
#include <nlohmann/json.hpp>
#include <string>

struct TimingResult;

// Common shape of every detection strategy.
// A strategy looks at the baseline response and the probe response for one
// payload and says whether the payload changed the application's behaviour
// in the way that sub-type predicts. Strategies do no I/O.

struct DetectionResult {
    bool vulnerable = false;
    double confidence = 0.0;                            // always within [0, 1]
    nlohmann::json evidence = nlohmann::json::object();
};

// Everything a strategy may look at for one probe round
struct ProbeObservation {
    const HttpResponse& baseline;
    const HttpResponse& probe;
    const Payload& payload;
    std::string injected;             // exact value sent, marker included
    std::string marker;               // XSS only
    std::string probe_url;            // URL the probe was sent to
    const TimingResult* timing;       // time-based only

    ProbeObservation(const HttpResponse& baseline_resp,
                     const HttpResponse& probe_resp,
                     const Payload& p)
        : baseline(baseline_resp),
          probe(probe_resp),
          payload(p),
          injected(p.payload),
          timing(nullptr)
    {}
};

class DetectionStrategy {
public:
    virtual ~DetectionStrategy() = default;

    virtual Strategy strategy() const = 0;

    /**
     * @brief Judge one probe against its baseline
     * @param obs Baseline, probe and payload for one round
     * @return Verdict with confidence clamped to [0, 1] and structured evidence
     */
    virtual DetectionResult analyze(const ProbeObservation& obs) const = 0;
};

/// Clamp a confidence into [0, 1].
double clamp_confidence(double c);

/**
 * @brief Turn a positive verdict into a Finding
 * @param point Where the payload was injected
 * @param payload Payload that triggered the verdict
 * @param result Strategy verdict
 * @param request Probe request as sent
 * @param response Response the verdict is based on
 * @return Finding with empty id (assigned when recorded)
 */
Finding build_finding(const InjectionPoint& point,
                      const Payload& payload,
                      const DetectionResult& result,
                      const HttpRequest& request,
                      const HttpResponse& response);
