#pragma once
#include <map>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @file finding.h
 * @brief Data structure representing a confirmed injection finding
 *
 * A Finding is created only by a detection strategy once its confidence
 * clears the scan threshold. It carries enough of the request and response
 * to reproduce the issue by hand.
 */

/**
 * Represents one vulnerability confirmed for a (parameter, payload, strategy)
 */
struct Finding {
    std::string id;
    std::string title;
    std::string description;
    std::string category;            // "sql_injection" or "xss"
    std::string sub_type;            // e.g. "boolean_blind_sqli", "xss_stored"
    std::string severity;            // critical | high | medium | low | info
    double confidence = 0.0;         // always within [0, 1]
    std::string url;                 // endpoint
    std::string parameter;
    std::string method;
    std::string payload;
    std::string cwe_id;
    nlohmann::json evidence = nlohmann::json::object();
    std::map<std::string, std::string> headers;   // request headers sent with the probe
    std::string body;                             // request body sent with the probe
    nlohmann::json response = nlohmann::json::object();   // status, length, content_type
    std::string remediation_id;
    std::string remediation;
};

/**
 * @brief Serialize a finding for reports and the audit chain
 */
inline nlohmann::json finding_to_json(const Finding& f) {
    nlohmann::json j;
    j["id"] = f.id;
    j["title"] = f.title;
    j["description"] = f.description;
    j["category"] = f.category;
    j["sub_type"] = f.sub_type;
    j["severity"] = f.severity;
    j["confidence"] = f.confidence;
    j["url"] = f.url;
    j["parameter"] = f.parameter;
    j["method"] = f.method;
    j["payload"] = f.payload;
    j["cwe_id"] = f.cwe_id;
    j["evidence"] = f.evidence;
    j["request"] = {{"headers", f.headers}, {"body", f.body}};
    j["response"] = f.response;
    j["remediation_id"] = f.remediation_id;
    j["remediation"] = f.remediation;
    return j;
}
