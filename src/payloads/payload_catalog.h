#pragma once
#include <string>
#include <vector>

// Static attack-string tables.
// One catalog is built per scanner plugin instance at setup time. Each entry
// carries the detection strategy that knows how to judge its response.

enum class Strategy {
    ERROR_BASED,
    BOOLEAN_BASED,
    UNION_BASED,
    TIME_BASED,
    REFLECTED,
    STORED,
    DOM
};

enum class Risk {
    CRITICAL,
    HIGH,
    MEDIUM,
    LOW,
    INFO
};

// What a boolean payload is expected to do to the page
enum class BooleanExpectation {
    NONE,
    OR_TRUE,      // more rows, content grows
    AND_TRUE,     // same rows, content resembles baseline
    AND_FALSE     // no rows, content shrinks
};

struct Payload {
    std::string name;
    std::string payload;
    Strategy strategy;
    Risk risk;
    std::string description;
    std::string cwe_id;
    std::string context;          // XSS: html | attribute | javascript | url
    std::string dialect;          // SQLi: mysql | postgresql | mssql | oracle | sqlite | generic
    BooleanExpectation expectation;
    int columns;                  // UNION column count, 0 if not a padding probe
    double delay_seconds;         // TIME delay requested by the payload
    bool aggressive;              // CPU-heavy fallback, tried once per parameter

    Payload()
        : strategy(Strategy::ERROR_BASED),
          risk(Risk::HIGH),
          expectation(BooleanExpectation::NONE),
          columns(0),
          delay_seconds(0.0),
          aggressive(false)
    {}
};

class PayloadCatalog {
public:
    struct Options {
        int union_max_columns;
        double base_delay_seconds;

        Options()
            : union_max_columns(5),
              base_delay_seconds(2.0)
        {}
    };

    /**
     * @brief Build the SQL injection catalog
     * @param opts UNION column ceiling and time-based delay
     * @return Catalog with error, boolean, union and time payloads
     */
    static PayloadCatalog sql_injection(const Options& opts = Options());

    /**
     * @brief Build the XSS catalog (reflected, DOM and stored, all contexts)
     */
    static PayloadCatalog xss();

    const std::vector<Payload>& all() const { return payloads_; }

    /**
     * @brief Payloads for one strategy, in catalog order
     * @param strategy Strategy tag to filter on
     * @param include_aggressive Whether CPU-heavy fallbacks are included
     */
    std::vector<Payload> by_strategy(Strategy strategy, bool include_aggressive = false) const;

    /// CPU-heavy time-based fallbacks only.
    std::vector<Payload> aggressive() const;

    size_t size() const { return payloads_.size(); }

private:
    std::vector<Payload> payloads_;
};

const char* strategy_name(Strategy s);
const char* risk_name(Risk r);

/**
 * @brief Finding sub-type for a strategy, e.g. "boolean_blind_sqli"
 */
const char* sub_type_for(Strategy s);

/**
 * @brief Substitute a unique marker into an XSS payload's alert() call
 * @param payload Payload text containing alert(1)
 * @param marker Unique token for this request
 * @return Payload calling alert('<marker>'); marker appended if no alert(1)
 */
std::string mark_payload(const std::string& payload, const std::string& marker);

/**
 * @brief Alternate URL encoding that slips past naive input filters
 *
 * Percent-encodes whitespace and markup characters but leaves ' ( ) * =
 * literal, so quote-breaking payloads still reach the query parser intact.
 *
 * @param payload Raw payload
 * @param double_encode Encode the '%' of each escape once more
 * @return Value ready to be placed in a query string as-is
 */
std::string waf_encode(const std::string& payload, bool double_encode = false);
