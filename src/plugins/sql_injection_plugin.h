#pragma once
#include "scanner_plugin.h"
#include "core/response_analyzer.h"
#include "detection/sqli_strategies.h"
#include <memory>

// SQL injection scanner.
// Per parameter: one baseline request, then error, boolean, union and
// time-based payloads in that order. The first finding of a sub-type ends
// that sub-type for the parameter. Numeric path segments are probed too.

class SqlInjectionPlugin : public InjectionPlugin {
public:
    SqlInjectionPlugin();

    std::string name() const override { return "sql_injection"; }
    std::string description() const override {
        return "Error, boolean-blind, UNION and time-based SQL injection";
    }

    const PayloadCatalog& catalog() const { return catalog_; }

protected:
    void on_setup() override;
    std::vector<Finding> scan_point(const InjectionPoint& point) override;
    bool include_path_segments() const override { return true; }

private:
    PayloadCatalog catalog_;
    std::unique_ptr<ResponseAnalyzer> analyzer_;
    std::unique_ptr<ErrorBasedStrategy> error_;
    BooleanBasedStrategy boolean_;
    UnionBasedStrategy union_;
    TimeBasedStrategy time_;

    /**
     * @brief Run every payload of one response-comparing strategy until one hits
     * @return true if a finding was added
     */
    bool run_strategy(const DetectionStrategy& strategy,
                      const InjectionPoint& point,
                      const SendResult& baseline,
                      std::vector<Finding>& findings);

    /**
     * @brief The false half of a boolean pair must move the page away from
     *        the baseline, or an input-insensitive page would look vulnerable
     */
    bool confirm_boolean_pair(const InjectionPoint& point,
                              const SendResult& baseline,
                              nlohmann::json& evidence);

    bool run_time_based(const InjectionPoint& point,
                        const SendResult& baseline,
                        std::vector<Finding>& findings);
};
