#pragma once
#include "scanner_plugin.h"
#include "detection/xss_strategies.h"

// Cross-site scripting scanner.
// Reflected and DOM payloads go into every query and form parameter with a
// fresh marker per request. Stored payloads are submitted through forms and
// the page the form lives on is fetched again to see whether they persisted.

class XssPlugin : public InjectionPlugin {
public:
    XssPlugin();

    std::string name() const override { return "xss"; }
    std::string description() const override {
        return "Reflected, DOM-based and stored cross-site scripting";
    }

    const PayloadCatalog& catalog() const { return catalog_; }

protected:
    std::vector<Finding> scan_point(const InjectionPoint& point) override;

private:
    PayloadCatalog catalog_;
    ReflectedXssStrategy reflected_;
    DomXssStrategy dom_;
    StoredXssStrategy stored_;

    bool run_reflected(const InjectionPoint& point, const HttpResponse& baseline,
                       const DetectionStrategy& strategy, std::vector<Finding>& findings);

    /**
     * @brief Submit each stored payload, then re-fetch the form's page
     * @return true if a finding was added
     */
    bool run_stored(const InjectionPoint& point, std::vector<Finding>& findings);
};
