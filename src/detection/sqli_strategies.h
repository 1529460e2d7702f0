#pragma once
#include "detection_strategy.h"
#include "core/response_analyzer.h"
#include "core/timing_analyzer.h"

// SQL injection strategies: error, boolean, union and time.

class ErrorBasedStrategy : public DetectionStrategy {
public:
    /**
     * @param analyzer Database error signatures; must outlive the strategy
     */
    explicit ErrorBasedStrategy(const ResponseAnalyzer& analyzer) : analyzer_(analyzer) {}

    Strategy strategy() const override { return Strategy::ERROR_BASED; }

    /**
     * @brief Database error text that the baseline did not have scores 0.9
     *        or the pattern's own confidence if higher. Without one, a new 5xx
     *        (0.7), SQL vocabulary absent from the baseline (0.6) or a length
     *        change over 50 bytes (0.5) is a weaker signal.
     */
    DetectionResult analyze(const ProbeObservation& obs) const override;

private:
    const ResponseAnalyzer& analyzer_;
};

class BooleanBasedStrategy : public DetectionStrategy {
public:
    Strategy strategy() const override { return Strategy::BOOLEAN_BASED; }

    /**
     * @brief Compare probe and baseline lengths against what the payload's
     *        condition should do to the result set. Echoes of the payload
     *        are removed from the probe body before measuring.
     */
    DetectionResult analyze(const ProbeObservation& obs) const override;
};

class UnionBasedStrategy : public DetectionStrategy {
public:
    Strategy strategy() const override { return Strategy::UNION_BASED; }

    /**
     * @brief Database metadata that appears only in the probe scores 0.9; a
     *        bare status or length change scores 0.5-0.6.
     */
    DetectionResult analyze(const ProbeObservation& obs) const override;
};

class TimeBasedStrategy : public DetectionStrategy {
public:
    Strategy strategy() const override { return Strategy::TIME_BASED; }

    /**
     * @brief Reads obs.timing; vulnerable only when both measurements
     *        cleared the threshold
     */
    DetectionResult analyze(const ProbeObservation& obs) const override;
};
