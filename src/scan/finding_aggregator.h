#pragma once
#include <schema/finding.h>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <vector>

// Single point through which plugin threads record findings.
// Keeps one finding per (endpoint, method, parameter, sub-type), clamps
// confidence into [0, 1], drops anything under the scan threshold and
// numbers findings in the order they were recorded.

class FindingAggregator {
public:
    using Listener = std::function<void(const Finding&)>;

    explicit FindingAggregator(double threshold = 0.0);

    /**
     * @brief Record a finding
     * @param f Finding from a plugin; its id is assigned here
     * @return true if recorded, false if rejected or a duplicate
     */
    bool add(Finding f);

    /// Copy of every recorded finding, in recording order.
    std::vector<Finding> snapshot() const;

    size_t size() const;

    /**
     * @brief Called (under the aggregator lock) for every recorded finding
     */
    void set_listener(Listener listener);

private:
    using Key = std::tuple<std::string, std::string, std::string, std::string>;

    double threshold_;
    std::vector<Finding> findings_;
    std::set<Key> seen_;
    Listener listener_;
    mutable std::mutex mutex_;
};
