// Thread-safe finding collection

#include "finding_aggregator.h"
#include "core/url_utils.h"
#include "detection/detection_strategy.h"
#include "logging/console.h"

FindingAggregator::FindingAggregator(double threshold) : threshold_(threshold) {}

void FindingAggregator::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

bool FindingAggregator::add(Finding f) {
    if (f.payload.empty() || f.parameter.empty() || f.url.empty()) {
        logging::warn("dropping incomplete finding '" + f.title + "'");
        return false;
    }

    f.confidence = clamp_confidence(f.confidence);
    if (f.confidence < threshold_) {
        return false;
    }

    std::string endpoint = url::normalize(url::strip_query(f.url));
    if (endpoint.empty()) endpoint = f.url;
    Key key(endpoint, f.method, f.parameter, f.sub_type);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!seen_.insert(key).second) {
        return false;
    }
    f.id = "finding_" + std::to_string(findings_.size() + 1);
    findings_.push_back(std::move(f));
    if (listener_) {
        listener_(findings_.back());
    }
    return true;
}

std::vector<Finding> FindingAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return findings_;
}

size_t FindingAggregator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return findings_.size();
}
