#include "roofwatch/status_store.hpp"

#include <utility>

namespace roofwatch {

StatusStore::StatusStore(size_t trend_capacity)
    : trend_capacity_(trend_capacity == 0 ? 1 : trend_capacity),
      current_(std::make_shared<const StatusRecord>()) {}

void StatusStore::update(const ClassificationResult& result) {
    std::lock_guard<std::mutex> writer(writer_mu_);

    auto prev = snapshot();
    auto next = std::make_shared<StatusRecord>();
    next->label = result.label;
    next->confidence = result.confidence;
    next->updated_at = result.evaluated_at;
    next->frame_path = result.frame_path;
    next->sun_override = result.sun_override;
    next->sun_altitude = result.sun_altitude;
    next->secondary_label = result.secondary_label;
    next->consecutive = (prev->label == result.label) ? prev->consecutive + 1 : 1;
    next->sequence = prev->sequence + 1;

    next->recent.reserve(trend_capacity_);
    const size_t keep = prev->recent.size() >= trend_capacity_ ? trend_capacity_ - 1 : prev->recent.size();
    next->recent.assign(prev->recent.end() - static_cast<std::ptrdiff_t>(keep), prev->recent.end());
    next->recent.push_back(TrendSample{result.label, result.confidence, result.evaluated_at});

    std::shared_ptr<const StatusRecord> published = std::move(next);
    std::unique_lock<std::shared_mutex> lock(mu_);
    current_.swap(published);
}

std::shared_ptr<const StatusRecord> StatusStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return current_;
}

}  // namespace roofwatch
