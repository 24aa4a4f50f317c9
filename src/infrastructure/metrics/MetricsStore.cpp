#include "infrastructure/metrics/MetricsStore.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace lanwatch::infra {

MetricsStore::MetricsStore(size_t capacityPerDevice) : capacity_(capacityPerDevice) {
    if (capacity_ == 0) {
        throw std::invalid_argument("MetricsStore capacity must be positive");
    }
    spdlog::debug("MetricsStore created with capacity {} per device", capacity_);
}

std::shared_ptr<MetricsStore::Series> MetricsStore::findSeries(const std::string& address) const {
    std::shared_lock lock(seriesMutex_);
    auto it = series_.find(address);
    return it != series_.end() ? it->second : nullptr;
}

void MetricsStore::append(const std::string& address, const core::PerformanceSample& sample) {
    auto series = findSeries(address);
    if (!series) {
        std::unique_lock lock(seriesMutex_);
        auto [it, inserted] = series_.try_emplace(address, nullptr);
        if (inserted) {
            it->second = std::make_shared<Series>(capacity_);
        }
        series = it->second;
    }

    std::lock_guard lock(series->mutex);
    if (series->samples.push(sample)) {
        spdlog::trace("MetricsStore evicted oldest sample for {}", address);
    }
}

std::vector<core::PerformanceSample> MetricsStore::history(const std::string& address,
                                                           std::chrono::milliseconds window) const {
    auto series = findSeries(address);
    if (!series) {
        return {};
    }

    auto now = std::chrono::system_clock::now();
    auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
    std::lock_guard lock(series->mutex);
    if (window >= sinceEpoch) {
        return series->samples.snapshot();
    }

    auto cutoff = now - window;
    return series->samples.snapshotIf(
        [cutoff](const core::PerformanceSample& sample) { return sample.timestamp >= cutoff; });
}

std::vector<core::PerformanceSample> MetricsStore::history(const std::string& address) const {
    auto series = findSeries(address);
    if (!series) {
        return {};
    }

    std::lock_guard lock(series->mutex);
    return series->samples.snapshot();
}

core::PerformanceSummary MetricsStore::summarize(const std::string& address,
                                                 std::chrono::milliseconds window) const {
    return core::PerformanceSummary::fromSamples(address, history(address, window));
}

size_t MetricsStore::size(const std::string& address) const {
    auto series = findSeries(address);
    if (!series) {
        return 0;
    }

    std::lock_guard lock(series->mutex);
    return series->samples.size();
}

std::vector<std::string> MetricsStore::devices() const {
    std::shared_lock lock(seriesMutex_);
    std::vector<std::string> result;
    result.reserve(series_.size());
    for (const auto& [address, series] : series_) {
        result.push_back(address);
    }
    return result;
}

} // namespace lanwatch::infra
