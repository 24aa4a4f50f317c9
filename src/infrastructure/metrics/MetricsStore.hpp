#pragma once

#include "core/types/PerformanceSample.hpp"
#include "infrastructure/metrics/RingBuffer.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanwatch::infra {

/**
 * @brief Bounded in-memory history of performance samples per device.
 *
 * Each device has its own ring buffer and lock, so appends for different
 * devices never contend beyond the brief lookup of the series. There is no
 * deletion other than eviction of the oldest sample at capacity.
 */
class MetricsStore {
public:
    /**
     * @brief Constructs a store.
     * @param capacityPerDevice Samples retained per device.
     * @throws std::invalid_argument if capacityPerDevice is zero.
     */
    explicit MetricsStore(size_t capacityPerDevice);

    /**
     * @brief Appends a sample to a device's history.
     * @param address Device address.
     * @param sample Sample to store.
     */
    void append(const std::string& address, const core::PerformanceSample& sample);

    /**
     * @brief Retrieves the samples taken within a trailing window.
     * @param address Device address.
     * @param window Samples with timestamp >= now - window are returned.
     * @return Samples, oldest first. Empty for unknown devices.
     */
    std::vector<core::PerformanceSample> history(const std::string& address,
                                                 std::chrono::milliseconds window) const;

    /**
     * @brief Retrieves every retained sample of a device, oldest first.
     */
    std::vector<core::PerformanceSample> history(const std::string& address) const;

    /**
     * @brief Calculates statistics over a device's samples within a window.
     */
    core::PerformanceSummary summarize(const std::string& address,
                                       std::chrono::milliseconds window) const;

    size_t size(const std::string& address) const;
    size_t capacity() const { return capacity_; }

    /**
     * @brief Lists the devices that have history.
     */
    std::vector<std::string> devices() const;

private:
    struct Series {
        explicit Series(size_t capacity) : samples(capacity) {}

        mutable std::mutex mutex;
        RingBuffer<core::PerformanceSample> samples;
    };

    std::shared_ptr<Series> findSeries(const std::string& address) const;

    size_t capacity_;
    std::unordered_map<std::string, std::shared_ptr<Series>> series_;
    mutable std::shared_mutex seriesMutex_;
};

} // namespace lanwatch::infra
