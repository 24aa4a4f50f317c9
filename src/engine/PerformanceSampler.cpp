#include "engine/PerformanceSampler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>
#include <vector>

namespace lanwatch::engine {

PerformanceSampler::PerformanceSampler(core::IProbeService& probes,
                                       std::chrono::milliseconds probeTimeout)
    : probes_(probes), probeTimeout_(probeTimeout) {}

core::PerformanceSample PerformanceSampler::sample(const core::Device& device, int count,
                                                   std::chrono::milliseconds interval) {
    return sample(device, count, interval, std::nullopt);
}

core::PerformanceSample PerformanceSampler::sample(
    const core::Device& device, int count, std::chrono::milliseconds interval,
    const std::optional<BandwidthRequest>& bandwidth) {
    if (count < 1) {
        throw core::EngineError(core::ErrorCode::InvalidConfiguration,
                                "sample count must be at least 1");
    }

    std::vector<core::ProbeResult> results;
    results.reserve(static_cast<size_t>(count));

    for (int i = 0; i < count; ++i) {
        auto started = std::chrono::steady_clock::now();
        results.push_back(probes_.pingOnce(device.address, probeTimeout_));

        if (i + 1 < count) {
            auto elapsed = std::chrono::steady_clock::now() - started;
            if (elapsed < interval) {
                std::this_thread::sleep_for(interval - elapsed);
            }
        }
    }

    auto sample = core::PerformanceSample::fromProbes(device.address, results);

    if (bandwidth) {
        auto result = probes_.sampleBandwidth(device.address, bandwidth->duration,
                                              bandwidth->direction);
        if (result.success && result.throughputMbps) {
            sample.bandwidthMbps = result.throughputMbps;
        } else if (result.error) {
            spdlog::debug("Bandwidth sample for {} failed: {}", device.address,
                          core::errorCodeToString(*result.error));
        }
    }

    spdlog::trace("Sampled {}: {}/{} answered", device.address, sample.successes,
                  sample.attempts);
    return sample;
}

std::chrono::milliseconds PerformanceSampler::worstCaseDuration(
    int count, std::chrono::milliseconds interval,
    const std::optional<BandwidthRequest>& bandwidth) const {
    auto perProbe = std::max(probeTimeout_, interval);
    auto total = perProbe * std::max(count, 1);
    if (bandwidth) {
        total += bandwidth->connectTimeout + bandwidth->duration;
    }
    return total;
}

} // namespace lanwatch::engine
