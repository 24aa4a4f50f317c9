/**
 * @file PerformanceSampler.hpp
 * @brief Turns a burst of echo probes into one PerformanceSample.
 */

#pragma once

#include "core/services/IProbeService.hpp"
#include "core/types/Device.hpp"
#include "core/types/PerformanceSample.hpp"

#include <chrono>
#include <optional>

namespace lanwatch::engine {

/**
 * @brief Optional bandwidth measurement appended to a sampling run.
 */
struct BandwidthRequest {
    core::BandwidthDirection direction{core::BandwidthDirection::Download};
    std::chrono::milliseconds duration{2000};
    std::chrono::milliseconds connectTimeout{2000}; ///< Handshake limit before the transfer
};

/**
 * @brief Sequential sampler over an IProbeService.
 *
 * Probes are issued one after another with a fixed spacing, never in
 * parallel, so that consecutive RTTs are meaningful for jitter.
 */
class PerformanceSampler {
public:
    /**
     * @param probes Probe primitives to use.
     * @param probeTimeout Timeout of each echo probe.
     */
    PerformanceSampler(core::IProbeService& probes,
                       std::chrono::milliseconds probeTimeout = std::chrono::milliseconds(1000));

    /**
     * @brief Runs count echo probes against a device and aggregates them.
     * @param device Target device.
     * @param count Number of echo probes (at least 1).
     * @param interval Spacing between the start of consecutive probes.
     * @return The aggregated sample. Never throws for probe failures.
     * @throws EngineError with ErrorCode::InvalidConfiguration if count < 1.
     */
    core::PerformanceSample sample(const core::Device& device, int count,
                                   std::chrono::milliseconds interval);

    /**
     * @brief Like sample(), followed by one bandwidth measurement.
     *
     * A failed bandwidth measurement leaves bandwidthMbps absent and does
     * not affect packet loss.
     */
    core::PerformanceSample sample(const core::Device& device, int count,
                                   std::chrono::milliseconds interval,
                                   const std::optional<BandwidthRequest>& bandwidth);

    /**
     * @brief Worst-case wall time of one sample() call.
     *
     * A bandwidth step counts with its connect timeout plus its transfer time.
     */
    [[nodiscard]] std::chrono::milliseconds worstCaseDuration(
        int count, std::chrono::milliseconds interval,
        const std::optional<BandwidthRequest>& bandwidth = std::nullopt) const;

    [[nodiscard]] std::chrono::milliseconds probeTimeout() const { return probeTimeout_; }

private:
    core::IProbeService& probes_;
    std::chrono::milliseconds probeTimeout_;
};

} // namespace lanwatch::engine
