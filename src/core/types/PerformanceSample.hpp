/**
 * @file PerformanceSample.hpp
 * @brief Aggregated performance measurements for one sampling run.
 *
 * This file defines the sample derived from a sequence of probe results and
 * the summary statistics computed over a window of samples.
 */

#pragma once

#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::core {

/**
 * @brief Aggregate of one sampling run against a device.
 *
 * Latency and jitter are absent when there is not enough data to compute
 * them, so that "no data" is never confused with "zero latency".
 */
struct PerformanceSample {
    std::string address;                  ///< Device the run targeted
    std::chrono::system_clock::time_point timestamp; ///< When the run completed
    int attempts{0};                      ///< Number of echo probes issued
    int successes{0};                     ///< Number of echo probes answered
    std::optional<std::chrono::microseconds> latency; ///< Mean RTT of answered probes
    std::optional<std::chrono::microseconds> jitter;  ///< Mean |RTT[i] - RTT[i-1]|
    std::optional<std::chrono::microseconds> minRtt;  ///< Fastest answered probe
    std::optional<std::chrono::microseconds> maxRtt;  ///< Slowest answered probe
    double packetLoss{0.0};               ///< failed / attempted, in [0, 1]
    std::optional<double> bandwidthMbps;  ///< Present only when bandwidth was requested and measured
    std::optional<ErrorCode> lastError;   ///< Cause of the most recent failed probe

    /**
     * @brief Aggregates an ordered sequence of echo probe results.
     *
     * Latency is the mean of successful RTTs; jitter the mean absolute
     * difference between consecutive successful RTTs; packet loss the share
     * of failed probes. Bandwidth results are ignored here.
     *
     * @param address Device address the probes targeted.
     * @param probes Probe results in the order they were issued.
     * @return The aggregated sample, timestamped now.
     */
    static PerformanceSample fromProbes(const std::string& address,
                                        const std::vector<ProbeResult>& probes);

    [[nodiscard]] bool anySuccess() const { return successes > 0; }
    [[nodiscard]] bool allFailed() const { return successes == 0; }

    [[nodiscard]] std::optional<double> latencyMs() const;
    [[nodiscard]] std::optional<double> jitterMs() const;

    bool operator==(const PerformanceSample& other) const = default;
};

/**
 * @brief Statistics over the samples of one device within a window.
 */
struct PerformanceSummary {
    std::string address;                  ///< Device the statistics are for
    int sampleCount{0};                   ///< Samples included
    int samplesWithData{0};               ///< Samples with at least one answered probe
    std::optional<double> avgLatencyMs;   ///< Mean of sample latencies
    std::optional<double> minLatencyMs;   ///< Lowest sample latency
    std::optional<double> maxLatencyMs;   ///< Highest sample latency
    std::optional<double> avgJitterMs;    ///< Mean of sample jitters
    std::optional<double> avgBandwidthMbps; ///< Mean of measured bandwidth
    double avgPacketLoss{0.0};            ///< Mean packet-loss ratio

    /**
     * @brief Share of samples in which the device answered at least once.
     * @return Percentage in [0, 100]; 0 when there are no samples.
     */
    [[nodiscard]] double availabilityPercent() const {
        return sampleCount > 0 ? (static_cast<double>(samplesWithData) / sampleCount) * 100.0 : 0.0;
    }

    static PerformanceSummary fromSamples(const std::string& address,
                                          const std::vector<PerformanceSample>& samples);
};

void to_json(nlohmann::json& j, const PerformanceSample& sample);
void to_json(nlohmann::json& j, const PerformanceSummary& summary);

} // namespace lanwatch::core
