#include "core/types/PerformanceSample.hpp"

#include <algorithm>
#include <cstdlib>

namespace lanwatch::core {

namespace {

std::optional<double> toMs(const std::optional<std::chrono::microseconds>& value) {
    if (!value) {
        return std::nullopt;
    }
    return static_cast<double>(value->count()) / 1000.0;
}

template <typename T>
nlohmann::json optionalJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

PerformanceSample PerformanceSample::fromProbes(const std::string& address,
                                                const std::vector<ProbeResult>& probes) {
    PerformanceSample sample;
    sample.address = address;
    sample.timestamp = std::chrono::system_clock::now();

    std::vector<int64_t> rtts;
    for (const auto& probe : probes) {
        if (probe.kind == ProbeKind::Bandwidth) {
            continue;
        }
        ++sample.attempts;
        if (probe.success && probe.rtt) {
            rtts.push_back(probe.rtt->count());
        } else if (probe.error) {
            sample.lastError = probe.error;
        }
    }

    sample.successes = static_cast<int>(rtts.size());
    if (sample.attempts > 0) {
        sample.packetLoss = static_cast<double>(sample.attempts - sample.successes) /
                            static_cast<double>(sample.attempts);
    }

    if (rtts.empty()) {
        return sample;
    }

    int64_t total = 0;
    for (auto rtt : rtts) {
        total += rtt;
    }
    sample.latency = std::chrono::microseconds(total / static_cast<int64_t>(rtts.size()));

    auto [minIt, maxIt] = std::minmax_element(rtts.begin(), rtts.end());
    sample.minRtt = std::chrono::microseconds(*minIt);
    sample.maxRtt = std::chrono::microseconds(*maxIt);

    if (rtts.size() >= 2) {
        int64_t deltas = 0;
        for (size_t i = 1; i < rtts.size(); ++i) {
            deltas += std::llabs(rtts[i] - rtts[i - 1]);
        }
        sample.jitter = std::chrono::microseconds(deltas / static_cast<int64_t>(rtts.size() - 1));
    }

    return sample;
}

std::optional<double> PerformanceSample::latencyMs() const {
    return toMs(latency);
}

std::optional<double> PerformanceSample::jitterMs() const {
    return toMs(jitter);
}

PerformanceSummary PerformanceSummary::fromSamples(const std::string& address,
                                                   const std::vector<PerformanceSample>& samples) {
    PerformanceSummary summary;
    summary.address = address;
    summary.sampleCount = static_cast<int>(samples.size());

    double latencySum = 0.0;
    int latencyCount = 0;
    double jitterSum = 0.0;
    int jitterCount = 0;
    double bandwidthSum = 0.0;
    int bandwidthCount = 0;
    double lossSum = 0.0;

    for (const auto& sample : samples) {
        lossSum += sample.packetLoss;
        if (sample.anySuccess()) {
            ++summary.samplesWithData;
        }
        if (auto latency = sample.latencyMs()) {
            latencySum += *latency;
            ++latencyCount;
            summary.minLatencyMs = summary.minLatencyMs ? std::min(*summary.minLatencyMs, *latency)
                                                        : *latency;
            summary.maxLatencyMs = summary.maxLatencyMs ? std::max(*summary.maxLatencyMs, *latency)
                                                        : *latency;
        }
        if (auto jitter = sample.jitterMs()) {
            jitterSum += *jitter;
            ++jitterCount;
        }
        if (sample.bandwidthMbps) {
            bandwidthSum += *sample.bandwidthMbps;
            ++bandwidthCount;
        }
    }

    if (summary.sampleCount > 0) {
        summary.avgPacketLoss = lossSum / summary.sampleCount;
    }
    if (latencyCount > 0) {
        summary.avgLatencyMs = latencySum / latencyCount;
    }
    if (jitterCount > 0) {
        summary.avgJitterMs = jitterSum / jitterCount;
    }
    if (bandwidthCount > 0) {
        summary.avgBandwidthMbps = bandwidthSum / bandwidthCount;
    }

    return summary;
}

void to_json(nlohmann::json& j, const PerformanceSample& sample) {
    j = nlohmann::json{
        {"address", sample.address},
        {"timestamp_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                             sample.timestamp.time_since_epoch())
                             .count()},
        {"attempts", sample.attempts},
        {"successes", sample.successes},
        {"latency_ms", optionalJson(sample.latencyMs())},
        {"jitter_ms", optionalJson(sample.jitterMs())},
        {"packet_loss", sample.packetLoss},
        {"bandwidth_mbps", optionalJson(sample.bandwidthMbps)}};

    if (sample.lastError) {
        j["last_error"] = errorCodeToString(*sample.lastError);
    }
}

void to_json(nlohmann::json& j, const PerformanceSummary& summary) {
    j = nlohmann::json{{"address", summary.address},
                       {"sample_count", summary.sampleCount},
                       {"availability_percent", summary.availabilityPercent()},
                       {"avg_latency_ms", optionalJson(summary.avgLatencyMs)},
                       {"min_latency_ms", optionalJson(summary.minLatencyMs)},
                       {"max_latency_ms", optionalJson(summary.maxLatencyMs)},
                       {"avg_jitter_ms", optionalJson(summary.avgJitterMs)},
                       {"avg_bandwidth_mbps", optionalJson(summary.avgBandwidthMbps)},
                       {"avg_packet_loss", summary.avgPacketLoss}};
}

} // namespace lanwatch::core
