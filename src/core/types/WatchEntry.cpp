#include "core/types/WatchEntry.hpp"

namespace lanwatch::core {

std::string healthStateToString(HealthState state) {
    switch (state) {
    case HealthState::Unknown:
        return "Unknown";
    case HealthState::Online:
        return "Online";
    case HealthState::Degraded:
        return "Degraded";
    case HealthState::Offline:
        return "Offline";
    }
    return "Unknown";
}

HealthState healthStateFromString(const std::string& str) {
    if (str == "Online")
        return HealthState::Online;
    if (str == "Degraded")
        return HealthState::Degraded;
    if (str == "Offline")
        return HealthState::Offline;
    return HealthState::Unknown;
}

bool HealthThresholds::isHealthy(const PerformanceSample& sample) const {
    if (!sample.latency) {
        return false;
    }
    return sample.packetLoss <= maxPacketLoss && *sample.latency <= maxLatency;
}

HealthTransition evaluateHealth(HealthState state, int consecutiveFailures,
                                const PerformanceSample& sample,
                                const HealthThresholds& thresholds) {
    HealthTransition transition;
    transition.previous = state;
    transition.current = state;

    if (sample.allFailed()) {
        transition.consecutiveFailures = consecutiveFailures + 1;
        if (state != HealthState::Offline &&
            transition.consecutiveFailures >= thresholds.failuresForOffline) {
            transition.current = HealthState::Offline;
        }
        return transition;
    }

    transition.consecutiveFailures = 0;
    bool healthy = thresholds.isHealthy(sample);

    switch (state) {
    case HealthState::Unknown:
        transition.current = HealthState::Online;
        break;
    case HealthState::Online:
        if (!healthy) {
            transition.current = HealthState::Degraded;
        }
        break;
    case HealthState::Degraded:
    case HealthState::Offline:
        if (healthy) {
            transition.current = HealthState::Online;
        }
        break;
    }

    return transition;
}

void to_json(nlohmann::json& j, const WatchEntry& entry) {
    j = nlohmann::json{
        {"device", entry.device},
        {"interval_ms", entry.interval.count()},
        {"state", entry.stateToString()},
        {"consecutive_failures", entry.consecutiveFailures},
        {"last_transition_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                                   entry.lastTransition.time_since_epoch())
                                   .count()},
        {"tick_count", entry.tickCount},
        {"skipped_ticks", entry.skippedTicks}};

    if (entry.lastSample) {
        j["last_sample"] = *entry.lastSample;
    }
}

} // namespace lanwatch::core
