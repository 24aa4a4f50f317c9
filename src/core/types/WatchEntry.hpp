/**
 * @file WatchEntry.hpp
 * @brief Watchlist entry and health state machine.
 *
 * This file defines the per-device supervision record owned by the monitor
 * scheduler, the thresholds that drive its state machine and the pure
 * transition function.
 */

#pragma once

#include "core/types/Device.hpp"
#include "core/types/PerformanceSample.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace lanwatch::core {

/**
 * @brief Health of a watched device.
 */
enum class HealthState : int {
    Unknown = 0,  ///< Added to the watchlist, no conclusive sample yet
    Online = 1,   ///< Answering within thresholds
    Degraded = 2, ///< Answering, but loss or latency beyond thresholds
    Offline = 3   ///< Consecutive failed ticks reached the threshold
};

std::string healthStateToString(HealthState state);
HealthState healthStateFromString(const std::string& str);

/**
 * @brief Limits that drive health transitions.
 */
struct HealthThresholds {
    double maxPacketLoss{0.2};                  ///< Loss ratio above which a device is degraded
    std::chrono::milliseconds maxLatency{200};  ///< Mean latency above which a device is degraded
    int failuresForOffline{3};                  ///< Consecutive failed ticks before Offline

    [[nodiscard]] bool isValid() const {
        return maxPacketLoss >= 0.0 && maxPacketLoss <= 1.0 && maxLatency.count() > 0 &&
               failuresForOffline > 0;
    }

    /**
     * @brief Checks whether a sample is within both limits.
     * @return False when the sample has no latency.
     */
    [[nodiscard]] bool isHealthy(const PerformanceSample& sample) const;
};

/**
 * @brief Outcome of feeding one sample to the state machine.
 */
struct HealthTransition {
    HealthState previous{HealthState::Unknown};
    HealthState current{HealthState::Unknown};
    int consecutiveFailures{0};

    [[nodiscard]] bool changed() const { return previous != current; }
};

/**
 * @brief Applies one tick's sample to a device's health state.
 *
 * A tick fails when no probe of the sample was answered; failed ticks
 * increment the consecutive-failure counter and move the device to Offline
 * exactly when the counter reaches the threshold. Any answered probe resets
 * the counter. Unknown becomes Online on the first answered sample,
 * Online becomes Degraded on an unhealthy sample, and Degraded or Offline
 * return to Online on a healthy one.
 *
 * @param state Current state.
 * @param consecutiveFailures Current failure counter.
 * @param sample The tick's sample.
 * @param thresholds Limits to apply.
 * @return The resulting state and counter.
 */
HealthTransition evaluateHealth(HealthState state, int consecutiveFailures,
                                const PerformanceSample& sample,
                                const HealthThresholds& thresholds);

/**
 * @brief A device under continuous supervision.
 *
 * Value snapshot of the scheduler's state for one device.
 */
struct WatchEntry {
    Device device;                             ///< The watched device
    std::chrono::milliseconds interval{30000}; ///< Time between tick starts
    HealthState state{HealthState::Unknown};   ///< Current health state
    int consecutiveFailures{0};                ///< Failed ticks in a row
    std::chrono::system_clock::time_point lastTransition; ///< When state last changed (or entry was added)
    std::optional<PerformanceSample> lastSample; ///< Sample from the latest tick
    uint64_t tickCount{0};                     ///< Ticks completed
    uint64_t skippedTicks{0};                  ///< Slots skipped because a tick overran

    [[nodiscard]] std::string stateToString() const { return healthStateToString(state); }
};

void to_json(nlohmann::json& j, const WatchEntry& entry);

} // namespace lanwatch::core
