#pragma once

#include "core/types/PerformanceSample.hpp"
#include "core/types/WatchEntry.hpp"

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace lanwatch::core {

enum class AlertSeverity : int { Info = 0, Warning = 1, Critical = 2 };

struct AlertEvent {
    int64_t id{0};
    std::string address;
    std::string deviceName;
    HealthState previousState{HealthState::Unknown};
    HealthState newState{HealthState::Unknown};
    AlertSeverity severity{AlertSeverity::Info};
    std::string title;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    PerformanceSample trigger;
    std::optional<ErrorCode> cause;

    /**
     * @brief Builds the event for a state change, deriving severity and text.
     */
    static AlertEvent forTransition(const Device& device, HealthState previous, HealthState current,
                                    const PerformanceSample& trigger);

    [[nodiscard]] std::string severityToString() const;
    static AlertSeverity severityFromString(const std::string& str);
    static AlertSeverity severityFor(HealthState state);

    bool operator==(const AlertEvent& other) const = default;
};

struct AlertFilter {
    std::optional<AlertSeverity> severity;
    std::optional<HealthState> newState;
    std::optional<std::string> address;
    std::string searchText;

    [[nodiscard]] bool isEmpty() const {
        return !severity.has_value() && !newState.has_value() && !address.has_value() &&
               searchText.empty();
    }

    [[nodiscard]] bool matches(const AlertEvent& event) const;
};

void to_json(nlohmann::json& j, const AlertEvent& event);

} // namespace lanwatch::core
