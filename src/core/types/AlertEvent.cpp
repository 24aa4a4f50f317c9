#include "core/types/AlertEvent.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace lanwatch::core {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string describeSample(const PerformanceSample& sample) {
    char buffer[128];
    if (auto latency = sample.latencyMs()) {
        std::snprintf(buffer, sizeof(buffer), "latency %.1fms, loss %.0f%%", *latency,
                      sample.packetLoss * 100.0);
    } else {
        std::snprintf(buffer, sizeof(buffer), "no reply to %d probes", sample.attempts);
    }
    return buffer;
}

} // namespace

AlertEvent AlertEvent::forTransition(const Device& device, HealthState previous,
                                     HealthState current, const PerformanceSample& trigger) {
    AlertEvent event;
    event.address = device.address;
    event.deviceName = device.name.empty() ? device.address : device.name;
    event.previousState = previous;
    event.newState = current;
    event.severity = severityFor(current);
    event.timestamp = std::chrono::system_clock::now();
    event.trigger = trigger;
    event.cause = trigger.lastError;

    switch (current) {
    case HealthState::Online:
        event.title = previous == HealthState::Unknown ? "Device Online" : "Device Recovered";
        break;
    case HealthState::Degraded:
        event.title = "Device Degraded";
        break;
    case HealthState::Offline:
        event.title = "Device Offline";
        break;
    case HealthState::Unknown:
        event.title = "Device State Unknown";
        break;
    }

    event.message = event.deviceName + " (" + device.address + ") " +
                    healthStateToString(previous) + " -> " + healthStateToString(current) + ": " +
                    describeSample(trigger);
    if (event.cause && current == HealthState::Offline) {
        event.message += " (" + errorCodeToString(*event.cause) + ")";
    }
    return event;
}

std::string AlertEvent::severityToString() const {
    switch (severity) {
    case AlertSeverity::Info:
        return "Info";
    case AlertSeverity::Warning:
        return "Warning";
    case AlertSeverity::Critical:
        return "Critical";
    }
    return "Unknown";
}

AlertSeverity AlertEvent::severityFromString(const std::string& str) {
    if (str == "Warning")
        return AlertSeverity::Warning;
    if (str == "Critical")
        return AlertSeverity::Critical;
    return AlertSeverity::Info;
}

AlertSeverity AlertEvent::severityFor(HealthState state) {
    switch (state) {
    case HealthState::Offline:
        return AlertSeverity::Critical;
    case HealthState::Degraded:
        return AlertSeverity::Warning;
    case HealthState::Online:
    case HealthState::Unknown:
        return AlertSeverity::Info;
    }
    return AlertSeverity::Info;
}

bool AlertFilter::matches(const AlertEvent& event) const {
    if (severity && event.severity != *severity) {
        return false;
    }
    if (newState && event.newState != *newState) {
        return false;
    }
    if (address && event.address != *address) {
        return false;
    }
    if (!searchText.empty()) {
        auto needle = toLower(searchText);
        if (toLower(event.title).find(needle) == std::string::npos &&
            toLower(event.message).find(needle) == std::string::npos) {
            return false;
        }
    }
    return true;
}

void to_json(nlohmann::json& j, const AlertEvent& event) {
    j = nlohmann::json{{"id", event.id},
                       {"address", event.address},
                       {"device", event.deviceName},
                       {"previous_state", healthStateToString(event.previousState)},
                       {"new_state", healthStateToString(event.newState)},
                       {"severity", event.severityToString()},
                       {"title", event.title},
                       {"message", event.message},
                       {"timestamp_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                                            event.timestamp.time_since_epoch())
                                            .count()},
                       {"trigger", event.trigger}};

    if (event.cause) {
        j["cause"] = errorCodeToString(*event.cause);
    }
}

} // namespace lanwatch::core
