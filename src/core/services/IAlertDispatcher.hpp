/**
 * @file IAlertDispatcher.hpp
 * @brief Interface for alert event distribution.
 *
 * This file defines the abstract interface through which the monitor
 * scheduler hands health-state transitions to external consumers.
 */

#pragma once

#include "core/types/AlertEvent.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace lanwatch::core {

/**
 * @brief Interface for alert distribution.
 *
 * Delivery is best-effort: a subscriber that throws does not prevent
 * delivery to the others and does not propagate to the publisher.
 */
class IAlertDispatcher {
public:
    /**
     * @brief Callback function type for alert notifications.
     * @param event The alert that was published.
     */
    using AlertHandler = std::function<void(const AlertEvent&)>;

    /// Identifies one subscription for unsubscribe().
    using SubscriptionId = uint64_t;

    virtual ~IAlertDispatcher() = default;

    /**
     * @brief Registers a consumer.
     * @param handler Function to call for every published alert.
     * @return Identifier of the new subscription.
     */
    virtual SubscriptionId subscribe(AlertHandler handler) = 0;

    /**
     * @brief Removes one consumer.
     * @param id Identifier returned by subscribe().
     * @return True if the subscription existed.
     */
    virtual bool unsubscribe(SubscriptionId id) = 0;

    /**
     * @brief Removes all consumers.
     */
    virtual void unsubscribeAll() = 0;

    /**
     * @brief Delivers an alert to every current subscriber.
     * @param event The alert to deliver.
     */
    virtual void publish(const AlertEvent& event) = 0;

    /**
     * @brief Gets the most recent alerts, newest first.
     * @param limit Maximum number of alerts to return (default: 100).
     */
    virtual std::vector<AlertEvent> recentAlerts(int limit = 100) const = 0;

    /**
     * @brief Gets recent alerts matching the filter, newest first.
     * @param filter Filter criteria to apply.
     * @param limit Maximum number of alerts to return (default: 100).
     */
    virtual std::vector<AlertEvent> filteredAlerts(const AlertFilter& filter,
                                                   int limit = 100) const = 0;
};

} // namespace lanwatch::core
