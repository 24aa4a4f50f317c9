#pragma once

#include "core/services/IAlertDispatcher.hpp"

#include <atomic>
#include <deque>
#include <map>
#include <mutex>

namespace lanwatch::engine {

/**
 * @brief In-process alert fan-out with a bounded activity log.
 *
 * Each published alert is assigned an id, recorded in the recent-alert log,
 * written to the "lanwatch" logger and handed to every subscriber. Handlers
 * run on the publishing thread; an exception thrown by one is logged and does
 * not reach the other handlers or the publisher.
 */
class AlertDispatcher : public core::IAlertDispatcher {
public:
    /**
     * @param recentCapacity Number of alerts kept for recentAlerts().
     */
    explicit AlertDispatcher(size_t recentCapacity = 500);

    SubscriptionId subscribe(AlertHandler handler) override;
    bool unsubscribe(SubscriptionId id) override;
    void unsubscribeAll() override;

    void publish(const core::AlertEvent& event) override;

    std::vector<core::AlertEvent> recentAlerts(int limit = 100) const override;
    std::vector<core::AlertEvent> filteredAlerts(const core::AlertFilter& filter,
                                                 int limit = 100) const override;

    [[nodiscard]] size_t subscriberCount() const;

private:
    std::map<SubscriptionId, AlertHandler> handlers_;
    std::deque<core::AlertEvent> recent_;
    size_t recentCapacity_;
    mutable std::mutex mutex_;
    SubscriptionId nextSubscription_{1};
    std::atomic<int64_t> nextAlertId_{1};
};

} // namespace lanwatch::engine
