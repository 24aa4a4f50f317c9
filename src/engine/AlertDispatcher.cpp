#include "engine/AlertDispatcher.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace lanwatch::engine {

AlertDispatcher::AlertDispatcher(size_t recentCapacity)
    : recentCapacity_(recentCapacity > 0 ? recentCapacity : 1) {}

AlertDispatcher::SubscriptionId AlertDispatcher::subscribe(AlertHandler handler) {
    std::lock_guard lock(mutex_);
    auto id = nextSubscription_++;
    handlers_.emplace(id, std::move(handler));
    spdlog::debug("Alert subscriber {} registered", id);
    return id;
}

bool AlertDispatcher::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    return handlers_.erase(id) > 0;
}

void AlertDispatcher::unsubscribeAll() {
    std::lock_guard lock(mutex_);
    handlers_.clear();
}

void AlertDispatcher::publish(const core::AlertEvent& event) {
    core::AlertEvent stamped = event;
    if (stamped.id == 0) {
        stamped.id = nextAlertId_++;
    }

    std::vector<std::pair<SubscriptionId, AlertHandler>> handlers;
    {
        std::lock_guard lock(mutex_);
        recent_.push_back(stamped);
        while (recent_.size() > recentCapacity_) {
            recent_.pop_front();
        }
        handlers.assign(handlers_.begin(), handlers_.end());
    }

    switch (stamped.severity) {
    case core::AlertSeverity::Critical:
        spdlog::error("[{}] {} ({}): {}", stamped.title, stamped.deviceName, stamped.address,
                      stamped.message);
        break;
    case core::AlertSeverity::Warning:
        spdlog::warn("[{}] {} ({}): {}", stamped.title, stamped.deviceName, stamped.address,
                     stamped.message);
        break;
    case core::AlertSeverity::Info:
        spdlog::info("[{}] {} ({}): {}", stamped.title, stamped.deviceName, stamped.address,
                     stamped.message);
        break;
    }

    for (const auto& [id, handler] : handlers) {
        if (!handler) {
            continue;
        }
        try {
            handler(stamped);
        } catch (const std::exception& e) {
            spdlog::error("Alert subscriber {} failed: {}", id, e.what());
        }
    }
}

std::vector<core::AlertEvent> AlertDispatcher::recentAlerts(int limit) const {
    return filteredAlerts(core::AlertFilter{}, limit);
}

std::vector<core::AlertEvent> AlertDispatcher::filteredAlerts(const core::AlertFilter& filter,
                                                              int limit) const {
    std::lock_guard lock(mutex_);

    std::vector<core::AlertEvent> result;
    for (auto it = recent_.rbegin(); it != recent_.rend(); ++it) {
        if (limit > 0 && static_cast<int>(result.size()) >= limit) {
            break;
        }
        if (filter.isEmpty() || filter.matches(*it)) {
            result.push_back(*it);
        }
    }
    return result;
}

size_t AlertDispatcher::subscriberCount() const {
    std::lock_guard lock(mutex_);
    return handlers_.size();
}

} // namespace lanwatch::engine
