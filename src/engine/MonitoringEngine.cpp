#include "engine/MonitoringEngine.hpp"

#include "core/types/AddressRange.hpp"

#include <spdlog/spdlog.h>

namespace lanwatch::engine {

MonitoringEngine::MonitoringEngine(core::IProbeService& probes,
                                   core::INetworkEnvironment& environment, EngineOptions options)
    : options_(std::move(options)),
      context_(options_.ioThreads > 0 ? options_.ioThreads : 1, "engine"),
      metrics_(options_.metricsCapacity), dispatcher_(options_.recentAlertCapacity),
      sampler_(probes, options_.probeTimeout) {
    discovery_ = std::make_unique<DiscoveryScanner>(probes, environment, options_.discovery);
    scheduler_ = std::make_unique<MonitorScheduler>(context_, sampler_, metrics_, dispatcher_,
                                                    options_.monitoring);

    scheduler_->setTransitionCallback(
        [this](const core::WatchEntry& entry, const core::HealthTransition& transition) {
            auto reachability = transition.current == core::HealthState::Offline
                                    ? core::Reachability::Offline
                                    : core::Reachability::Online;
            discovery_->updateReachability(entry.device.address, reachability);
        });

    context_.start();
    spdlog::info("Monitoring engine started");
}

MonitoringEngine::~MonitoringEngine() {
    stop();
}

void MonitoringEngine::stop() {
    {
        std::lock_guard lock(lifecycleMutex_);
        if (stopped_.exchange(true)) {
            return;
        }
    }
    scheduler_->stopAll();
    context_.stop();
    spdlog::info("Monitoring engine stopped");
}

std::vector<core::Device> MonitoringEngine::getInventory() const {
    return discovery_->inventory();
}

bool MonitoringEngine::triggerScan(const std::string& range, ScanCallback callback) {
    auto parsed = core::AddressRange::parse(range);
    if (stopped_) {
        return false;
    }
    if (scanning_.exchange(true)) {
        spdlog::warn("Scan already in progress, ignoring request for {}", range);
        return false;
    }
    startScan(parsed, std::move(callback));
    return true;
}

bool MonitoringEngine::triggerScan(ScanCallback callback) {
    auto range = discovery_->defaultRange();
    if (stopped_) {
        return false;
    }
    if (scanning_.exchange(true)) {
        spdlog::warn("Scan already in progress, ignoring request for {}", range.toString());
        return false;
    }
    startScan(range, std::move(callback));
    return true;
}

void MonitoringEngine::startScan(const core::AddressRange& range, ScanCallback callback) {
    context_.post([this, range, callback = std::move(callback)]() {
        ScanOutcome outcome;
        outcome.range = range.toString();
        try {
            outcome.devices = discovery_->scan(range, options_.scanConcurrency);
        } catch (const core::EngineError& e) {
            spdlog::error("Scan of {} failed: {}", outcome.range, e.what());
            outcome.error = e.code();
            outcome.errorMessage = e.what();
        } catch (const std::exception& e) {
            spdlog::error("Scan of {} failed: {}", outcome.range, e.what());
            outcome.error = core::ErrorCode::DiscoveryFailed;
            outcome.errorMessage = e.what();
        }

        scanning_ = false;

        if (stopped_) {
            spdlog::debug("Engine stopped, dropping outcome of scan {}", outcome.range);
            return;
        }
        if (callback) {
            try {
                callback(outcome);
            } catch (const std::exception& e) {
                spdlog::error("Scan callback failed: {}", e.what());
            }
        }
    });
}

std::vector<core::WatchEntry> MonitoringEngine::getWatchlist() const {
    return scheduler_->watchlist();
}

bool MonitoringEngine::addWatch(const std::string& address,
                                std::optional<std::chrono::milliseconds> interval) {
    if (!core::parseIpv4(address)) {
        throw core::EngineError(core::ErrorCode::InvalidTarget,
                                "invalid address '" + address + "'");
    }

    auto device = discovery_->find(address);
    if (!device) {
        device = core::Device{};
        device->address = address;
        device->name = core::Device::defaultName(address);
        device->firstSeen = std::chrono::system_clock::now();
    }

    std::lock_guard lock(lifecycleMutex_);
    if (stopped_) {
        spdlog::warn("Engine stopped, not watching {}", address);
        return false;
    }
    return scheduler_->addToWatchlist(*device, interval.value_or(options_.defaultInterval));
}

bool MonitoringEngine::removeWatch(const std::string& address) {
    return scheduler_->removeFromWatchlist(address);
}

std::vector<core::PerformanceSample> MonitoringEngine::getHistory(
    const std::string& address, std::chrono::milliseconds window) const {
    return metrics_.history(address, window);
}

core::PerformanceSummary MonitoringEngine::getSummary(const std::string& address,
                                                      std::chrono::milliseconds window) const {
    return metrics_.summarize(address, window);
}

core::IAlertDispatcher::SubscriptionId MonitoringEngine::subscribeAlerts(
    core::IAlertDispatcher::AlertHandler handler) {
    return dispatcher_.subscribe(std::move(handler));
}

bool MonitoringEngine::unsubscribeAlerts(core::IAlertDispatcher::SubscriptionId id) {
    return dispatcher_.unsubscribe(id);
}

std::vector<core::AlertEvent> MonitoringEngine::recentAlerts(int limit) const {
    return dispatcher_.recentAlerts(limit);
}

} // namespace lanwatch::engine
