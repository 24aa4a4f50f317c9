/**
 * @file MonitoringEngine.hpp
 * @brief Facade over discovery, monitoring, metrics and alerts.
 *
 * This is the surface presentation and report layers call into. It wires the
 * components together and owns the I/O context their timers and
 * asynchronous scans run on.
 */

#pragma once

#include "core/services/IAlertDispatcher.hpp"
#include "core/services/INetworkEnvironment.hpp"
#include "core/services/IProbeService.hpp"
#include "engine/AlertDispatcher.hpp"
#include "engine/DiscoveryScanner.hpp"
#include "engine/MonitorScheduler.hpp"
#include "engine/PerformanceSampler.hpp"
#include "infrastructure/metrics/MetricsStore.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::engine {

/**
 * @brief Tunables of every engine component.
 */
struct EngineOptions {
    DiscoveryScanner::Options discovery;
    size_t scanConcurrency{64};                      ///< Addresses probed at once per scan
    MonitorScheduler::Options monitoring;
    std::chrono::milliseconds probeTimeout{1000};    ///< Echo timeout while monitoring
    std::chrono::milliseconds defaultInterval{30000}; ///< Interval used by addWatch() without one
    size_t metricsCapacity{720};                     ///< Samples kept per device
    size_t recentAlertCapacity{500};                 ///< Alerts kept in the activity log
    size_t ioThreads{2};                             ///< Threads running timers and scans
};

/**
 * @brief Result of an asynchronous scan.
 */
struct ScanOutcome {
    std::string range;                       ///< Range that was swept
    std::vector<core::Device> devices;       ///< Devices reported by the scan
    std::optional<core::ErrorCode> error;    ///< Set when the scan failed as a whole
    std::string errorMessage;

    [[nodiscard]] bool succeeded() const { return !error.has_value(); }
};

class MonitoringEngine {
public:
    using ScanCallback = std::function<void(const ScanOutcome&)>;

    /**
     * @brief Builds and starts the engine.
     * @param probes Probe primitives, must outlive the engine.
     * @param environment Network environment, must outlive the engine.
     * @param options Component tunables.
     * @throws EngineError with ErrorCode::InvalidConfiguration for invalid options.
     */
    MonitoringEngine(core::IProbeService& probes, core::INetworkEnvironment& environment,
                     EngineOptions options = {});

    /**
     * @brief Destructor. Stops monitoring and joins all threads.
     */
    ~MonitoringEngine();

    MonitoringEngine(const MonitoringEngine&) = delete;
    MonitoringEngine& operator=(const MonitoringEngine&) = delete;

    /**
     * @brief Stops every watch entry and the I/O threads. Idempotent.
     *
     * Waits for a running scan to finish but does not deliver its outcome.
     * Afterwards triggerScan() and addWatch() return false.
     */
    void stop();

    // Inventory

    [[nodiscard]] std::vector<core::Device> getInventory() const;

    /**
     * @brief Starts a background scan of a range.
     * @param range Range specification (CIDR, dash range or single address).
     * @param callback Receives the outcome on an I/O thread.
     * @return False if a scan is already running or the engine is stopped.
     * @throws EngineError with ErrorCode::InvalidTarget if the range is malformed.
     */
    bool triggerScan(const std::string& range, ScanCallback callback);

    /**
     * @brief Starts a background scan of the subnet of the primary interface.
     * @throws EngineError with ErrorCode::DiscoveryFailed if there is no usable interface.
     */
    bool triggerScan(ScanCallback callback);

    [[nodiscard]] bool isScanning() const { return scanning_.load(); }
    [[nodiscard]] bool isStopped() const { return stopped_.load(); }

    // Watchlist

    [[nodiscard]] std::vector<core::WatchEntry> getWatchlist() const;

    /**
     * @brief Starts watching an address.
     *
     * Inventory devices keep their identity; unknown addresses are watched
     * under a default name.
     *
     * @return False if the address is already watched or the engine is stopped.
     * @throws EngineError with ErrorCode::InvalidTarget for a malformed address.
     * @throws EngineError with ErrorCode::InvalidConfiguration for a too-short interval.
     */
    bool addWatch(const std::string& address,
                  std::optional<std::chrono::milliseconds> interval = std::nullopt);

    bool removeWatch(const std::string& address);

    // History

    [[nodiscard]] std::vector<core::PerformanceSample> getHistory(
        const std::string& address, std::chrono::milliseconds window) const;

    [[nodiscard]] core::PerformanceSummary getSummary(const std::string& address,
                                                      std::chrono::milliseconds window) const;

    // Alerts

    core::IAlertDispatcher::SubscriptionId subscribeAlerts(core::IAlertDispatcher::AlertHandler handler);
    bool unsubscribeAlerts(core::IAlertDispatcher::SubscriptionId id);
    [[nodiscard]] std::vector<core::AlertEvent> recentAlerts(int limit = 100) const;

    DiscoveryScanner& discovery() { return *discovery_; }
    MonitorScheduler& scheduler() { return *scheduler_; }
    const EngineOptions& options() const { return options_; }

private:
    void startScan(const core::AddressRange& range, ScanCallback callback);

    EngineOptions options_;
    infra::AsioContext context_;
    infra::MetricsStore metrics_;
    AlertDispatcher dispatcher_;
    PerformanceSampler sampler_;
    std::unique_ptr<DiscoveryScanner> discovery_;
    std::unique_ptr<MonitorScheduler> scheduler_;
    std::atomic<bool> scanning_{false};
    std::atomic<bool> stopped_{false};
    std::mutex lifecycleMutex_; ///< Orders addWatch() against stop()
};

} // namespace lanwatch::engine
