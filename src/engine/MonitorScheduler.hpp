/**
 * @file MonitorScheduler.hpp
 * @brief Periodic supervision of watched devices.
 */

#pragma once

#include "core/services/IAlertDispatcher.hpp"
#include "core/types/WatchEntry.hpp"
#include "engine/PerformanceSampler.hpp"
#include "infrastructure/metrics/MetricsStore.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::engine {

/**
 * @brief Runs one sampling tick per watched device on the device's interval.
 *
 * Each entry has its own steady_timer on the shared AsioContext. When a timer
 * fires, the tick body is posted to a scheduler-owned thread pool whose size
 * is the global cap on concurrently running ticks. A tick samples the device,
 * feeds the sample to the health state machine, appends it to the metrics
 * store and publishes an AlertEvent when the state changes.
 *
 * Ticks of one entry never overlap. A tick that runs past its slot makes the
 * next tick start one full interval after it finished, and the missed slot is
 * counted in WatchEntry::skippedTicks.
 *
 * Once removeFromWatchlist() returns, no sample for the device is appended
 * and no alert for it is published; a tick already in flight is discarded.
 * Alerts are published without holding any scheduler lock, so subscribers and
 * the transition callback may call back into the scheduler.
 */
class MonitorScheduler {
public:
    struct Options {
        int samplesPerTick{5};                          ///< Echo probes per tick
        std::chrono::milliseconds sampleSpacing{200};   ///< Delay between echo probes
        core::HealthThresholds thresholds;              ///< State machine limits
        size_t maxConcurrentTicks{8};                   ///< Global cap on running ticks
        std::optional<BandwidthRequest> bandwidth;      ///< Measure bandwidth on every tick
    };

    /**
     * @brief Called after every state change, once the alert has been published.
     */
    using TransitionCallback =
        std::function<void(const core::WatchEntry& entry, const core::HealthTransition& transition)>;

    /**
     * @throws EngineError with ErrorCode::InvalidConfiguration for invalid options.
     */
    MonitorScheduler(infra::AsioContext& context, PerformanceSampler& sampler,
                     infra::MetricsStore& metrics, core::IAlertDispatcher& dispatcher,
                     Options options);

    /**
     * @brief Destructor. Cancels all timers and waits for running ticks.
     */
    ~MonitorScheduler();

    MonitorScheduler(const MonitorScheduler&) = delete;
    MonitorScheduler& operator=(const MonitorScheduler&) = delete;

    /**
     * @brief Starts supervising a device in state Unknown.
     *
     * The first tick runs one interval after the call.
     *
     * @param device Device to watch.
     * @param interval Time between tick starts.
     * @return False if the device is already watched.
     * @throws EngineError with ErrorCode::InvalidTarget if the device address is invalid.
     * @throws EngineError with ErrorCode::InvalidConfiguration if the interval does not
     *         exceed the worst-case duration of one tick.
     */
    bool addToWatchlist(const core::Device& device, std::chrono::milliseconds interval);

    /**
     * @brief Stops supervising a device.
     *
     * Blocks until an alert being published for the device has been delivered.
     * Called from inside an alert handler it does not wait, since the handler
     * itself is part of that delivery.
     *
     * @return False if the device was not watched.
     */
    bool removeFromWatchlist(const std::string& address);

    [[nodiscard]] std::vector<core::WatchEntry> watchlist() const;
    [[nodiscard]] std::optional<core::WatchEntry> entry(const std::string& address) const;
    [[nodiscard]] bool isWatching(const std::string& address) const;

    /**
     * @brief Runs one tick for a device on the calling thread.
     *
     * Does not move the device's timer. Waits if a scheduled tick for the
     * same device is running.
     *
     * @return The entry after the tick, or std::nullopt if the device is not watched.
     */
    std::optional<core::WatchEntry> runTick(const std::string& address);

    /**
     * @brief Removes every entry.
     */
    void stopAll();

    void setTransitionCallback(TransitionCallback callback);

    /**
     * @brief Smallest interval addToWatchlist() accepts is anything above this.
     */
    [[nodiscard]] std::chrono::milliseconds worstCaseTickDuration() const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] const Options& options() const { return options_; }

private:
    struct MonitoredDevice {
        explicit MonitoredDevice(asio::io_context& io) : timer(io) {}

        core::WatchEntry entry;               ///< Guarded by stateMutex
        asio::steady_timer timer;             ///< Guarded by stateMutex
        std::atomic<bool> active{true};
        std::mutex runMutex;                  ///< Serialises ticks
        std::mutex stateMutex;                ///< Entry update and metrics append

        bool publishing{false};               ///< Guarded by publishMutex
        std::mutex publishMutex;
        std::condition_variable publishDone;
    };

    using DevicePtr = std::shared_ptr<MonitoredDevice>;

    DevicePtr findDevice(const std::string& address) const;

    void scheduleTick(const DevicePtr& device, std::chrono::steady_clock::time_point when);
    void executeTick(const DevicePtr& device, bool reschedule);
    bool applySample(const DevicePtr& device, const core::PerformanceSample& sample);

    infra::AsioContext& context_;
    PerformanceSampler& sampler_;
    infra::MetricsStore& metrics_;
    core::IAlertDispatcher& dispatcher_;
    Options options_;

    asio::thread_pool tickPool_;

    std::map<std::string, DevicePtr> devices_;
    mutable std::mutex mutex_;

    TransitionCallback transitionCallback_;
    std::mutex callbackMutex_;
};

} // namespace lanwatch::engine
