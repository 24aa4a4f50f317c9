#include "engine/MonitorScheduler.hpp"

#include "core/types/AddressRange.hpp"
#include "core/types/AlertEvent.hpp"

#include <spdlog/spdlog.h>

namespace lanwatch::engine {

using SteadyClock = std::chrono::steady_clock;

namespace {

// Nesting depth of alert delivery on the current thread.
thread_local int publishDepth = 0;

// Marks alert delivery for one device; clears its publishing flag on exit.
class PublishScope {
public:
    PublishScope(std::mutex& mutex, bool& publishing, std::condition_variable& done)
        : mutex_(mutex), publishing_(publishing), done_(done) {
        ++publishDepth;
    }

    ~PublishScope() {
        --publishDepth;
        {
            std::lock_guard lock(mutex_);
            publishing_ = false;
        }
        done_.notify_all();
    }

    PublishScope(const PublishScope&) = delete;
    PublishScope& operator=(const PublishScope&) = delete;

private:
    std::mutex& mutex_;
    bool& publishing_;
    std::condition_variable& done_;
};

} // namespace

MonitorScheduler::MonitorScheduler(infra::AsioContext& context, PerformanceSampler& sampler,
                                   infra::MetricsStore& metrics,
                                   core::IAlertDispatcher& dispatcher, Options options)
    : context_(context), sampler_(sampler), metrics_(metrics), dispatcher_(dispatcher),
      options_(std::move(options)),
      tickPool_(options_.maxConcurrentTicks > 0 ? options_.maxConcurrentTicks : 1) {
    if (options_.samplesPerTick < 1) {
        throw core::EngineError(core::ErrorCode::InvalidConfiguration,
                                "samples per tick must be at least 1");
    }
    if (!options_.thresholds.isValid()) {
        throw core::EngineError(core::ErrorCode::InvalidConfiguration,
                                "health thresholds out of range");
    }
    spdlog::debug("MonitorScheduler initialized ({} samples per tick, {} concurrent ticks)",
                  options_.samplesPerTick, options_.maxConcurrentTicks);
}

MonitorScheduler::~MonitorScheduler() {
    stopAll();
    tickPool_.join();
}

std::chrono::milliseconds MonitorScheduler::worstCaseTickDuration() const {
    return sampler_.worstCaseDuration(options_.samplesPerTick, options_.sampleSpacing,
                                      options_.bandwidth);
}

bool MonitorScheduler::addToWatchlist(const core::Device& device,
                                      std::chrono::milliseconds interval) {
    if (!device.isValid()) {
        throw core::EngineError(core::ErrorCode::InvalidTarget,
                                "invalid device address '" + device.address + "'");
    }
    auto worstCase = worstCaseTickDuration();
    if (interval <= worstCase) {
        throw core::EngineError(core::ErrorCode::InvalidConfiguration,
                                "interval of " + std::to_string(interval.count()) +
                                    " ms does not exceed worst-case tick of " +
                                    std::to_string(worstCase.count()) + " ms");
    }

    auto monitored = std::make_shared<MonitoredDevice>(context_.getContext());
    monitored->entry.device = device;
    monitored->entry.interval = interval;
    monitored->entry.lastTransition = std::chrono::system_clock::now();

    {
        std::lock_guard lock(mutex_);
        if (!devices_.emplace(device.address, monitored).second) {
            return false;
        }
    }

    spdlog::info("Watching {} ({}) every {} ms", device.name, device.address, interval.count());

    std::lock_guard state(monitored->stateMutex);
    scheduleTick(monitored, SteadyClock::now() + interval);
    return true;
}

bool MonitorScheduler::removeFromWatchlist(const std::string& address) {
    DevicePtr device;
    {
        std::lock_guard lock(mutex_);
        auto it = devices_.find(address);
        if (it == devices_.end()) {
            return false;
        }
        device = it->second;
        devices_.erase(it);
    }

    device->active = false;

    {
        // A tick holding stateMutex past its active check has already set publishing.
        std::lock_guard state(device->stateMutex);
        device->timer.cancel();
    }

    if (publishDepth == 0) {
        std::unique_lock lock(device->publishMutex);
        device->publishDone.wait(lock, [&device]() { return !device->publishing; });
    }

    spdlog::info("Stopped watching {}", address);
    return true;
}

void MonitorScheduler::stopAll() {
    std::vector<std::string> addresses;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [address, device] : devices_) {
            addresses.push_back(address);
        }
    }
    for (const auto& address : addresses) {
        removeFromWatchlist(address);
    }
}

std::vector<core::WatchEntry> MonitorScheduler::watchlist() const {
    std::vector<DevicePtr> devices;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [address, device] : devices_) {
            devices.push_back(device);
        }
    }

    std::vector<core::WatchEntry> result;
    result.reserve(devices.size());
    for (const auto& device : devices) {
        std::lock_guard state(device->stateMutex);
        result.push_back(device->entry);
    }
    return result;
}

std::optional<core::WatchEntry> MonitorScheduler::entry(const std::string& address) const {
    auto device = findDevice(address);
    if (!device) {
        return std::nullopt;
    }
    std::lock_guard state(device->stateMutex);
    return device->entry;
}

bool MonitorScheduler::isWatching(const std::string& address) const {
    std::lock_guard lock(mutex_);
    return devices_.count(address) > 0;
}

size_t MonitorScheduler::size() const {
    std::lock_guard lock(mutex_);
    return devices_.size();
}

std::optional<core::WatchEntry> MonitorScheduler::runTick(const std::string& address) {
    auto device = findDevice(address);
    if (!device) {
        return std::nullopt;
    }

    executeTick(device, false);

    std::lock_guard state(device->stateMutex);
    if (!device->active) {
        return std::nullopt;
    }
    return device->entry;
}

void MonitorScheduler::setTransitionCallback(TransitionCallback callback) {
    std::lock_guard lock(callbackMutex_);
    transitionCallback_ = std::move(callback);
}

MonitorScheduler::DevicePtr MonitorScheduler::findDevice(const std::string& address) const {
    std::lock_guard lock(mutex_);
    auto it = devices_.find(address);
    if (it == devices_.end()) {
        return nullptr;
    }
    return it->second;
}

// Caller holds device->stateMutex.
void MonitorScheduler::scheduleTick(const DevicePtr& device, SteadyClock::time_point when) {
    if (!device->active) {
        return;
    }

    device->timer.expires_at(when);
    device->timer.async_wait([this, device](const asio::error_code& ec) {
        if (ec || !device->active) {
            return;
        }
        asio::post(tickPool_, [this, device]() { executeTick(device, true); });
    });
}

void MonitorScheduler::executeTick(const DevicePtr& device, bool reschedule) {
    std::lock_guard run(device->runMutex);
    if (!device->active) {
        return;
    }

    auto started = SteadyClock::now();

    core::Device target;
    {
        std::lock_guard state(device->stateMutex);
        target = device->entry.device;
    }

    core::PerformanceSample sample;
    try {
        sample = sampler_.sample(target, options_.samplesPerTick, options_.sampleSpacing,
                                 options_.bandwidth);
    } catch (const std::exception& e) {
        spdlog::error("Tick for {} failed: {}", target.address, e.what());
        sample.address = target.address;
        sample.timestamp = std::chrono::system_clock::now();
        sample.packetLoss = 1.0;
    }

    if (!applySample(device, sample) || !reschedule) {
        return;
    }

    std::lock_guard state(device->stateMutex);
    auto finished = SteadyClock::now();
    auto interval = device->entry.interval;
    auto next = started + interval;
    if (finished > next) {
        ++device->entry.skippedTicks;
        next = finished + interval;
        spdlog::warn("Tick for {} overran its {} ms interval, skipping one slot",
                     target.address, interval.count());
    }
    scheduleTick(device, next);
}

bool MonitorScheduler::applySample(const DevicePtr& device, const core::PerformanceSample& sample) {
    core::WatchEntry snapshot;
    core::HealthTransition transition;
    {
        std::lock_guard state(device->stateMutex);
        if (!device->active) {
            spdlog::debug("Discarding tick result for removed device {}", sample.address);
            return false;
        }

        auto& entry = device->entry;
        transition = core::evaluateHealth(entry.state, entry.consecutiveFailures, sample,
                                          options_.thresholds);

        entry.state = transition.current;
        entry.consecutiveFailures = transition.consecutiveFailures;
        entry.lastSample = sample;
        ++entry.tickCount;

        metrics_.append(entry.device.address, sample);

        if (!transition.changed()) {
            return true;
        }

        entry.lastTransition = std::chrono::system_clock::now();
        snapshot = entry;

        std::lock_guard publish(device->publishMutex);
        device->publishing = true;
    }

    PublishScope scope(device->publishMutex, device->publishing, device->publishDone);

    spdlog::info("{} ({}) {} -> {}", snapshot.device.name, snapshot.device.address,
                 core::healthStateToString(transition.previous),
                 core::healthStateToString(transition.current));

    dispatcher_.publish(core::AlertEvent::forTransition(
        snapshot.device, transition.previous, transition.current, sample));

    TransitionCallback callback;
    {
        std::lock_guard lock(callbackMutex_);
        callback = transitionCallback_;
    }
    if (callback) {
        try {
            callback(snapshot, transition);
        } catch (const std::exception& e) {
            spdlog::error("Transition callback for {} failed: {}", snapshot.device.address,
                          e.what());
        }
    }
    return true;
}

} // namespace lanwatch::engine
