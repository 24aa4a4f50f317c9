#include "engine/DiscoveryScanner.hpp"

#include "core/types/DeviceClassifier.hpp"
#include "core/types/Error.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>

namespace lanwatch::engine {

namespace {

using SteadyClock = std::chrono::steady_clock;

// Time left before the deadline, capped at limit; zero once it has passed.
std::chrono::milliseconds remainingWithin(SteadyClock::time_point deadline,
                                          std::chrono::milliseconds limit) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
    if (left.count() <= 0) {
        return std::chrono::milliseconds(0);
    }
    return std::min(left, limit);
}

} // namespace

DiscoveryScanner::DiscoveryScanner(core::IProbeService& probes,
                                   core::INetworkEnvironment& environment)
    : DiscoveryScanner(probes, environment, Options{}) {}

DiscoveryScanner::DiscoveryScanner(core::IProbeService& probes,
                                   core::INetworkEnvironment& environment, Options options)
    : probes_(probes), environment_(environment), options_(std::move(options)) {}

std::vector<core::Device> DiscoveryScanner::scan(const std::string& rangeSpec,
                                                 size_t concurrencyLimit) {
    return scan(core::AddressRange::parse(rangeSpec), concurrencyLimit);
}

std::vector<core::Device> DiscoveryScanner::scan(const core::AddressRange& range,
                                                 size_t concurrencyLimit) {
    if (concurrencyLimit == 0) {
        throw core::EngineError(core::ErrorCode::InvalidConfiguration,
                                "scan concurrency must be at least 1");
    }
    if (usableInterfaces().empty()) {
        throw core::EngineError(core::ErrorCode::DiscoveryFailed, "no usable network interface");
    }

    auto addresses = range.addresses();
    auto gateway = environment_.defaultGateway();
    auto deadline = SteadyClock::now() + options_.timeBudget;

    if (!probes_.icmpAvailable()) {
        spdlog::warn("ICMP echo not permitted, discovery will rely on TCP fallback");
    }

    spdlog::info("Starting discovery of {} ({} addresses, concurrency {})", range.toString(),
                 addresses.size(), concurrencyLimit);

    std::vector<std::optional<Sighting>> sightings(addresses.size());
    std::vector<char> probed(addresses.size(), 0);
    std::atomic<size_t> skipped{0};

    {
        asio::thread_pool pool(std::min(concurrencyLimit, std::max<size_t>(addresses.size(), 1)));
        for (size_t i = 0; i < addresses.size(); ++i) {
            asio::post(pool, [this, i, deadline, &addresses, &sightings, &probed, &skipped]() {
                if (SteadyClock::now() >= deadline) {
                    ++skipped;
                    return;
                }
                try {
                    sightings[i] = probeAddress(addresses[i], deadline);
                    probed[i] = 1;
                } catch (const std::exception& e) {
                    spdlog::warn("Discovery probe of {} failed: {}", addresses[i], e.what());
                }
            });
        }
        pool.join();
    }

    if (skipped > 0) {
        spdlog::warn("Discovery time budget elapsed, {} addresses not probed", skipped.load());
    }

    // Read the neighbour cache after probing so that it holds our own traffic.
    auto neighbors = environment_.neighborTable();
    auto now = std::chrono::system_clock::now();

    std::vector<core::Device> result;
    std::lock_guard lock(mutex_);

    for (size_t i = 0; i < addresses.size(); ++i) {
        auto key = *core::parseIpv4(addresses[i]);

        if (!sightings[i]) {
            auto known = inventory_.find(key);
            if (probed[i] && known != inventory_.end()) {
                known->second.reachability = core::Reachability::Offline;
                result.push_back(known->second);
            }
            continue;
        }

        const auto& sighting = *sightings[i];
        auto [it, inserted] = inventory_.try_emplace(key);
        auto& device = it->second;

        if (inserted) {
            device.address = sighting.address;
            device.firstSeen = now;
        }

        if (auto mac = neighbors.find(sighting.address); mac != neighbors.end()) {
            device.macAddress = mac->second;
        }
        if (sighting.hostname) {
            device.hostname = sighting.hostname;
        }
        if (device.name.empty() || device.name == core::Device::defaultName(device.address)) {
            device.name = device.hostname ? *device.hostname
                                          : core::Device::defaultName(device.address);
        }

        device.openPorts = sighting.openPorts;
        device.lastRtt = sighting.rtt;
        device.lastSeen = now;
        device.reachability = core::Reachability::Online;

        core::ClassificationInput evidence;
        evidence.macAddress = device.macAddress;
        evidence.openPorts = device.openPorts;
        evidence.hostname = device.hostname;
        evidence.isDefaultGateway = gateway && *gateway == device.address;
        device.deviceClass = core::DeviceClassifier::classify(evidence);

        result.push_back(device);
    }

    spdlog::info("Discovery of {} complete: {} online, {} offline", range.toString(),
                 std::count_if(result.begin(), result.end(),
                               [](const core::Device& d) {
                                   return d.reachability == core::Reachability::Online;
                               }),
                 std::count_if(result.begin(), result.end(), [](const core::Device& d) {
                     return d.reachability == core::Reachability::Offline;
                 }));
    return result;
}

std::optional<DiscoveryScanner::Sighting> DiscoveryScanner::probeAddress(
    const std::string& address, SteadyClock::time_point deadline) {
    auto timeout = remainingWithin(deadline, options_.pingTimeout);
    if (timeout.count() == 0) {
        return std::nullopt;
    }

    Sighting sighting;
    sighting.address = address;
    bool alive = false;

    auto echo = probes_.pingOnce(address, timeout);
    if (echo.success) {
        alive = true;
        sighting.rtt = echo.rtt;
    } else {
        if (echo.error == core::ErrorCode::InvalidTarget) {
            return std::nullopt;
        }
        for (auto port : options_.fallbackPorts) {
            timeout = remainingWithin(deadline, options_.portTimeout);
            if (timeout.count() == 0) {
                break;
            }
            auto connect = probes_.checkPort(address, port, timeout);
            if (connect.success) {
                alive = true;
                sighting.rtt = connect.rtt;
                sighting.openPorts.push_back(port);
                break;
            }
            if (connect.error == core::ErrorCode::ConnectionRefused) {
                alive = true;
                break;
            }
        }
    }

    if (!alive) {
        return std::nullopt;
    }

    spdlog::debug("Host {} is alive", address);

    if (options_.probeServicePorts) {
        probeServicePorts(sighting, deadline);
    }
    if (options_.resolveHostnames) {
        auto lookupTimeout = remainingWithin(deadline, options_.lookupTimeout);
        if (lookupTimeout.count() > 0) {
            sighting.hostname = environment_.reverseLookup(address, lookupTimeout);
        }
    }
    return sighting;
}

void DiscoveryScanner::probeServicePorts(Sighting& sighting, SteadyClock::time_point deadline) {
    for (auto port : options_.servicePorts) {
        if (std::find(sighting.openPorts.begin(), sighting.openPorts.end(), port) !=
            sighting.openPorts.end()) {
            continue;
        }
        auto timeout = remainingWithin(deadline, options_.portTimeout);
        if (timeout.count() == 0) {
            break;
        }
        if (probes_.checkPort(sighting.address, port, timeout).success) {
            sighting.openPorts.push_back(port);
        }
    }
    std::sort(sighting.openPorts.begin(), sighting.openPorts.end());
}

std::vector<core::NetworkInterface> DiscoveryScanner::usableInterfaces() const {
    std::vector<core::NetworkInterface> usable;
    for (auto& iface : environment_.interfaces()) {
        if (iface.isUsable()) {
            usable.push_back(std::move(iface));
        }
    }
    return usable;
}

core::AddressRange DiscoveryScanner::defaultRange() const {
    auto usable = usableInterfaces();
    if (usable.empty()) {
        throw core::EngineError(core::ErrorCode::DiscoveryFailed, "no usable network interface");
    }

    if (auto gateway = environment_.defaultGateway()) {
        for (const auto& iface : usable) {
            auto range = core::AddressRange::fromInterface(iface.ipAddress, iface.netmask);
            if (range.contains(*gateway)) {
                return range;
            }
        }
    }
    return core::AddressRange::fromInterface(usable.front().ipAddress, usable.front().netmask);
}

std::vector<core::Device> DiscoveryScanner::inventory() const {
    std::lock_guard lock(mutex_);

    std::vector<core::Device> devices;
    devices.reserve(inventory_.size());
    for (const auto& [key, device] : inventory_) {
        devices.push_back(device);
    }
    return devices;
}

std::optional<core::Device> DiscoveryScanner::find(const std::string& address) const {
    auto key = core::parseIpv4(address);
    if (!key) {
        return std::nullopt;
    }

    std::lock_guard lock(mutex_);
    auto it = inventory_.find(*key);
    if (it == inventory_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DiscoveryScanner::updateReachability(const std::string& address,
                                          core::Reachability reachability) {
    auto key = core::parseIpv4(address);
    if (!key) {
        return false;
    }

    std::lock_guard lock(mutex_);
    auto it = inventory_.find(*key);
    if (it == inventory_.end()) {
        return false;
    }
    it->second.reachability = reachability;
    if (reachability == core::Reachability::Online) {
        it->second.lastSeen = std::chrono::system_clock::now();
    }
    return true;
}

} // namespace lanwatch::engine
