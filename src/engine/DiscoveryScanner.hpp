/**
 * @file DiscoveryScanner.hpp
 * @brief Sweeps an IPv4 range for live hosts and maintains the device inventory.
 */

#pragma once

#include "core/services/INetworkEnvironment.hpp"
#include "core/services/IProbeService.hpp"
#include "core/types/AddressRange.hpp"
#include "core/types/Device.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::engine {

/**
 * @brief Discovers devices on the local subnet.
 *
 * Every address of the range is probed with an ICMP echo; when that fails
 * for any reason (including missing privileges) a few common TCP ports are
 * tried instead, and a refused connection counts as a sign of life. Addresses
 * are probed in parallel on an asio::thread_pool sized by the concurrency
 * limit, and no new probe starts once the scan's time budget has elapsed.
 *
 * The scanner owns the inventory: sighted devices are created or updated in
 * place, and known devices that were probed but did not answer are marked
 * Offline. Devices are never removed.
 */
class DiscoveryScanner {
public:
    struct Options {
        std::chrono::milliseconds pingTimeout{1000};   ///< ICMP echo timeout
        std::chrono::milliseconds portTimeout{500};    ///< TCP connect timeout
        std::vector<uint16_t> fallbackPorts{80, 443, 22, 445, 139, 53, 8080, 62078};
        bool probeServicePorts{true};                  ///< Probe servicePorts on live hosts
        std::vector<uint16_t> servicePorts{22, 80, 443, 445, 515, 554, 631, 3389, 9100, 62078};
        std::chrono::milliseconds timeBudget{60000};   ///< Wall-time limit of one scan
        bool resolveHostnames{true};                   ///< Reverse-resolve live hosts
        std::chrono::milliseconds lookupTimeout{1000}; ///< Bound on one reverse lookup
    };

    DiscoveryScanner(core::IProbeService& probes, core::INetworkEnvironment& environment);
    DiscoveryScanner(core::IProbeService& probes, core::INetworkEnvironment& environment,
                     Options options);

    DiscoveryScanner(const DiscoveryScanner&) = delete;
    DiscoveryScanner& operator=(const DiscoveryScanner&) = delete;

    /**
     * @brief Sweeps a range and merges the results into the inventory.
     * @param range Addresses to probe.
     * @param concurrencyLimit Maximum number of addresses probed at once.
     * @return Devices sighted in this scan plus known in-range devices that
     *         were probed and did not answer, ordered by address.
     * @throws EngineError with ErrorCode::DiscoveryFailed if the host has no usable interface.
     * @throws EngineError with ErrorCode::InvalidConfiguration if concurrencyLimit is zero.
     */
    std::vector<core::Device> scan(const core::AddressRange& range, size_t concurrencyLimit);

    /**
     * @brief Parses a range specification and scans it.
     * @throws EngineError with ErrorCode::InvalidTarget if the range is malformed.
     */
    std::vector<core::Device> scan(const std::string& rangeSpec, size_t concurrencyLimit);

    /**
     * @brief Derives the range to sweep from the host's primary interface.
     *
     * Prefers the interface whose subnet holds the default gateway. Subnets
     * wider than /24 are narrowed to the /24 around the interface address.
     *
     * @throws EngineError with ErrorCode::DiscoveryFailed if there is no usable interface.
     */
    [[nodiscard]] core::AddressRange defaultRange() const;

    /**
     * @brief Gets every device ever sighted, ordered by address.
     */
    [[nodiscard]] std::vector<core::Device> inventory() const;

    [[nodiscard]] std::optional<core::Device> find(const std::string& address) const;

    /**
     * @brief Records reachability learned outside discovery (e.g. by monitoring).
     * @return False if the device is not in the inventory.
     */
    bool updateReachability(const std::string& address, core::Reachability reachability);

    [[nodiscard]] const Options& options() const { return options_; }

private:
    struct Sighting {
        std::string address;
        std::optional<std::chrono::microseconds> rtt;
        std::vector<uint16_t> openPorts;
        std::optional<std::string> hostname;
    };

    std::optional<Sighting> probeAddress(const std::string& address,
                                         std::chrono::steady_clock::time_point deadline);
    void probeServicePorts(Sighting& sighting, std::chrono::steady_clock::time_point deadline);

    std::vector<core::NetworkInterface> usableInterfaces() const;

    core::IProbeService& probes_;
    core::INetworkEnvironment& environment_;
    Options options_;

    std::map<uint32_t, core::Device> inventory_; ///< Keyed by numeric address for ordering
    mutable std::mutex mutex_;
};

} // namespace lanwatch::engine
