/**
 * @file NetworkInterface.hpp
 * @brief Local network interface types and enumeration utilities.
 *
 * This file defines the structure describing an IPv4 interface of the host
 * running the engine, and a utility class for enumerating them.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::core {

/**
 * @brief Represents an IPv4 network interface on the local system.
 */
struct NetworkInterface {
    std::string name;            ///< System name of the interface (e.g., "eth0")
    std::string ipAddress;       ///< IPv4 address assigned to the interface
    std::string netmask;         ///< IPv4 netmask of the interface
    std::string macAddress;      ///< MAC address of the interface, if known
    bool isUp{false};            ///< Whether the interface is currently up
    bool isLoopback{false};      ///< Whether this is a loopback interface
    std::optional<int> speedMbps; ///< Link speed reported by the driver

    /**
     * @brief Checks whether discovery can sweep the subnet behind this interface.
     * @return True for an up, non-loopback interface with an address and netmask.
     */
    [[nodiscard]] bool isUsable() const {
        return isUp && !isLoopback && !ipAddress.empty() && !netmask.empty();
    }

    bool operator==(const NetworkInterface& other) const = default;
};

/**
 * @brief Utility class for enumerating network interfaces.
 *
 * Provides static methods to discover and query IPv4 interfaces on the
 * local system.
 */
class NetworkInterfaceEnumerator {
public:
    /**
     * @brief Enumerates all IPv4 interfaces on the system.
     * @return Vector of NetworkInterface objects, in kernel order.
     */
    static std::vector<NetworkInterface> enumerate();

    /**
     * @brief Reads the hardware address of an interface from sysfs.
     * @param interfaceName The system name of the interface (e.g., "eth0").
     * @return MAC address, or an empty string if unavailable.
     */
    static std::string readMacAddress(const std::string& interfaceName);

    /**
     * @brief Reads the link speed of an interface from sysfs.
     * @param interfaceName The system name of the interface.
     * @return Speed in Mbit/s, or std::nullopt if the driver does not report one.
     */
    static std::optional<int> readSpeed(const std::string& interfaceName);
};

} // namespace lanwatch::core
