/**
 * @file Device.hpp
 * @brief Device definition for the discovered network inventory.
 *
 * This file defines the Device structure which represents one endpoint found
 * on the local subnet, along with its class and reachability enumerations.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::core {

/**
 * @brief Heuristic category of a device.
 */
enum class DeviceClass : int {
    Unknown = 0,
    Router = 1,
    Server = 2,
    Desktop = 3,
    Laptop = 4,
    Phone = 5,
    Printer = 6,
    Camera = 7
};

/**
 * @brief Last known reachability of a device.
 */
enum class Reachability : int {
    Unknown = 0, ///< Never probed or not yet determined
    Online = 1,  ///< Answered the most recent probe
    Offline = 2  ///< Previously seen, did not answer the most recent probe
};

/**
 * @brief Represents a network endpoint in the device inventory.
 *
 * Devices are created by the discovery scanner on first sighting and updated
 * in place afterwards. They are never removed automatically.
 */
struct Device {
    std::string address;                  ///< IPv4 address, unique within a snapshot
    std::optional<std::string> macAddress; ///< Hardware address, if resolved
    std::string name;                     ///< Display name
    std::optional<std::string> hostname;  ///< Reverse DNS name, if resolved
    DeviceClass deviceClass{DeviceClass::Unknown}; ///< Heuristic device category
    Reachability reachability{Reachability::Unknown}; ///< Last known reachability
    std::vector<uint16_t> openPorts;      ///< TCP ports that answered during discovery
    std::optional<std::chrono::microseconds> lastRtt; ///< RTT of the answering probe
    std::chrono::system_clock::time_point firstSeen; ///< When the device was first sighted
    std::optional<std::chrono::system_clock::time_point> lastSeen; ///< Last successful sighting

    /**
     * @brief Validates the device record.
     * @return True if the address is a valid dotted IPv4 address.
     */
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] std::string classToString() const;
    [[nodiscard]] std::string reachabilityToString() const;

    static std::string deviceClassToString(DeviceClass cls);
    static DeviceClass classFromString(const std::string& str);
    static std::string reachabilityToString(Reachability state);
    static Reachability reachabilityFromString(const std::string& str);

    /**
     * @brief Builds the default display name for an address.
     * @param address IPv4 address of the device.
     * @return Name of the form "Device-<last octet>".
     */
    static std::string defaultName(const std::string& address);

    bool operator==(const Device& other) const = default;
};

void to_json(nlohmann::json& j, const Device& device);

} // namespace lanwatch::core
