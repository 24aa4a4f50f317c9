/**
 * @file DeviceClassifier.hpp
 * @brief Heuristic device classification.
 *
 * Maps what discovery observed about a host (hardware vendor prefix, open
 * TCP ports, reverse DNS name) to a DeviceClass. Classification is
 * best-effort and total: anything unrecognised is DeviceClass::Unknown.
 */

#pragma once

#include "core/types/Device.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanwatch::core {

/**
 * @brief Evidence gathered about a host during discovery.
 */
struct ClassificationInput {
    std::optional<std::string> macAddress; ///< Hardware address, any separator/case
    std::vector<uint16_t> openPorts;       ///< TCP ports that accepted a connection
    std::optional<std::string> hostname;   ///< Reverse DNS name
    bool isDefaultGateway{false};          ///< Address matches the host's default route
};

/**
 * @brief Pure classification of devices from discovery evidence.
 *
 * Precedence: default gateway, then distinctive service ports, then the
 * vendor prefix of the hardware address, then hostname keywords.
 */
class DeviceClassifier {
public:
    static DeviceClass classify(const ClassificationInput& input);

    /**
     * @brief Looks up the device class associated with a vendor prefix.
     * @param macAddress Hardware address such as "b8:27:eb:12:34:56".
     * @return The vendor's typical class, or std::nullopt if the prefix is unknown.
     */
    static std::optional<DeviceClass> classifyVendor(const std::string& macAddress);

    static std::optional<DeviceClass> classifyPorts(const std::vector<uint16_t>& openPorts);
    static std::optional<DeviceClass> classifyHostname(const std::string& hostname);

    /**
     * @brief Normalises a hardware address to "AA:BB:CC" vendor prefix form.
     * @return The prefix, or an empty string if the address is malformed.
     */
    static std::string vendorPrefix(const std::string& macAddress);

    /**
     * @brief Gets the table of known vendor prefixes.
     */
    static const std::unordered_map<std::string, DeviceClass>& getKnownVendors();

    /**
     * @brief Detects the likely service running on a port.
     * @return Service name if known, empty string otherwise.
     */
    static std::string detectService(uint16_t port);
};

} // namespace lanwatch::core
