/**
 * @file INetworkEnvironment.hpp
 * @brief Interface to the host's view of the local network.
 *
 * Discovery needs facts the host already knows: its interfaces, its default
 * route, its neighbour (ARP) cache and reverse name resolution.
 */

#pragma once

#include "core/types/NetworkInterface.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanwatch::core {

/**
 * @brief Interface for local network environment queries.
 */
class INetworkEnvironment {
public:
    virtual ~INetworkEnvironment() = default;

    /**
     * @brief Lists the host's IPv4 interfaces.
     */
    virtual std::vector<NetworkInterface> interfaces() const = 0;

    /**
     * @brief Gets the IPv4 address of the default gateway.
     * @return Gateway address, or std::nullopt if there is no default route.
     */
    virtual std::optional<std::string> defaultGateway() const = 0;

    /**
     * @brief Reads the neighbour cache.
     * @return Map from IPv4 address to hardware address for complete entries.
     */
    virtual std::unordered_map<std::string, std::string> neighborTable() const = 0;

    /**
     * @brief Resolves an address to a host name.
     * @param address IPv4 address to look up.
     * @param timeout Longest time the call may block.
     * @return Host name, or std::nullopt if the address has no PTR record or
     *         the resolver did not answer within the timeout.
     */
    virtual std::optional<std::string> reverseLookup(const std::string& address,
                                                     std::chrono::milliseconds timeout) const = 0;
};

} // namespace lanwatch::core
