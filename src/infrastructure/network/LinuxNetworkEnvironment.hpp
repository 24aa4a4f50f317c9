#pragma once

#include "core/services/INetworkEnvironment.hpp"

#include <istream>

namespace lanwatch::infra {

/**
 * @brief Network environment backed by procfs and the system resolver.
 *
 * Reads the neighbour cache from /proc/net/arp and the default route from
 * /proc/net/route. Reverse lookups run getnameinfo() on a helper thread so
 * that a slow resolver cannot hold the caller past its timeout.
 */
class LinuxNetworkEnvironment : public core::INetworkEnvironment {
public:
    std::vector<core::NetworkInterface> interfaces() const override;
    std::optional<std::string> defaultGateway() const override;
    std::unordered_map<std::string, std::string> neighborTable() const override;
    std::optional<std::string> reverseLookup(const std::string& address,
                                             std::chrono::milliseconds timeout) const override;

    /**
     * @brief Parses the /proc/net/arp format.
     * @param input Stream positioned at the header line.
     * @return Complete entries, keyed by IPv4 address, MAC in lower case.
     */
    static std::unordered_map<std::string, std::string> parseNeighborTable(std::istream& input);

    /**
     * @brief Parses the /proc/net/route format for the default gateway.
     * @param input Stream positioned at the header line.
     * @return Gateway of the first usable default route, if any.
     */
    static std::optional<std::string> parseDefaultGateway(std::istream& input);
};

} // namespace lanwatch::infra
