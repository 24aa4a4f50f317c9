/**
 * @file AddressRange.hpp
 * @brief IPv4 address parsing and scan range expansion.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::core {

/**
 * @brief Parses a dotted-quad IPv4 address.
 * @param address Text such as "192.168.1.10".
 * @return Address in host byte order, or std::nullopt when malformed.
 */
std::optional<uint32_t> parseIpv4(const std::string& address);

/**
 * @brief Formats a host-byte-order IPv4 address as dotted quad.
 */
std::string formatIpv4(uint32_t address);

/**
 * @brief A contiguous range of IPv4 addresses to sweep.
 *
 * Accepted notations:
 * - CIDR: "192.168.1.0/24" (network and broadcast excluded up to /29,
 *   only the network address for /30)
 * - Last-octet range: "192.168.1.10-20"
 * - Full range: "192.168.1.10-192.168.1.20"
 * - Single address: "192.168.1.10"
 */
class AddressRange {
public:
    /// Largest range accepted by parse() (a /16 worth of addresses).
    static constexpr uint32_t kMaxAddresses = 65536;

    AddressRange() = default;
    AddressRange(uint32_t first, uint32_t last);

    /**
     * @brief Parses a range specification.
     * @param spec Range in one of the accepted notations.
     * @return The parsed range.
     * @throws EngineError with ErrorCode::InvalidTarget when malformed or too large.
     */
    static AddressRange parse(const std::string& spec);

    /**
     * @brief Builds the host range of the subnet an interface belongs to.
     * @param address Interface IPv4 address.
     * @param netmask Interface netmask.
     * @param minPrefix Subnets wider than this prefix are narrowed to it around the address.
     * @throws EngineError with ErrorCode::InvalidTarget when either value is malformed.
     */
    static AddressRange fromInterface(const std::string& address, const std::string& netmask,
                                      int minPrefix = 24);

    [[nodiscard]] uint32_t first() const { return first_; }
    [[nodiscard]] uint32_t last() const { return last_; }
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool contains(const std::string& address) const;

    /**
     * @brief Expands the range into individual addresses, ascending.
     */
    [[nodiscard]] std::vector<std::string> addresses() const;

    [[nodiscard]] std::string toString() const;

    bool operator==(const AddressRange& other) const = default;

private:
    static AddressRange fromCidr(uint32_t base, int prefix);

    uint32_t first_{0};
    uint32_t last_{0};
};

} // namespace lanwatch::core
