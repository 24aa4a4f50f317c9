/**
 * @file ProbeResult.hpp
 * @brief Outcome of a single probe primitive.
 *
 * This file defines the result of one ICMP echo, one TCP connect check or
 * one bandwidth sample against a single target.
 */

#pragma once

#include "core/types/Error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lanwatch::core {

/**
 * @brief Kind of probe that produced a result.
 */
enum class ProbeKind : int {
    Icmp = 0,     ///< ICMP echo request
    TcpPort = 1,  ///< TCP connect check
    Bandwidth = 2 ///< Timed bulk transfer
};

/**
 * @brief Direction of a bandwidth sample, as seen from this host.
 */
enum class BandwidthDirection : int {
    Download = 0, ///< Bytes flow from the target to this host
    Upload = 1    ///< Bytes flow from this host to the target
};

/**
 * @brief Result of a single probe operation.
 *
 * Contains timing, success status and the failure cause. A result is never
 * modified after the probe that produced it returns.
 */
struct ProbeResult {
    std::string address;                  ///< Target that was probed
    ProbeKind kind{ProbeKind::Icmp};      ///< Probe primitive used
    std::chrono::system_clock::time_point timestamp; ///< When the probe started
    bool success{false};                  ///< Whether the target answered
    std::optional<std::chrono::microseconds> rtt; ///< Round-trip time, absent on failure
    std::optional<ErrorCode> error;       ///< Failure cause, absent on success
    std::optional<uint16_t> port;         ///< Port used by TCP and bandwidth probes
    std::optional<int> ttl;               ///< TTL of an ICMP reply, when available
    uint64_t bytesTransferred{0};         ///< Payload bytes moved by a bandwidth probe
    std::optional<double> throughputMbps; ///< Bandwidth estimate in Mbit/s

    /**
     * @brief Converts the RTT to milliseconds.
     * @return RTT in milliseconds, or std::nullopt when the probe failed.
     */
    [[nodiscard]] std::optional<double> rttMs() const {
        if (!rtt) {
            return std::nullopt;
        }
        return static_cast<double>(rtt->count()) / 1000.0;
    }

    [[nodiscard]] std::string kindToString() const;

    /**
     * @brief Builds a successful result.
     */
    static ProbeResult succeeded(const std::string& address, ProbeKind kind,
                                 std::chrono::system_clock::time_point timestamp,
                                 std::chrono::microseconds rtt);

    /**
     * @brief Builds a failed result carrying a cause.
     */
    static ProbeResult failed(const std::string& address, ProbeKind kind,
                              std::chrono::system_clock::time_point timestamp, ErrorCode cause);

    bool operator==(const ProbeResult& other) const = default;
};

std::string probeKindToString(ProbeKind kind);
std::string bandwidthDirectionToString(BandwidthDirection direction);
BandwidthDirection bandwidthDirectionFromString(const std::string& str);

} // namespace lanwatch::core
