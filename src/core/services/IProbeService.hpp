/**
 * @file IProbeService.hpp
 * @brief Interface for the probe primitives.
 *
 * This file defines the abstract interface for single, bounded-duration
 * network probes against one target. Every other component reaches the
 * network through it.
 */

#pragma once

#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace lanwatch::core {

/**
 * @brief Interface for probe primitives.
 *
 * Each call blocks for at most its timeout (or duration), performs no
 * retries and mutates no shared state. Failures are reported through the
 * result's error cause and never thrown. Implementations must be safe to call
 * concurrently from many threads.
 *
 * @note On Linux, raw ICMP requires CAP_NET_RAW or membership of
 *       net.ipv4.ping_group_range; without either pingOnce() reports
 *       ErrorCode::PermissionDenied.
 */
class IProbeService {
public:
    virtual ~IProbeService() = default;

    /**
     * @brief Sends one ICMP echo request and waits for the reply.
     * @param address IPv4 address of the target.
     * @param timeout Maximum time to wait for the reply.
     * @return Result with RTT, or a Timeout/Unreachable/PermissionDenied/InvalidTarget cause.
     */
    virtual ProbeResult pingOnce(const std::string& address, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Attempts one TCP handshake.
     * @param address IPv4 address of the target.
     * @param port TCP port to connect to.
     * @param timeout Maximum time for the handshake.
     * @return Result with connect time, or a ConnectionRefused/Timeout/Unreachable/InvalidTarget cause.
     */
    virtual ProbeResult checkPort(const std::string& address, uint16_t port,
                                  std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Measures throughput with a timed bulk transfer.
     * @param address IPv4 address of the target.
     * @param duration How long to transfer for.
     * @param direction Whether to receive from or send to the target.
     * @return Result with bytes and Mbit/s, or an Unsupported/Timeout cause.
     */
    virtual ProbeResult sampleBandwidth(const std::string& address,
                                        std::chrono::milliseconds duration,
                                        BandwidthDirection direction) = 0;

    /**
     * @brief Reports whether this process may send ICMP echo requests.
     * @return False when pingOnce() would fail with PermissionDenied.
     */
    virtual bool icmpAvailable() const = 0;
};

} // namespace lanwatch::core
