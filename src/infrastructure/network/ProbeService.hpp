#pragma once

#include "core/services/IProbeService.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

namespace lanwatch::infra {

/**
 * @brief Probe primitives over ICMP and TCP.
 *
 * ICMP echo uses a raw socket when permitted and falls back to an
 * unprivileged ICMP datagram socket. TCP checks and bandwidth samples use a
 * private asio::io_context per call, bounded with run_for(), so calls are
 * independent and safe from any thread.
 *
 * Bandwidth is measured against the classic TCP test services: download
 * reads from the character generator (RFC 864), upload writes to the discard
 * service (RFC 863).
 */
class ProbeService : public core::IProbeService {
public:
    struct Options {
        uint16_t downloadPort{19};                   ///< chargen
        uint16_t uploadPort{9};                      ///< discard
        std::chrono::milliseconds connectTimeout{2000}; ///< Handshake limit for bandwidth probes
    };

    ProbeService();
    explicit ProbeService(Options options);

    core::ProbeResult pingOnce(const std::string& address,
                               std::chrono::milliseconds timeout) override;

    core::ProbeResult checkPort(const std::string& address, uint16_t port,
                                std::chrono::milliseconds timeout) override;

    core::ProbeResult sampleBandwidth(const std::string& address,
                                      std::chrono::milliseconds duration,
                                      core::BandwidthDirection direction) override;

    bool icmpAvailable() const override;

    /**
     * @brief Maps an asio connect error to the probe error taxonomy.
     */
    static core::ErrorCode mapConnectError(const asio::error_code& ec);

    // ICMP helpers
    static uint16_t calculateChecksum(const uint8_t* data, size_t length);
    static std::vector<uint8_t> buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence);

private:
    enum class IcmpMode : int { Untested = -1, Unavailable = 0, Raw = 1, Datagram = 2 };

    int openIcmpSocket(IcmpMode& mode) const;

    Options options_;
    std::atomic<uint16_t> sequenceNumber_{0};
    uint16_t identifier_;
    mutable std::atomic<int> icmpMode_{static_cast<int>(IcmpMode::Untested)};
};

} // namespace lanwatch::infra
