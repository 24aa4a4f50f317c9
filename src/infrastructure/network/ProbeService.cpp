#include "infrastructure/network/ProbeService.hpp"

#include "core/types/AddressRange.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <functional>
#include <random>

#ifdef __linux__
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace lanwatch::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr uint8_t ICMP_DEST_UNREACHABLE = 3;

using Clock = std::chrono::steady_clock;

class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
#ifdef __linux__
        if (fd_ >= 0) {
            close(fd_);
        }
#endif
    }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

bool isPermissionError(int err) {
    return err == EPERM || err == EACCES;
}

core::ErrorCode mapSendError(int err) {
    if (isPermissionError(err)) {
        return core::ErrorCode::PermissionDenied;
    }
    return core::ErrorCode::Unreachable;
}

std::chrono::microseconds elapsedSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

/// Connects with a deadline. Returns the error, or an empty code on success.
asio::error_code connectWithin(asio::io_context& io, asio::ip::tcp::socket& socket,
                               const asio::ip::tcp::endpoint& endpoint,
                               std::chrono::milliseconds timeout) {
    bool completed = false;
    asio::error_code result;

    socket.async_connect(endpoint, [&completed, &result](const asio::error_code& ec) {
        completed = true;
        result = ec;
    });

    io.run_for(timeout);

    if (!completed) {
        asio::error_code ignored;
        socket.close(ignored);
        io.restart();
        io.run();
        return asio::error::timed_out;
    }
    return result;
}

} // namespace

ProbeService::ProbeService() : ProbeService(Options{}) {}

ProbeService::ProbeService(Options options) : options_(options) {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    spdlog::debug("ProbeService initialized with ICMP identifier: {}", identifier_);
}

uint16_t ProbeService::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> ProbeService::buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(64, 0);

    // ICMP header
    packet[0] = ICMP_ECHO_REQUEST;
    packet[1] = 0;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    // Timestamp as payload
    auto now = Clock::now().time_since_epoch().count();
    std::memcpy(&packet[8], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

int ProbeService::openIcmpSocket(IcmpMode& mode) const {
#ifdef __linux__
    int sock = socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
    if (sock >= 0) {
        mode = IcmpMode::Raw;
        return sock;
    }

    int rawErr = errno;
    sock = socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (sock >= 0) {
        mode = IcmpMode::Datagram;
        return sock;
    }

    int dgramErr = errno;
    mode = (isPermissionError(rawErr) && isPermissionError(dgramErr)) ? IcmpMode::Unavailable
                                                                       : IcmpMode::Untested;
    errno = dgramErr;
    return -1;
#else
    mode = IcmpMode::Unavailable;
    return -1;
#endif
}

bool ProbeService::icmpAvailable() const {
    auto cached = static_cast<IcmpMode>(icmpMode_.load());
    if (cached != IcmpMode::Untested) {
        return cached != IcmpMode::Unavailable;
    }

    IcmpMode mode = IcmpMode::Untested;
    SocketGuard sock(openIcmpSocket(mode));
    if (mode != IcmpMode::Untested) {
        icmpMode_ = static_cast<int>(mode);
    }
    if (mode == IcmpMode::Unavailable) {
        spdlog::warn("ICMP sockets not permitted (need CAP_NET_RAW or ping_group_range); "
                     "discovery will fall back to TCP probes");
    }
    return sock.get() >= 0;
}

core::ProbeResult ProbeService::pingOnce(const std::string& address,
                                         std::chrono::milliseconds timeout) {
    auto timestamp = std::chrono::system_clock::now();
    auto target = core::parseIpv4(address);
    if (!target) {
        return core::ProbeResult::failed(address, core::ProbeKind::Icmp, timestamp,
                                         core::ErrorCode::InvalidTarget);
    }

#ifdef __linux__
    IcmpMode mode = IcmpMode::Untested;
    SocketGuard sock(openIcmpSocket(mode));
    if (sock.get() < 0) {
        int err = errno;
        if (mode == IcmpMode::Unavailable) {
            icmpMode_ = static_cast<int>(IcmpMode::Unavailable);
            spdlog::debug("Ping to {} not permitted: {}", address, std::strerror(err));
            return core::ProbeResult::failed(address, core::ProbeKind::Icmp, timestamp,
                                             core::ErrorCode::PermissionDenied);
        }
        spdlog::warn("Failed to create ICMP socket for {}: {}", address, std::strerror(err));
        return core::ProbeResult::failed(address, core::ProbeKind::Icmp, timestamp,
                                         core::ErrorCode::Unreachable);
    }
    icmpMode_ = static_cast<int>(mode);

    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    dest.sin_addr.s_addr = htonl(*target);

    uint16_t seq = sequenceNumber_++;
    auto packet = buildIcmpEchoRequest(identifier_, seq);

    auto sendTime = Clock::now();
    auto deadline = sendTime + timeout;

    ssize_t sent = sendto(sock.get(), packet.data(), packet.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        int err = errno;
        spdlog::debug("Ping to {} failed to send: {}", address, std::strerror(err));
        return core::ProbeResult::failed(address, core::ProbeKind::Icmp, timestamp,
                                         mapSendError(err));
    }

    // Raw sockets see the IP header and every ICMP packet delivered to the
    // host; datagram sockets see only replies to this socket, without header.
    const bool raw = mode == IcmpMode::Raw;
    std::array<uint8_t, 1024> recvBuffer{};

    while (true) {
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        struct pollfd pfd {};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            break;
        }

        struct sockaddr_in from {};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(sock.get(), recvBuffer.data(), recvBuffer.size(), 0,
                                    reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        auto recvTime = Clock::now();

        if (received < 0) {
            int err = errno;
            if (err == EINTR || err == EAGAIN) {
                continue;
            }
            return core::ProbeResult::failed(address, core::ProbeKind::Icmp, timestamp,
                                             mapSendError(err));
        }

        size_t ipHeaderLen = 0;
        if (raw) {
            if (received < 28) { // Minimum IP header (20) + ICMP header (8)
                continue;
            }
            ipHeaderLen = static_cast<size_t>((recvBuffer[0] & 0x0F) * 4);
        }
        if (static_cast<size_t>(received) < ipHeaderLen + 8) {
            continue;
        }

        const uint8_t* icmp = recvBuffer.data() + ipHeaderLen;

        if (icmp[0] == ICMP_ECHO_REPLY && ntohl(from.sin_addr.s_addr) == *target) {
            uint16_t recvId = (static_cast<uint16_t>(icmp[4]) << 8) | icmp[5];
            uint16_t recvSeq = (static_cast<uint16_t>(icmp[6]) << 8) | icmp[7];

            // The kernel rewrites the identifier of datagram ICMP sockets
            if (recvSeq != seq || (raw && recvId != identifier_)) {
                continue;
            }

            auto result = core::ProbeResult::succeeded(
                address, core::ProbeKind::Icmp, timestamp,
                std::chrono::duration_cast<std::chrono::microseconds>(recvTime - sendTime));
            if (raw) {
                result.ttl = recvBuffer[8];
            }
            spdlog::trace("Ping to {} successful: {:.2f}ms", address, *result.rttMs());
            return result;
        }

        if (raw && icmp[0] == ICMP_DEST_UNREACHABLE &&
            static_cast<size_t>(received) >= ipHeaderLen + 8 + 20 + 8) {
            // Embedded original datagram: IP header, then our echo request
            const uint8_t* innerIp = icmp + 8;
            size_t innerLen = static_cast<size_t>((innerIp[0] & 0x0F) * 4);
            if (static_cast<size_t>(received) < ipHeaderLen + 8 + innerLen + 8) {
                continue;
            }
            const uint8_t* innerIcmp = innerIp + innerLen;
            uint16_t innerId = (static_cast<uint16_t>(innerIcmp[4]) << 8) | innerIcmp[5];
            uint16_t innerSeq = (static_cast<uint16_t>(innerIcmp[6]) << 8) | innerIcmp[7];
            if (innerId == identifier_ && innerSeq == seq) {
                return core::ProbeResult::failed(address, core::ProbeKind::Icmp, timestamp,
                                                 core::ErrorCode::Unreachable);
            }
        }
    }

    return core::ProbeResult::failed(address, core::ProbeKind::Icmp, timestamp,
                                     core::ErrorCode::Timeout);
#else
    (void)timeout;
    return core::ProbeResult::failed(address, core::ProbeKind::Icmp, timestamp,
                                     core::ErrorCode::PermissionDenied);
#endif
}

core::ErrorCode ProbeService::mapConnectError(const asio::error_code& ec) {
    if (ec == asio::error::connection_refused) {
        return core::ErrorCode::ConnectionRefused;
    }
    if (ec == asio::error::timed_out || ec == asio::error::operation_aborted) {
        return core::ErrorCode::Timeout;
    }
    if (ec == asio::error::access_denied) {
        return core::ErrorCode::PermissionDenied;
    }
    return core::ErrorCode::Unreachable;
}

core::ProbeResult ProbeService::checkPort(const std::string& address, uint16_t port,
                                          std::chrono::milliseconds timeout) {
    auto timestamp = std::chrono::system_clock::now();

    asio::error_code ec;
    auto ip = asio::ip::make_address_v4(address, ec);
    if (ec) {
        auto result = core::ProbeResult::failed(address, core::ProbeKind::TcpPort, timestamp,
                                                core::ErrorCode::InvalidTarget);
        result.port = port;
        return result;
    }

    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    auto started = Clock::now();
    auto connectError = connectWithin(io, socket, asio::ip::tcp::endpoint(ip, port), timeout);
    auto rtt = elapsedSince(started);

    asio::error_code ignored;
    socket.close(ignored);

    core::ProbeResult result;
    if (!connectError) {
        result = core::ProbeResult::succeeded(address, core::ProbeKind::TcpPort, timestamp, rtt);
    } else {
        result = core::ProbeResult::failed(address, core::ProbeKind::TcpPort, timestamp,
                                           mapConnectError(connectError));
        spdlog::trace("TCP {}:{} failed: {}", address, port, connectError.message());
    }
    result.port = port;
    return result;
}

core::ProbeResult ProbeService::sampleBandwidth(const std::string& address,
                                                std::chrono::milliseconds duration,
                                                core::BandwidthDirection direction) {
    auto timestamp = std::chrono::system_clock::now();
    uint16_t port = direction == core::BandwidthDirection::Download ? options_.downloadPort
                                                                    : options_.uploadPort;

    auto fail = [&](core::ErrorCode cause) {
        auto result =
            core::ProbeResult::failed(address, core::ProbeKind::Bandwidth, timestamp, cause);
        result.port = port;
        return result;
    };

    asio::error_code ec;
    auto ip = asio::ip::make_address_v4(address, ec);
    if (ec) {
        return fail(core::ErrorCode::InvalidTarget);
    }

    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    auto started = Clock::now();
    auto connectError =
        connectWithin(io, socket, asio::ip::tcp::endpoint(ip, port), options_.connectTimeout);
    if (connectError) {
        auto cause = mapConnectError(connectError);
        spdlog::debug("Bandwidth {} to {}:{} unavailable: {}",
                      core::bandwidthDirectionToString(direction), address, port,
                      connectError.message());
        return fail(cause == core::ErrorCode::ConnectionRefused ? core::ErrorCode::Unsupported
                                                                : cause);
    }
    auto connectTime = elapsedSince(started);

    std::array<char, 16384> buffer{};
    if (direction == core::BandwidthDirection::Upload) {
        for (size_t i = 0; i < buffer.size(); ++i) {
            buffer[i] = static_cast<char>('!' + (i % 94));
        }
    }

    uint64_t bytes = 0;
    std::function<void()> pump = [&]() {
        auto onTransfer = [&](const asio::error_code& transferError, size_t n) {
            bytes += n;
            if (!transferError) {
                pump();
            }
        };
        if (direction == core::BandwidthDirection::Download) {
            socket.async_read_some(asio::buffer(buffer), onTransfer);
        } else {
            socket.async_write_some(asio::buffer(buffer), onTransfer);
        }
    };

    io.restart();
    auto transferStart = Clock::now();
    pump();
    io.run_for(duration);
    auto elapsed = std::chrono::duration<double>(Clock::now() - transferStart);

    asio::error_code ignored;
    socket.close(ignored);
    io.restart();
    io.run();

    if (bytes == 0 || elapsed.count() <= 0.0) {
        spdlog::debug("Bandwidth {} to {}:{} transferred nothing",
                      core::bandwidthDirectionToString(direction), address, port);
        return fail(core::ErrorCode::Unsupported);
    }

    auto result =
        core::ProbeResult::succeeded(address, core::ProbeKind::Bandwidth, timestamp, connectTime);
    result.port = port;
    result.bytesTransferred = bytes;
    result.throughputMbps = static_cast<double>(bytes) * 8.0 / elapsed.count() / 1'000'000.0;

    spdlog::debug("Bandwidth {} to {}: {} bytes in {:.2f}s ({:.2f} Mbit/s)",
                  core::bandwidthDirectionToString(direction), address, bytes, elapsed.count(),
                  *result.throughputMbps);
    return result;
}

} // namespace lanwatch::infra
