#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/ProbeService.hpp"

#include <asio.hpp>
#include <array>
#include <thread>

using namespace lanwatch::core;
using namespace lanwatch::infra;
using namespace std::chrono_literals;

namespace {

/// Loopback TCP listener serving a single connection on a background thread.
class LoopbackServer {
public:
    enum class Mode { AcceptOnly, Chargen, Discard };

    explicit LoopbackServer(Mode mode)
        : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address_v4("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this, mode]() { serve(mode); });
    }

    ~LoopbackServer() {
        asio::error_code ignored;
        acceptor_.close(ignored);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t port() const { return port_; }

private:
    void serve(Mode mode) {
        asio::error_code ec;
        asio::ip::tcp::socket socket(io_);
        acceptor_.accept(socket, ec);
        if (ec) {
            return;
        }

        std::array<char, 8192> buffer{};
        buffer.fill('x');
        while (!ec) {
            if (mode == Mode::Chargen) {
                socket.write_some(asio::buffer(buffer), ec);
            } else if (mode == Mode::Discard) {
                socket.read_some(asio::buffer(buffer), ec);
            } else {
                socket.read_some(asio::buffer(buffer), ec);
            }
        }
    }

    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    uint16_t port_{0};
    std::thread thread_;
};

/// A loopback port with nothing listening on it.
uint16_t closedPort() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(
        io, asio::ip::tcp::endpoint(asio::ip::make_address_v4("127.0.0.1"), 0));
    return acceptor.local_endpoint().port();
}

} // namespace

TEST_CASE("ICMP checksum", "[ProbeService]") {
    SECTION("Known vector") {
        // Echo request, id 0x1234, seq 1, no payload
        std::array<uint8_t, 8> packet{8, 0, 0, 0, 0x12, 0x34, 0x00, 0x01};
        auto checksum = ProbeService::calculateChecksum(packet.data(), packet.size());
        REQUIRE(checksum == 0xE5CA);
    }

    SECTION("Built requests verify to zero") {
        auto request = ProbeService::buildIcmpEchoRequest(0xBEEF, 42);
        REQUIRE(request[0] == 8);
        REQUIRE(request[4] == 0xBE);
        REQUIRE(request[5] == 0xEF);
        REQUIRE(request[7] == 42);
        REQUIRE(ProbeService::calculateChecksum(request.data(), request.size()) == 0);
    }
}

TEST_CASE("Connect error mapping", "[ProbeService]") {
    REQUIRE(ProbeService::mapConnectError(asio::error::connection_refused) ==
            ErrorCode::ConnectionRefused);
    REQUIRE(ProbeService::mapConnectError(asio::error::timed_out) == ErrorCode::Timeout);
    REQUIRE(ProbeService::mapConnectError(asio::error::host_unreachable) ==
            ErrorCode::Unreachable);
    REQUIRE(ProbeService::mapConnectError(asio::error::network_unreachable) ==
            ErrorCode::Unreachable);
}

TEST_CASE("Malformed targets", "[ProbeService]") {
    ProbeService probes;

    auto echo = probes.pingOnce("999.1.1.1", 100ms);
    REQUIRE_FALSE(echo.success);
    REQUIRE(echo.error == ErrorCode::InvalidTarget);

    auto port = probes.checkPort("not-an-ip", 80, 100ms);
    REQUIRE(port.error == ErrorCode::InvalidTarget);
    REQUIRE(port.port == 80);

    auto bandwidth = probes.sampleBandwidth("", 100ms, BandwidthDirection::Download);
    REQUIRE(bandwidth.error == ErrorCode::InvalidTarget);
}

TEST_CASE("TCP port check on loopback", "[ProbeService]") {
    ProbeService probes;

    SECTION("Listening port succeeds") {
        LoopbackServer server(LoopbackServer::Mode::AcceptOnly);
        auto result = probes.checkPort("127.0.0.1", server.port(), 1000ms);
        REQUIRE(result.success);
        REQUIRE(result.kind == ProbeKind::TcpPort);
        REQUIRE(result.rtt.has_value());
        REQUIRE_FALSE(result.error.has_value());
    }

    SECTION("Closed port is refused") {
        auto result = probes.checkPort("127.0.0.1", closedPort(), 1000ms);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ErrorCode::ConnectionRefused);
        REQUIRE_FALSE(result.rtt.has_value());
    }
}

TEST_CASE("Bandwidth sampling on loopback", "[ProbeService]") {
    SECTION("Download from a character generator") {
        LoopbackServer server(LoopbackServer::Mode::Chargen);
        ProbeService::Options options;
        options.downloadPort = server.port();
        ProbeService probes(options);

        auto result = probes.sampleBandwidth("127.0.0.1", 200ms, BandwidthDirection::Download);
        REQUIRE(result.success);
        REQUIRE(result.bytesTransferred > 0);
        REQUIRE(result.throughputMbps.has_value());
        REQUIRE(*result.throughputMbps > 0.0);
    }

    SECTION("Upload to a discard service") {
        LoopbackServer server(LoopbackServer::Mode::Discard);
        ProbeService::Options options;
        options.uploadPort = server.port();
        ProbeService probes(options);

        auto result = probes.sampleBandwidth("127.0.0.1", 200ms, BandwidthDirection::Upload);
        REQUIRE(result.success);
        REQUIRE(result.bytesTransferred > 0);
    }

    SECTION("No service is Unsupported") {
        ProbeService::Options options;
        options.downloadPort = closedPort();
        ProbeService probes(options);

        auto result = probes.sampleBandwidth("127.0.0.1", 200ms, BandwidthDirection::Download);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ErrorCode::Unsupported);
    }
}

TEST_CASE("ICMP capability check is consistent", "[ProbeService]") {
    ProbeService probes;
    auto result = probes.pingOnce("127.0.0.1", 500ms);

    if (probes.icmpAvailable()) {
        REQUIRE(result.error != ErrorCode::PermissionDenied);
    } else {
        REQUIRE(result.error == ErrorCode::PermissionDenied);
    }
}
