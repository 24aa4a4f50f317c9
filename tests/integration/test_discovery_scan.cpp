#include <catch2/catch_test_macros.hpp>

#include "engine/DiscoveryScanner.hpp"
#include "support/FakeNetworkEnvironment.hpp"
#include "support/FakeProbeService.hpp"

#include <algorithm>

using namespace lanwatch::core;
using namespace lanwatch::engine;
using lanwatch::testing::FakeNetworkEnvironment;
using lanwatch::testing::FakeProbeService;
using namespace std::chrono_literals;

namespace {

const Device* findDevice(const std::vector<Device>& devices, const std::string& address) {
    auto it = std::find_if(devices.begin(), devices.end(),
                           [&address](const Device& d) { return d.address == address; });
    return it == devices.end() ? nullptr : &*it;
}

bool hasPort(const Device& device, uint16_t port) {
    return std::find(device.openPorts.begin(), device.openPorts.end(), port) !=
           device.openPorts.end();
}

} // namespace

TEST_CASE("Discovery finds gateway and TCP-only hosts", "[Discovery][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    environment.setGateway("192.0.2.1");
    probes.setAnswersIcmp("192.0.2.1", true);

    FakeProbeService::Host web;
    web.openPorts = {80};
    probes.setHost("192.0.2.2", web);

    DiscoveryScanner scanner(probes, environment);
    auto devices = scanner.scan("192.0.2.0/30", 4);

    REQUIRE(devices.size() == 2);
    REQUIRE(devices[0].address == "192.0.2.1");
    REQUIRE(devices[1].address == "192.0.2.2");

    const auto& gateway = devices[0];
    REQUIRE(gateway.reachability == Reachability::Online);
    REQUIRE(gateway.deviceClass == DeviceClass::Router);
    REQUIRE(gateway.lastRtt.has_value());
    REQUIRE(gateway.lastSeen.has_value());

    const auto& web_host = devices[1];
    REQUIRE(web_host.reachability == Reachability::Online);
    REQUIRE(hasPort(web_host, 80));
    REQUIRE(web_host.name == Device::defaultName("192.0.2.2"));

    REQUIRE(scanner.inventory().size() == 2);
}

TEST_CASE("A /30 sweep marks a silent known host offline", "[Discovery][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    environment.setGateway("192.0.2.1");
    probes.setAnswersIcmp("192.0.2.1", true);
    probes.setAnswersIcmp("192.0.2.3", true);

    FakeProbeService::Host web;
    web.openPorts = {80};
    probes.setHost("192.0.2.2", web);

    DiscoveryScanner scanner(probes, environment);
    auto first = scanner.scan("192.0.2.0/30", 4);
    REQUIRE(first.size() == 3);

    probes.setAnswersIcmp("192.0.2.3", false);
    auto devices = scanner.scan("192.0.2.0/30", 4);

    REQUIRE(devices.size() == 3);
    REQUIRE(devices[0].address == "192.0.2.1");
    REQUIRE(devices[0].deviceClass == DeviceClass::Router);
    REQUIRE(devices[0].reachability == Reachability::Online);
    REQUIRE(devices[1].address == "192.0.2.2");
    REQUIRE(devices[1].reachability == Reachability::Online);
    REQUIRE(hasPort(devices[1], 80));
    REQUIRE(devices[2].address == "192.0.2.3");
    REQUIRE(devices[2].reachability == Reachability::Offline);
}

TEST_CASE("Known devices that stop answering go offline", "[Discovery][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    probes.setAnswersIcmp("192.0.2.3", true);

    DiscoveryScanner scanner(probes, environment);
    auto first = scanner.scan("192.0.2.1-3", 2);
    REQUIRE(first.size() == 1);
    auto firstSeen = first[0].firstSeen;

    probes.setAnswersIcmp("192.0.2.3", false);
    auto second = scanner.scan("192.0.2.1-3", 2);

    REQUIRE(second.size() == 1);
    REQUIRE(second[0].address == "192.0.2.3");
    REQUIRE(second[0].reachability == Reachability::Offline);
    REQUIRE(second[0].firstSeen == firstSeen);

    auto stored = scanner.find("192.0.2.3");
    REQUIRE(stored.has_value());
    REQUIRE(stored->reachability == Reachability::Offline);
    REQUIRE(stored->lastSeen.has_value());

    SECTION("Coming back restores Online") {
        probes.setAnswersIcmp("192.0.2.3", true);
        auto third = scanner.scan("192.0.2.1-3", 2);
        REQUIRE(third.size() == 1);
        REQUIRE(third[0].reachability == Reachability::Online);
        REQUIRE(scanner.inventory().size() == 1);
    }
}

TEST_CASE("Discovery falls back to TCP without ICMP privileges", "[Discovery][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    probes.setIcmpPermitted(false);

    FakeProbeService::Host closed;
    closed.refusedPorts = {443};
    probes.setHost("192.0.2.5", closed);

    FakeProbeService::Host ssh;
    ssh.openPorts = {22};
    probes.setHost("192.0.2.6", ssh);

    DiscoveryScanner scanner(probes, environment);
    auto devices = scanner.scan("192.0.2.4-7", 4);

    REQUIRE(devices.size() == 2);

    const auto* refused = findDevice(devices, "192.0.2.5");
    REQUIRE(refused != nullptr);
    REQUIRE(refused->reachability == Reachability::Online);
    REQUIRE(refused->openPorts.empty());

    const auto* open = findDevice(devices, "192.0.2.6");
    REQUIRE(open != nullptr);
    REQUIRE(hasPort(*open, 22));
}

TEST_CASE("Discovery enriches devices from the environment", "[Discovery][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    probes.setAnswersIcmp("192.0.2.20", true);
    environment.addNeighbor("192.0.2.20", "AA:BB:CC:00:11:22");
    environment.addName("192.0.2.20", "kitchen-speaker.lan");

    SECTION("Hostname becomes the display name") {
        DiscoveryScanner scanner(probes, environment);
        auto devices = scanner.scan("192.0.2.20", 1);

        REQUIRE(devices.size() == 1);
        REQUIRE(devices[0].macAddress == std::optional<std::string>("AA:BB:CC:00:11:22"));
        REQUIRE(devices[0].hostname == std::optional<std::string>("kitchen-speaker.lan"));
        REQUIRE(devices[0].name == "kitchen-speaker.lan");
    }

    SECTION("Resolution can be disabled") {
        DiscoveryScanner::Options options;
        options.resolveHostnames = false;
        DiscoveryScanner scanner(probes, environment, options);
        auto devices = scanner.scan("192.0.2.20", 1);

        REQUIRE(devices.size() == 1);
        REQUIRE_FALSE(devices[0].hostname.has_value());
        REQUIRE(devices[0].name == "Device-20");
    }
}

TEST_CASE("Discovery respects its time budget", "[Discovery][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    probes.setSleepOnTimeout(true);

    DiscoveryScanner::Options options;
    options.pingTimeout = 100ms;
    options.portTimeout = 50ms;
    options.fallbackPorts = {80};
    options.timeBudget = 300ms;
    DiscoveryScanner scanner(probes, environment, options);

    auto started = std::chrono::steady_clock::now();
    auto devices = scanner.scan("192.0.2.0/24", 4);
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(devices.empty());
    REQUIRE(elapsed < 2s);
    // Far fewer than 254 addresses fit into the budget.
    REQUIRE(probes.pingCount() < 254);
}

TEST_CASE("A slow resolver cannot stretch the time budget", "[Discovery][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    probes.setAnswersIcmp("192.0.2.30", true);
    environment.addName("192.0.2.30", "nas.lan");
    environment.setLookupDelay(5s);

    DiscoveryScanner::Options options;
    options.probeServicePorts = false;
    options.timeBudget = 300ms;
    DiscoveryScanner scanner(probes, environment, options);

    auto started = std::chrono::steady_clock::now();
    auto devices = scanner.scan("192.0.2.30", 1);
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < 2s);
    REQUIRE(devices.size() == 1);
    REQUIRE(devices[0].reachability == Reachability::Online);
    REQUIRE_FALSE(devices[0].hostname.has_value());
    REQUIRE(devices[0].name == "Device-30");
}

TEST_CASE("Discovery argument and environment errors", "[Discovery][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    DiscoveryScanner scanner(probes, environment);

    SECTION("Malformed range") {
        try {
            scanner.scan("192.0.2.0/33", 4);
            FAIL("expected InvalidTarget");
        } catch (const EngineError& e) {
            REQUIRE(e.code() == ErrorCode::InvalidTarget);
        }
    }

    SECTION("Zero concurrency") {
        try {
            scanner.scan("192.0.2.1", 0);
            FAIL("expected InvalidConfiguration");
        } catch (const EngineError& e) {
            REQUIRE(e.code() == ErrorCode::InvalidConfiguration);
        }
    }

    SECTION("No usable interface") {
        NetworkInterface loopback;
        loopback.name = "lo";
        loopback.ipAddress = "127.0.0.1";
        loopback.netmask = "255.0.0.0";
        loopback.isUp = true;
        loopback.isLoopback = true;
        environment.setInterfaces({loopback});

        try {
            scanner.scan("192.0.2.1", 1);
            FAIL("expected DiscoveryFailed");
        } catch (const EngineError& e) {
            REQUIRE(e.code() == ErrorCode::DiscoveryFailed);
        }
        REQUIRE_THROWS_AS(scanner.defaultRange(), EngineError);
    }

    SECTION("Default range follows the interface subnet") {
        REQUIRE(scanner.defaultRange() == AddressRange::parse("192.0.2.0/24"));
    }
}
