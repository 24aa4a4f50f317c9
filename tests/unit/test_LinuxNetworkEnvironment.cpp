#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/LinuxNetworkEnvironment.hpp"

#include <arpa/inet.h>

#include <chrono>
#include <cstdio>
#include <sstream>

using namespace lanwatch::infra;
using namespace std::chrono_literals;

namespace {

// Formats an address the way /proc/net/route prints it on this host.
std::string routeWord(const char* address) {
    struct in_addr addr {};
    inet_pton(AF_INET, address, &addr);
    char text[9];
    std::snprintf(text, sizeof(text), "%08X", static_cast<unsigned>(addr.s_addr));
    return text;
}

const std::string kRouteHeader =
    "Iface\tDestination\tGateway \tFlags\tRefCnt\tUse\tMetric\tMask\t\tMTU\tWindow\tIRTT\n";

std::string routeLine(const std::string& destination, const std::string& gateway,
                      const std::string& flags) {
    return "eth0\t" + destination + "\t" + gateway + "\t" + flags +
           "\t0\t0\t100\t00000000\t0\t0\t0\n";
}

} // namespace

TEST_CASE("Neighbour table parsing", "[LinuxNetworkEnvironment]") {
    std::istringstream arp(
        "IP address       HW type     Flags       HW address            Mask     Device\n"
        "192.168.1.1      0x1         0x2         AA:BB:CC:00:11:22     *        eth0\n"
        "192.168.1.20     0x1         0x0         00:00:00:00:00:00     *        eth0\n"
        "192.168.1.30     0x1         0x2         00:00:00:00:00:00     *        eth0\n"
        "192.168.1.40     0x1         0x6         b8:27:eb:01:02:03     *        eth0\n"
        "garbage\n");

    auto table = LinuxNetworkEnvironment::parseNeighborTable(arp);

    REQUIRE(table.size() == 2);
    REQUIRE(table.at("192.168.1.1") == "aa:bb:cc:00:11:22");
    REQUIRE(table.at("192.168.1.40") == "b8:27:eb:01:02:03");
    REQUIRE(table.count("192.168.1.20") == 0);
}

TEST_CASE("Default gateway parsing", "[LinuxNetworkEnvironment]") {
    SECTION("Picks the default route") {
        std::istringstream route(kRouteHeader +
                                 routeLine(routeWord("192.168.1.0"), "00000000", "0001") +
                                 routeLine("00000000", routeWord("192.168.1.1"), "0003"));

        REQUIRE(LinuxNetworkEnvironment::parseDefaultGateway(route) == "192.168.1.1");
    }

    SECTION("Gateway octets keep their order on any host") {
        std::istringstream route(kRouteHeader +
                                 routeLine("00000000", routeWord("10.0.200.138"), "0003"));
        REQUIRE(LinuxNetworkEnvironment::parseDefaultGateway(route) == "10.0.200.138");
    }

    SECTION("No default route") {
        std::istringstream route(
            "Iface\tDestination\tGateway \tFlags\tRefCnt\tUse\tMetric\tMask\t\tMTU\tWindow\tIRTT\n"
            "eth0\t0001A8C0\t00000000\t0001\t0\t0\t100\t00FFFFFF\t0\t0\t0\n");

        REQUIRE_FALSE(LinuxNetworkEnvironment::parseDefaultGateway(route).has_value());
    }

    SECTION("Down routes are ignored") {
        std::istringstream route(kRouteHeader +
                                 routeLine("00000000", routeWord("192.168.1.1"), "0002"));

        REQUIRE_FALSE(LinuxNetworkEnvironment::parseDefaultGateway(route).has_value());
    }
}

TEST_CASE("Reverse lookup is bounded by its timeout", "[LinuxNetworkEnvironment]") {
    LinuxNetworkEnvironment environment;

    SECTION("Zero timeout returns at once") {
        auto started = std::chrono::steady_clock::now();
        REQUIRE_FALSE(environment.reverseLookup("192.0.2.1", 0ms).has_value());
        REQUIRE(std::chrono::steady_clock::now() - started < 100ms);
    }

    SECTION("Malformed address") {
        REQUIRE_FALSE(environment.reverseLookup("not-an-address", 500ms).has_value());
    }

    SECTION("Returns within the timeout") {
        auto started = std::chrono::steady_clock::now();
        (void)environment.reverseLookup("192.0.2.1", 200ms);
        REQUIRE(std::chrono::steady_clock::now() - started < 1s);
    }
}
