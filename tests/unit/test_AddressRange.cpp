#include <catch2/catch_test_macros.hpp>

#include "core/types/AddressRange.hpp"
#include "core/types/Error.hpp"

using namespace lanwatch::core;

namespace {

ErrorCode parseError(const std::string& spec) {
    try {
        AddressRange::parse(spec);
    } catch (const EngineError& e) {
        return e.code();
    }
    FAIL("expected EngineError for '" << spec << "'");
    return ErrorCode::Timeout;
}

} // namespace

TEST_CASE("IPv4 parsing", "[AddressRange]") {
    SECTION("Valid addresses") {
        REQUIRE(parseIpv4("192.168.1.10") == 0xC0A8010Au);
        REQUIRE(parseIpv4("0.0.0.0") == 0u);
        REQUIRE(parseIpv4("255.255.255.255") == 0xFFFFFFFFu);
    }

    SECTION("Malformed addresses") {
        REQUIRE_FALSE(parseIpv4("").has_value());
        REQUIRE_FALSE(parseIpv4("192.168.1").has_value());
        REQUIRE_FALSE(parseIpv4("192.168.1.256").has_value());
        REQUIRE_FALSE(parseIpv4("192.168.1.1.1").has_value());
        REQUIRE_FALSE(parseIpv4("192.168..1").has_value());
        REQUIRE_FALSE(parseIpv4("a.b.c.d").has_value());
        REQUIRE_FALSE(parseIpv4("-1.2.3.4").has_value());
    }

    SECTION("Formatting") {
        REQUIRE(formatIpv4(0xC0000201u) == "192.0.2.1");
        REQUIRE(formatIpv4(*parseIpv4("10.20.30.40")) == "10.20.30.40");
    }
}

TEST_CASE("AddressRange CIDR notation", "[AddressRange]") {
    SECTION("/30 excludes only the network address") {
        auto range = AddressRange::parse("192.0.2.0/30");
        REQUIRE(range.addresses() ==
                std::vector<std::string>{"192.0.2.1", "192.0.2.2", "192.0.2.3"});
        REQUIRE(range.contains("192.0.2.3"));
        REQUIRE_FALSE(range.contains("192.0.2.0"));
    }

    SECTION("/29 excludes network and broadcast") {
        auto range = AddressRange::parse("192.0.2.0/29");
        REQUIRE(formatIpv4(range.first()) == "192.0.2.1");
        REQUIRE(formatIpv4(range.last()) == "192.0.2.6");
    }

    SECTION("/24 has 254 hosts") {
        auto range = AddressRange::parse("192.168.1.77/24");
        REQUIRE(range.size() == 254);
        REQUIRE(formatIpv4(range.first()) == "192.168.1.1");
        REQUIRE(formatIpv4(range.last()) == "192.168.1.254");
    }

    SECTION("/31 and /32 keep every address") {
        REQUIRE(AddressRange::parse("10.0.0.0/31").size() == 2);
        REQUIRE(AddressRange::parse("10.0.0.5/32").addresses() ==
                std::vector<std::string>{"10.0.0.5"});
    }

    SECTION("Ranges wider than /16 are rejected") {
        REQUIRE(AddressRange::parse("10.0.0.0/16").size() == 65534);
        REQUIRE(parseError("10.0.0.0/15") == ErrorCode::InvalidTarget);
    }

    SECTION("Malformed prefix") {
        REQUIRE(parseError("10.0.0.0/33") == ErrorCode::InvalidTarget);
        REQUIRE(parseError("10.0.0.0/") == ErrorCode::InvalidTarget);
    }
}

TEST_CASE("AddressRange dash notation", "[AddressRange]") {
    SECTION("Last-octet range") {
        auto range = AddressRange::parse("192.168.1.10-12");
        REQUIRE(range.addresses() ==
                std::vector<std::string>{"192.168.1.10", "192.168.1.11", "192.168.1.12"});
    }

    SECTION("Full range across an octet boundary") {
        auto range = AddressRange::parse("10.0.0.254 - 10.0.1.1");
        REQUIRE(range.size() == 4);
        REQUIRE(range.contains("10.0.0.255"));
        REQUIRE(range.contains("10.0.1.0"));
    }

    SECTION("Reversed range") {
        REQUIRE(parseError("192.168.1.20-10") == ErrorCode::InvalidTarget);
    }

    SECTION("Single address") {
        auto range = AddressRange::parse(" 172.16.0.1 ");
        REQUIRE(range.size() == 1);
        REQUIRE(range.toString().find("172.16.0.1") != std::string::npos);
    }

    SECTION("Garbage") {
        REQUIRE(parseError("not-an-address") == ErrorCode::InvalidTarget);
        REQUIRE(parseError("") == ErrorCode::InvalidTarget);
    }
}

TEST_CASE("AddressRange from interface", "[AddressRange]") {
    SECTION("Uses the interface subnet") {
        auto range = AddressRange::fromInterface("192.168.5.20", "255.255.255.0");
        REQUIRE(range == AddressRange::parse("192.168.5.0/24"));
    }

    SECTION("Narrows wide subnets to /24") {
        auto range = AddressRange::fromInterface("10.1.2.3", "255.0.0.0");
        REQUIRE(range == AddressRange::parse("10.1.2.0/24"));
    }

    SECTION("Keeps narrower subnets") {
        auto range = AddressRange::fromInterface("10.1.2.3", "255.255.255.252");
        REQUIRE(range.size() == 2);
    }

    SECTION("Malformed netmask") {
        REQUIRE_THROWS_AS(AddressRange::fromInterface("10.1.2.3", "bogus"), EngineError);
    }
}
