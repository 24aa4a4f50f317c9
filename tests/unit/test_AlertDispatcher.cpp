#include <catch2/catch_test_macros.hpp>

#include "engine/AlertDispatcher.hpp"

#include <stdexcept>

using namespace lanwatch::core;
using namespace lanwatch::engine;

namespace {

AlertEvent makeAlert(const std::string& address, HealthState newState) {
    Device device;
    device.address = address;
    device.name = "host " + address;
    PerformanceSample sample;
    sample.address = address;
    return AlertEvent::forTransition(device, HealthState::Online, newState, sample);
}

} // namespace

TEST_CASE("Dispatcher delivers to every subscriber", "[AlertDispatcher]") {
    AlertDispatcher dispatcher;
    int first = 0;
    int second = 0;

    dispatcher.subscribe([&first](const AlertEvent&) { ++first; });
    dispatcher.subscribe([&second](const AlertEvent&) { ++second; });
    REQUIRE(dispatcher.subscriberCount() == 2);

    dispatcher.publish(makeAlert("192.0.2.1", HealthState::Offline));
    REQUIRE(first == 1);
    REQUIRE(second == 1);
}

TEST_CASE("A throwing subscriber does not block the others", "[AlertDispatcher]") {
    AlertDispatcher dispatcher;
    int delivered = 0;

    dispatcher.subscribe([](const AlertEvent&) { throw std::runtime_error("subscriber broke"); });
    dispatcher.subscribe([&delivered](const AlertEvent&) { ++delivered; });

    REQUIRE_NOTHROW(dispatcher.publish(makeAlert("192.0.2.1", HealthState::Offline)));
    REQUIRE(delivered == 1);
}

TEST_CASE("Unsubscribe", "[AlertDispatcher]") {
    AlertDispatcher dispatcher;
    int delivered = 0;

    auto id = dispatcher.subscribe([&delivered](const AlertEvent&) { ++delivered; });
    REQUIRE(dispatcher.unsubscribe(id));
    REQUIRE_FALSE(dispatcher.unsubscribe(id));

    dispatcher.publish(makeAlert("192.0.2.1", HealthState::Offline));
    REQUIRE(delivered == 0);

    dispatcher.subscribe([&delivered](const AlertEvent&) { ++delivered; });
    dispatcher.unsubscribeAll();
    REQUIRE(dispatcher.subscriberCount() == 0);
}

TEST_CASE("Recent alerts log", "[AlertDispatcher]") {
    AlertDispatcher dispatcher(3);

    for (int i = 1; i <= 5; ++i) {
        dispatcher.publish(makeAlert("192.0.2." + std::to_string(i),
                                     i % 2 == 0 ? HealthState::Degraded : HealthState::Offline));
    }

    SECTION("Bounded and newest first") {
        auto recent = dispatcher.recentAlerts();
        REQUIRE(recent.size() == 3);
        REQUIRE(recent[0].address == "192.0.2.5");
        REQUIRE(recent[2].address == "192.0.2.3");
        REQUIRE(recent[0].id > recent[1].id);
    }

    SECTION("Limit") {
        REQUIRE(dispatcher.recentAlerts(1).size() == 1);
    }

    SECTION("Filtered") {
        AlertFilter filter;
        filter.newState = HealthState::Degraded;
        auto degraded = dispatcher.filteredAlerts(filter);
        REQUIRE(degraded.size() == 1);
        REQUIRE(degraded[0].address == "192.0.2.4");
    }
}
