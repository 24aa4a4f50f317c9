#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "app/Application.hpp"
#include "engine/MonitoringEngine.hpp"
#include "support/FakeNetworkEnvironment.hpp"
#include "support/FakeProbeService.hpp"

#include <atomic>
#include <future>
#include <thread>

using namespace lanwatch;
using namespace lanwatch::core;
using namespace lanwatch::engine;
using lanwatch::testing::FakeNetworkEnvironment;
using lanwatch::testing::FakeProbeService;
using Catch::Matchers::WithinAbs;
using namespace std::chrono_literals;

namespace {

EngineOptions testOptions() {
    EngineOptions options;
    options.discovery.pingTimeout = 200ms;
    options.discovery.portTimeout = 100ms;
    options.discovery.fallbackPorts = {80};
    options.discovery.probeServicePorts = false;
    options.scanConcurrency = 8;
    options.probeTimeout = 20ms;
    options.monitoring.samplesPerTick = 2;
    options.monitoring.sampleSpacing = 0ms;
    options.defaultInterval = 1h;
    options.ioThreads = 2;
    return options;
}

ScanOutcome scanAndWait(MonitoringEngine& engine, const std::string& range) {
    std::promise<ScanOutcome> done;
    auto result = done.get_future();
    REQUIRE(engine.triggerScan(range, [&done](const ScanOutcome& outcome) {
        done.set_value(outcome);
    }));
    REQUIRE(result.wait_for(5s) == std::future_status::ready);
    return result.get();
}

} // namespace

TEST_CASE("Engine scans asynchronously", "[Engine][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    environment.setGateway("192.0.2.1");
    probes.setAnswersIcmp("192.0.2.1", true);
    probes.setAnswersIcmp("192.0.2.7", true);

    MonitoringEngine engine(probes, environment, testOptions());

    SECTION("Results reach the callback and the inventory") {
        auto outcome = scanAndWait(engine, "192.0.2.1-8");

        REQUIRE(outcome.succeeded());
        REQUIRE(outcome.devices.size() == 2);
        REQUIRE(outcome.range == AddressRange::parse("192.0.2.1-8").toString());

        auto inventory = engine.getInventory();
        REQUIRE(inventory.size() == 2);
        REQUIRE(inventory[0].address == "192.0.2.1");
        REQUIRE(inventory[0].deviceClass == DeviceClass::Router);
        REQUIRE(inventory[1].address == "192.0.2.7");
        REQUIRE_FALSE(engine.isScanning());
    }

    SECTION("Malformed range is rejected synchronously") {
        try {
            engine.triggerScan("not-a-range", nullptr);
            FAIL("expected InvalidTarget");
        } catch (const EngineError& e) {
            REQUIRE(e.code() == ErrorCode::InvalidTarget);
        }
        REQUIRE_FALSE(engine.isScanning());
    }

    SECTION("Default range scan") {
        std::promise<ScanOutcome> done;
        auto result = done.get_future();
        REQUIRE(engine.triggerScan([&done](const ScanOutcome& o) { done.set_value(o); }));
        REQUIRE(result.wait_for(10s) == std::future_status::ready);

        auto outcome = result.get();
        REQUIRE(outcome.succeeded());
        REQUIRE(outcome.range == AddressRange::parse("192.0.2.0/24").toString());
        REQUIRE(outcome.devices.size() == 2);
    }
}

TEST_CASE("Engine runs one scan at a time", "[Engine][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    probes.setSleepOnTimeout(true);

    MonitoringEngine engine(probes, environment, testOptions());

    std::promise<void> done;
    auto finished = done.get_future();
    REQUIRE(engine.triggerScan("192.0.2.50", [&done](const ScanOutcome&) { done.set_value(); }));
    REQUIRE_FALSE(engine.triggerScan("192.0.2.51", nullptr));

    REQUIRE(finished.wait_for(5s) == std::future_status::ready);
    REQUIRE(scanAndWait(engine, "192.0.2.51").succeeded());
}

TEST_CASE("Scan failures are reported through the outcome", "[Engine][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    environment.setInterfaces({});

    MonitoringEngine engine(probes, environment, testOptions());

    auto outcome = scanAndWait(engine, "192.0.2.1");
    REQUIRE_FALSE(outcome.succeeded());
    REQUIRE(outcome.error == ErrorCode::DiscoveryFailed);
    REQUIRE_FALSE(outcome.errorMessage.empty());
    REQUIRE_FALSE(engine.isScanning());
    REQUIRE_THROWS_AS(engine.triggerScan(nullptr), EngineError);
}

TEST_CASE("Engine watchlist and history", "[Engine][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    probes.setAnswersIcmp("192.0.2.1", true);

    MonitoringEngine engine(probes, environment, testOptions());
    scanAndWait(engine, "192.0.2.1");

    SECTION("Watching a discovered device mirrors health into the inventory") {
        REQUIRE(engine.addWatch("192.0.2.1"));
        REQUIRE(engine.getWatchlist().size() == 1);
        REQUIRE(engine.getWatchlist()[0].interval == 1h);

        probes.setAnswersIcmp("192.0.2.1", false);
        for (int i = 0; i < 3; ++i) {
            engine.scheduler().runTick("192.0.2.1");
        }
        REQUIRE(engine.getWatchlist()[0].state == HealthState::Offline);
        REQUIRE(engine.getInventory()[0].reachability == Reachability::Offline);
    }

    SECTION("Watching an address that was never discovered") {
        REQUIRE(engine.addWatch("192.0.2.200", 5s));
        auto entry = engine.scheduler().entry("192.0.2.200");
        REQUIRE(entry.has_value());
        REQUIRE(entry->device.name == "Device-200");
        REQUIRE(entry->interval == 5s);
        REQUIRE_FALSE(engine.addWatch("192.0.2.200"));
    }

    SECTION("Invalid address") {
        REQUIRE_THROWS_AS(engine.addWatch("192.0.2.300"), EngineError);
    }

    SECTION("History and summary follow ticks") {
        REQUIRE(engine.addWatch("192.0.2.1"));
        engine.scheduler().runTick("192.0.2.1");
        probes.setAnswersIcmp("192.0.2.1", false);
        engine.scheduler().runTick("192.0.2.1");

        auto history = engine.getHistory("192.0.2.1", 1h);
        REQUIRE(history.size() == 2);
        REQUIRE(history[0].packetLoss == 0.0);
        REQUIRE(history[1].packetLoss == 1.0);

        auto summary = engine.getSummary("192.0.2.1", 1h);
        REQUIRE(summary.sampleCount == 2);
        REQUIRE(summary.samplesWithData == 1);
        REQUIRE_THAT(summary.availabilityPercent(), WithinAbs(50.0, 1e-9));
        REQUIRE_THAT(summary.avgPacketLoss, WithinAbs(0.5, 1e-9));

        REQUIRE(engine.getHistory("192.0.2.99", 1h).empty());
    }

    SECTION("Removing a watch") {
        REQUIRE(engine.addWatch("192.0.2.1"));
        REQUIRE(engine.removeWatch("192.0.2.1"));
        REQUIRE(engine.getWatchlist().empty());
        REQUIRE_FALSE(engine.removeWatch("192.0.2.1"));
    }
}

TEST_CASE("Engine alert subscriptions", "[Engine][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    probes.setAnswersIcmp("192.0.2.1", true);

    MonitoringEngine engine(probes, environment, testOptions());

    int delivered = 0;
    auto id = engine.subscribeAlerts([&delivered](const AlertEvent&) { ++delivered; });

    REQUIRE(engine.addWatch("192.0.2.1"));
    engine.scheduler().runTick("192.0.2.1");
    REQUIRE(delivered == 1);
    REQUIRE(engine.recentAlerts().size() == 1);
    REQUIRE(engine.recentAlerts()[0].newState == HealthState::Online);

    REQUIRE(engine.unsubscribeAlerts(id));
    REQUIRE_FALSE(engine.unsubscribeAlerts(id));

    probes.setAnswersIcmp("192.0.2.1", false);
    for (int i = 0; i < 3; ++i) {
        engine.scheduler().runTick("192.0.2.1");
    }
    REQUIRE(delivered == 1);
    REQUIRE(engine.recentAlerts().size() == 2);
    REQUIRE(engine.recentAlerts(1)[0].newState == HealthState::Offline);
}

TEST_CASE("Configuration maps onto engine options", "[Engine][Application]") {
    infra::AppConfig config;
    config.scan.concurrency = 16;
    config.scan.pingTimeoutMs = 750;
    config.scan.fallbackPorts = {22, 80};
    config.scan.timeBudgetSeconds = 30;
    config.monitoring.defaultIntervalSeconds = 45;
    config.monitoring.samplesPerTick = 3;
    config.monitoring.thresholds.failuresForOffline = 4;
    config.metrics.capacityPerDevice = 100;

    SECTION("Without bandwidth") {
        auto options = app::Application::engineOptions(config);

        REQUIRE(options.scanConcurrency == 16);
        REQUIRE(options.discovery.pingTimeout == 750ms);
        REQUIRE(options.discovery.fallbackPorts == std::vector<uint16_t>{22, 80});
        REQUIRE(options.discovery.timeBudget == 30s);
        REQUIRE(options.defaultInterval == 45s);
        REQUIRE(options.monitoring.samplesPerTick == 3);
        REQUIRE(options.monitoring.thresholds.failuresForOffline == 4);
        REQUIRE(options.metricsCapacity == 100);
        REQUIRE_FALSE(options.monitoring.bandwidth.has_value());
    }

    SECTION("With bandwidth") {
        config.bandwidth.enabled = true;
        config.bandwidth.direction = "upload";
        config.bandwidth.durationMs = 1500;
        config.bandwidth.connectTimeoutMs = 700;
        auto options = app::Application::engineOptions(config);

        REQUIRE(options.monitoring.bandwidth.has_value());
        REQUIRE(options.monitoring.bandwidth->direction == BandwidthDirection::Upload);
        REQUIRE(options.monitoring.bandwidth->duration == 1500ms);
        REQUIRE(options.monitoring.bandwidth->connectTimeout == 700ms);
    }
}

TEST_CASE("A stopped engine refuses new work", "[Engine][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    probes.setAnswersIcmp("192.0.2.1", true);

    MonitoringEngine engine(probes, environment, testOptions());
    REQUIRE(engine.addWatch("192.0.2.1"));

    engine.stop();
    REQUIRE(engine.isStopped());
    REQUIRE(engine.getWatchlist().empty());

    REQUIRE_FALSE(engine.addWatch("192.0.2.10"));
    REQUIRE_FALSE(engine.triggerScan("192.0.2.1", nullptr));
    REQUIRE(engine.getWatchlist().empty());

    engine.stop();
    REQUIRE(engine.getWatchlist().empty());
}

TEST_CASE("Stopping during a scan drops its outcome", "[Engine][integration]") {
    FakeProbeService probes;
    FakeNetworkEnvironment environment;
    probes.setSleepOnTimeout(true);
    probes.setAnswersIcmp("192.0.2.1", true);

    MonitoringEngine engine(probes, environment, testOptions());

    std::atomic<bool> delivered{false};
    REQUIRE(engine.triggerScan("192.0.2.1-2", [&](const ScanOutcome& outcome) {
        delivered = true;
        for (const auto& device : outcome.devices) {
            engine.addWatch(device.address);
        }
    }));

    // Stop once the scan is probing.
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (probes.pingCount() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(probes.pingCount() >= 2);
    engine.stop();

    REQUIRE_FALSE(delivered);
    REQUIRE_FALSE(engine.isScanning());
    REQUIRE(engine.getWatchlist().empty());
}
