#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/types/PerformanceSample.hpp"

#include <nlohmann/json.hpp>

using namespace lanwatch::core;
using Catch::Matchers::WithinAbs;
using std::chrono::microseconds;

namespace {

ProbeResult echo(std::optional<int64_t> rttUs) {
    auto now = std::chrono::system_clock::now();
    if (rttUs) {
        return ProbeResult::succeeded("192.0.2.1", ProbeKind::Icmp, now, microseconds(*rttUs));
    }
    return ProbeResult::failed("192.0.2.1", ProbeKind::Icmp, now, ErrorCode::Timeout);
}

} // namespace

TEST_CASE("Sample aggregation", "[PerformanceSample]") {
    SECTION("Constant latency has zero jitter") {
        std::vector<ProbeResult> probes(5, echo(10000));
        auto sample = PerformanceSample::fromProbes("192.0.2.1", probes);

        REQUIRE(sample.attempts == 5);
        REQUIRE(sample.successes == 5);
        REQUIRE(sample.latency == microseconds(10000));
        REQUIRE(sample.jitter == microseconds(0));
        REQUIRE(sample.packetLoss == 0.0);
    }

    SECTION("Three of five answered is exactly 0.4 loss") {
        auto sample = PerformanceSample::fromProbes(
            "192.0.2.1", {echo(1000), echo(std::nullopt), echo(3000), echo(std::nullopt), echo(2000)});

        REQUIRE(sample.packetLoss == 0.4);
        REQUIRE(sample.successes == 3);
        REQUIRE(sample.latency == microseconds(2000));
        REQUIRE(sample.minRtt == microseconds(1000));
        REQUIRE(sample.maxRtt == microseconds(3000));
        REQUIRE(sample.lastError == ErrorCode::Timeout);
    }

    SECTION("Jitter is the mean absolute difference of consecutive successes") {
        // |30-10| + |20-30| + |20-20| = 30 over 3 gaps
        auto sample = PerformanceSample::fromProbes(
            "192.0.2.1", {echo(10000), echo(30000), echo(std::nullopt), echo(20000), echo(20000)});
        REQUIRE(sample.jitter == microseconds(10000));
        REQUIRE_THAT(*sample.jitterMs(), WithinAbs(10.0, 1e-9));
    }

    SECTION("All probes failed") {
        std::vector<ProbeResult> probes(4, echo(std::nullopt));
        auto sample = PerformanceSample::fromProbes("192.0.2.1", probes);

        REQUIRE(sample.packetLoss == 1.0);
        REQUIRE_FALSE(sample.latency.has_value());
        REQUIRE_FALSE(sample.jitter.has_value());
        REQUIRE(sample.allFailed());
    }

    SECTION("A single success has latency but no jitter") {
        auto sample = PerformanceSample::fromProbes("192.0.2.1", {echo(std::nullopt), echo(5000)});
        REQUIRE(sample.latency == microseconds(5000));
        REQUIRE_FALSE(sample.jitter.has_value());
        REQUIRE(sample.packetLoss == 0.5);
    }

    SECTION("Bandwidth results do not count as attempts") {
        auto bandwidth = ProbeResult::succeeded("192.0.2.1", ProbeKind::Bandwidth,
                                                std::chrono::system_clock::now(),
                                                microseconds(2000000));
        auto sample = PerformanceSample::fromProbes("192.0.2.1", {echo(1000), bandwidth});
        REQUIRE(sample.attempts == 1);
        REQUIRE_FALSE(sample.bandwidthMbps.has_value());
    }
}

TEST_CASE("Sample summary", "[PerformanceSample]") {
    SECTION("Empty window") {
        auto summary = PerformanceSummary::fromSamples("192.0.2.1", {});
        REQUIRE(summary.sampleCount == 0);
        REQUIRE(summary.availabilityPercent() == 0.0);
        REQUIRE_FALSE(summary.avgLatencyMs.has_value());
    }

    SECTION("Mixed samples") {
        auto up = PerformanceSample::fromProbes("192.0.2.1", {echo(10000), echo(20000)});
        auto down = PerformanceSample::fromProbes("192.0.2.1", {echo(std::nullopt)});
        auto fast = PerformanceSample::fromProbes("192.0.2.1", {echo(5000)});
        fast.bandwidthMbps = 80.0;

        auto summary = PerformanceSummary::fromSamples("192.0.2.1", {up, down, fast});
        REQUIRE(summary.sampleCount == 3);
        REQUIRE(summary.samplesWithData == 2);
        REQUIRE_THAT(summary.availabilityPercent(), WithinAbs(66.6667, 0.001));
        REQUIRE_THAT(*summary.avgLatencyMs, WithinAbs(10.0, 1e-9));
        REQUIRE_THAT(*summary.minLatencyMs, WithinAbs(5.0, 1e-9));
        REQUIRE_THAT(*summary.maxLatencyMs, WithinAbs(15.0, 1e-9));
        REQUIRE_THAT(*summary.avgBandwidthMbps, WithinAbs(80.0, 1e-9));
        REQUIRE_THAT(summary.avgPacketLoss, WithinAbs(1.0 / 3.0, 1e-9));
    }
}

TEST_CASE("Sample JSON keeps absent values null", "[PerformanceSample]") {
    auto sample = PerformanceSample::fromProbes("192.0.2.1", {echo(std::nullopt)});
    nlohmann::json j = sample;
    REQUIRE(j["latency_ms"].is_null());
    REQUIRE(j["jitter_ms"].is_null());
    REQUIRE(j["packet_loss"] == 1.0);
    REQUIRE(j["last_error"] == "Timeout");
}
