#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include "latency_monitor.h"

using Catch::Approx;

TEST_CASE("LatencyMonitor averages the window") {
    LatencyMonitor monitor(4);
    monitor.AddSample(10.0f);
    monitor.AddSample(20.0f);
    monitor.AddSample(30.0f);

    REQUIRE(monitor.GetSampleCount() == 3);
    REQUIRE(monitor.GetAverage() == Approx(20.0f));
    REQUIRE(monitor.GetMin() == Approx(10.0f));
    REQUIRE(monitor.GetMax() == Approx(30.0f));
    REQUIRE(monitor.GetLatest() == Approx(30.0f));
}

TEST_CASE("LatencyMonitor evicts the oldest sample once full") {
    LatencyMonitor monitor(3);
    monitor.AddSample(500.0f);
    monitor.AddSample(10.0f);
    monitor.AddSample(10.0f);
    monitor.AddSample(10.0f);

    REQUIRE(monitor.GetSampleCount() == 3);
    REQUIRE(monitor.GetAverage() == Approx(10.0f));
    REQUIRE(monitor.GetMax() == Approx(10.0f));
}

TEST_CASE("Jitter is the standard deviation of the window") {
    LatencyMonitor monitor;
    monitor.AddSample(40.0f);
    REQUIRE(monitor.GetJitter() == Approx(0.0f));

    monitor.AddSample(60.0f);
    REQUIRE(monitor.GetAverage() == Approx(50.0f));
    REQUIRE(monitor.GetJitter() == Approx(10.0f));
}

TEST_CASE("Invalid samples are ignored") {
    LatencyMonitor monitor;
    monitor.AddSample(-5.0f);
    monitor.AddSample(std::numeric_limits<float>::quiet_NaN());
    monitor.AddSample(std::numeric_limits<float>::infinity());

    REQUIRE_FALSE(monitor.HasSamples());
    REQUIRE(monitor.GetAverage() == Approx(0.0f));
}

TEST_CASE("RecordPong measures the round trip from echoed timestamps") {
    LatencyMonitor monitor;
    REQUIRE(monitor.RecordPong(1000, 1042) == Approx(42.0f));
    REQUIRE(monitor.GetLatest() == Approx(42.0f));
}

TEST_CASE("Reset empties the window") {
    LatencyMonitor monitor;
    monitor.AddSample(25.0f);
    monitor.Reset();

    REQUIRE(monitor.GetSampleCount() == 0);
    REQUIRE(monitor.GetAverage() == Approx(0.0f));
    REQUIRE(monitor.GetCapacity() == NetworkConstants::LATENCY_WINDOW_SIZE);
}
