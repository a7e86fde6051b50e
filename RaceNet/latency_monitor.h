#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include "network_constants.h"

// Rolling window of ping round-trip times (milliseconds).
// When full, the oldest sample is evicted.
class LatencyMonitor {
public:
    explicit LatencyMonitor(std::size_t capacity = NetworkConstants::LATENCY_WINDOW_SIZE);

    // Ignores negative or non-finite samples
    void AddSample(float rttMs);

    // Computes the round trip of a PING_RESPONSE and records it. Returns the RTT.
    float RecordPong(int64_t sentTimestamp, int64_t receivedTimestamp);

    void Reset();

    // Current latency estimate: the window average (0 when empty)
    float GetAverage() const { return averageRTT; }
    float GetJitter() const { return jitter; }
    float GetMin() const { return minRTT; }
    float GetMax() const { return maxRTT; }
    float GetLatest() const { return samples.empty() ? 0.0f : samples.back(); }

    std::size_t GetSampleCount() const { return samples.size(); }
    std::size_t GetCapacity() const { return capacity; }
    bool HasSamples() const { return !samples.empty(); }

private:
    void UpdateStatistics();

    std::deque<float> samples;
    std::size_t capacity;
    float averageRTT;
    float jitter;
    float minRTT;
    float maxRTT;
};
