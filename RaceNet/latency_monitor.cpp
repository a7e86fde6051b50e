#include "latency_monitor.h"
#include "utils.h"
#include <algorithm>
#include <cmath>

LatencyMonitor::LatencyMonitor(std::size_t capacity)
    : capacity(std::max<std::size_t>(capacity, 1)), averageRTT(0), jitter(0), minRTT(0), maxRTT(0) {
}

void LatencyMonitor::AddSample(float rttMs) {
    if (!std::isfinite(rttMs) || rttMs < 0.0f) {
        Utils::printMsg("Ignoring invalid RTT sample: " + std::to_string(rttMs), debug);
        return;
    }

    samples.push_back(rttMs);
    while (samples.size() > capacity) {
        samples.pop_front();
    }

    UpdateStatistics();
}

float LatencyMonitor::RecordPong(int64_t sentTimestamp, int64_t receivedTimestamp) {
    float rtt = static_cast<float>(receivedTimestamp - sentTimestamp);
    AddSample(rtt);
    return rtt;
}

void LatencyMonitor::Reset() {
    samples.clear();
    averageRTT = 0;
    jitter = 0;
    minRTT = 0;
    maxRTT = 0;
}

void LatencyMonitor::UpdateStatistics() {
    // Min/max cover the window only, so an old spike ages out
    auto [lowest, highest] = std::minmax_element(samples.begin(), samples.end());
    minRTT = *lowest;
    maxRTT = *highest;

    float total = 0;
    for (float rtt : samples) {
        total += rtt;
    }
    averageRTT = total / samples.size();

    // Jitter: standard deviation of the window
    jitter = 0;
    if (samples.size() > 1) {
        float variance = 0;
        for (float rtt : samples) {
            float diff = rtt - averageRTT;
            variance += diff * diff;
        }
        jitter = std::sqrt(variance / samples.size());
    }
}
