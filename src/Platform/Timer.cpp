/**
 * @file Timer.cpp
 * @brief Batch latency measurement
 */

#include <Vectorama/Platform/Timer.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <numeric>
#include <utility>

namespace Vectorama::Platform {

double Timer::ElapsedUs() const {
    return std::chrono::duration<double, std::micro>(Clock::now() - start_).count();
}

// ============================================================================
// Latency Statistics
// ============================================================================

LatencyStats SummarizeLatency(std::vector<double> roundUs, size_t itemsPerRound) {
    LatencyStats stats;
    stats.rounds = roundUs.size();
    stats.itemsPerRound = itemsPerRound;
    if (roundUs.empty()) {
        return stats;
    }

    const double perItem = 1.0 / static_cast<double>(std::max<size_t>(itemsPerRound, 1));
    for (double& t : roundUs) {
        t *= perItem;
    }
    std::sort(roundUs.begin(), roundUs.end());

    const size_t n = roundUs.size();
    stats.minUs = roundUs.front();
    stats.maxUs = roundUs.back();
    stats.meanUs = std::accumulate(roundUs.begin(), roundUs.end(), 0.0) / static_cast<double>(n);
    stats.medianUs = (n % 2 == 0) ? (roundUs[n / 2 - 1] + roundUs[n / 2]) / 2.0 : roundUs[n / 2];

    size_t rank = static_cast<size_t>(std::ceil(0.95 * static_cast<double>(n)));
    stats.p95Us = roundUs[std::clamp<size_t>(rank, 1, n) - 1];
    return stats;
}

LatencyStats MeasureBatch(size_t items, const std::function<void(size_t)>& func,
                          size_t rounds, size_t warmupRounds) {
    for (size_t w = 0; w < warmupRounds; ++w) {
        for (size_t i = 0; i < items; ++i) {
            func(i);
        }
    }

    std::vector<double> roundUs;
    roundUs.reserve(rounds);
    Timer timer;
    for (size_t r = 0; r < rounds; ++r) {
        timer.Restart();
        for (size_t i = 0; i < items; ++i) {
            func(i);
        }
        roundUs.push_back(timer.ElapsedUs());
    }
    return SummarizeLatency(std::move(roundUs), items);
}

std::string FormatLatency(const std::string& name, const LatencyStats& stats) {
    char buf[160];
    std::snprintf(buf, sizeof(buf),
                  ": median %.3f us/matrix (min %.3f, p95 %.3f, max %.3f), %zu x %zu",
                  stats.medianUs, stats.minUs, stats.p95Us, stats.maxUs,
                  stats.rounds, stats.itemsPerRound);
    return name + buf;
}

} // namespace Vectorama::Platform
