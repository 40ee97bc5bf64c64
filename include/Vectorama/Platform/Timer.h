#pragma once

/**
 * @file Timer.h
 * @brief Latency measurement for the eigen engine
 *
 * One Assemble() call is well under the clock's useful resolution, so the
 * engine is timed in rounds over a batch of matrices and every figure is
 * reported per matrix.
 *
 * @code
 * std::vector<Mat33> batch = ...;
 * LatencyStats s = MeasureBatch(batch.size(),
 *     [&](size_t i) { Invariant::Assemble(batch[i]); }, 200);
 * std::cout << FormatLatency("uniform 3x3", s) << "\n";
 * @endcode
 */

#include <Vectorama/Core/Export.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace Vectorama::Platform {

/**
 * @brief Steady-clock stopwatch, running from construction or Restart()
 */
class VECTORAMA_API Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer() : start_(Clock::now()) {}

    void Restart() { start_ = Clock::now(); }

    double ElapsedUs() const;
    double ElapsedMs() const { return ElapsedUs() / 1000.0; }

private:
    Clock::time_point start_;
};

/**
 * @brief Per-item latency over a number of timed rounds (microseconds)
 */
struct VECTORAMA_API LatencyStats {
    size_t rounds = 0;          ///< Timed rounds
    size_t itemsPerRound = 0;   ///< Matrices processed per round
    double minUs = 0.0;
    double medianUs = 0.0;
    double p95Us = 0.0;
    double maxUs = 0.0;
    double meanUs = 0.0;
};

/**
 * @brief Statistics of round times divided by itemsPerRound
 *
 * p95 is the nearest-rank percentile. Empty input gives all zeros;
 * itemsPerRound == 0 counts as 1.
 */
VECTORAMA_API LatencyStats SummarizeLatency(std::vector<double> roundUs, size_t itemsPerRound);

/**
 * @brief Time rounds of func(0), ..., func(items - 1)
 *
 * warmupRounds untimed rounds run first. Each timed round contributes one
 * sample of (round time / items).
 */
VECTORAMA_API LatencyStats MeasureBatch(size_t items,
                                        const std::function<void(size_t)>& func,
                                        size_t rounds,
                                        size_t warmupRounds = 1);

/**
 * @brief One-line report, e.g.
 *        "uniform 3x3: median 0.412 us/matrix (min 0.398, p95 0.530, max 0.911), 200 x 1000"
 */
VECTORAMA_API std::string FormatLatency(const std::string& name, const LatencyStats& stats);

} // namespace Vectorama::Platform
