#pragma once

/**
 * @file Random.h
 * @brief Random number generation for randomized tests and benchmarks
 *
 * Used to sample matrices for the eigen engine:
 * - Uniform entries (generic, almost surely distinct eigenvalues)
 * - Grid entries (small integers / halves, frequently degenerate spectra)
 */

#include <Vectorama/Core/Export.h>

#include <cstdint>
#include <random>

namespace Vectorama::Platform {

/**
 * @brief Thread-local random generator
 *
 * Uses MT19937-64. Each thread has its own instance, so concurrent use
 * needs no locking.
 */
class VECTORAMA_API Random {
public:
    /**
     * @brief Get thread-local random instance
     */
    static Random& Instance();

    /**
     * @brief Reseed the current thread's generator for reproducibility
     */
    void SetSeed(uint64_t seed);

    uint64_t GetSeed() const { return seed_; }

    /**
     * @brief Random integer in range [min, max] (inclusive)
     */
    int32_t Int(int32_t min, int32_t max);

    /**
     * @brief Random double in [min, max)
     */
    double Double(double min, double max);

    /**
     * @brief Random value on the grid {min, min + step, ..., <= max}
     *
     * Matrices drawn this way hit repeated eigenvalues, zero rows and
     * exact singularities far more often than uniform sampling.
     */
    double Grid(double min, double max, double step);

private:
    Random();
    Random(const Random&) = delete;
    Random& operator=(const Random&) = delete;

    std::mt19937_64 gen_;
    uint64_t seed_;
};

/**
 * @brief Set random seed for reproducibility
 */
inline void SetRandomSeed(uint64_t seed) {
    Random::Instance().SetSeed(seed);
}

} // namespace Vectorama::Platform
