/**
 * @file Random.cpp
 * @brief Random number generation implementation
 */

#include <Vectorama/Platform/Random.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <thread>

namespace Vectorama::Platform {

Random& Random::Instance() {
    thread_local Random instance;
    return instance;
}

Random::Random() {
    // Time combined with thread ID so threads start on different streams
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::high_resolution_clock::now().time_since_epoch()).count();
    uint64_t threadHash = std::hash<std::thread::id>{}(std::this_thread::get_id());

    seed_ = static_cast<uint64_t>(nanos) ^ threadHash;
    gen_.seed(seed_);
}

void Random::SetSeed(uint64_t seed) {
    seed_ = seed;
    gen_.seed(seed);
}

int32_t Random::Int(int32_t min, int32_t max) {
    if (min > max) {
        std::swap(min, max);
    }
    std::uniform_int_distribution<int32_t> dist(min, max);
    return dist(gen_);
}

double Random::Double(double min, double max) {
    if (min > max) {
        std::swap(min, max);
    }
    std::uniform_real_distribution<double> dist(min, max);
    return dist(gen_);
}

double Random::Grid(double min, double max, double step) {
    if (min > max) {
        std::swap(min, max);
    }
    if (step <= 0.0) {
        return min;
    }
    int32_t steps = static_cast<int32_t>(std::floor((max - min) / step + 1e-9));
    return min + step * Int(0, steps);
}

} // namespace Vectorama::Platform
