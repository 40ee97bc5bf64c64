/**
 * @file invariant_benchmark.cpp
 * @brief Timing of the eigen engine on presets and random matrices
 *
 * Usage: invariant_benchmark [rounds] [seed]
 */

#include <Vectorama/Vectorama.h>
#include <Vectorama/Platform/Random.h>
#include <Vectorama/Platform/Timer.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace Vectorama;
using namespace Vectorama::Invariant;
using namespace Vectorama::Platform;
using namespace Vectorama::Transform;

namespace {

void PrintSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n";
}

template<int N>
std::vector<Internal::Mat<N>> SampleMatrices(size_t count, bool grid) {
    Random& rng = Random::Instance();
    std::vector<Internal::Mat<N>> matrices(count);
    for (auto& A : matrices) {
        for (int i = 0; i < N; ++i) {
            for (int j = 0; j < N; ++j) {
                A(i, j) = grid ? rng.Grid(-2.0, 2.0, 0.5) : rng.Double(-5.0, 5.0);
            }
        }
    }
    return matrices;
}

// Times Assemble per matrix over the batch, then reports objects per matrix
template<int N>
void BenchmarkBatch(const std::string& name, const std::vector<Internal::Mat<N>>& batch,
                    size_t rounds) {
    size_t objects = 0;
    LatencyStats stats = MeasureBatch(batch.size(), [&](size_t i) {
        objects += Assemble(batch[i]).size();
    }, rounds);

    std::cout << FormatLatency(name, stats) << "\n";
    // Warmup adds one untimed round
    std::cout << "  Objects/matrix: "
              << static_cast<double>(objects) / static_cast<double>(batch.size() * (rounds + 1))
              << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    size_t rounds = 200;
    uint64_t seed = 42;
    if (argc > 1) rounds = std::strtoul(argv[1], nullptr, 10);
    if (argc > 2) seed = std::strtoull(argv[2], nullptr, 10);

    std::cout << "=== Vectorama Benchmark " << GetVersion() << " ===\n";
    SetRandomSeed(seed);
    std::cout << "Rounds: " << rounds << ", seed: " << Random::Instance().GetSeed() << "\n";

    PrintSeparator("Presets");
    for (PresetKind kind : AllPresets()) {
        Mat33 A = Preset3x3(kind);
        LatencyStats stats = MeasureBatch(1, [&](size_t) { Assemble(A); }, rounds * 10);
        std::cout << FormatLatency(std::string(PresetName(kind)) + " 3x3", stats) << "\n";
    }

    PrintSeparator("Random 2x2");
    BenchmarkBatch("uniform 2x2", SampleMatrices<2>(1000, false), rounds);
    BenchmarkBatch("grid 2x2", SampleMatrices<2>(1000, true), rounds);

    PrintSeparator("Random 3x3");
    BenchmarkBatch("uniform 3x3", SampleMatrices<3>(1000, false), rounds);
    BenchmarkBatch("grid 3x3", SampleMatrices<3>(1000, true), rounds);

    return 0;
}
