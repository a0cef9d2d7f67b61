#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace optval {

// Seeded pseudo-random source owned by each simulator instance.
// Two sources built from the same seed produce identical streams.
class RandomSource {
public:
    explicit RandomSource(uint64_t seed = 42);

    void reseed(uint64_t seed);
    uint64_t seed() const { return seed_; }

    // A non-positive stddev yields the mean
    double normal(double mean = 0.0, double stddev = 1.0);
    std::vector<double> normals(size_t n, double mean = 0.0, double stddev = 1.0);

    // Uniform index in [0, n)
    size_t index(size_t n);

    // Fisher-Yates permutation in place
    void shuffle(std::vector<double>& values);

    // n draws with replacement from values
    std::vector<double> resample(const std::vector<double>& values);

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

} // namespace optval
