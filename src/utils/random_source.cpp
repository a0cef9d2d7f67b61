#include "random_source.hpp"
#include <utility>

namespace optval {

RandomSource::RandomSource(uint64_t seed) : seed_(seed), engine_(seed) {}

void RandomSource::reseed(uint64_t seed) {
    seed_ = seed;
    engine_.seed(seed);
}

double RandomSource::normal(double mean, double stddev) {
    if (!(stddev > 0)) return mean;
    std::normal_distribution<double> dist(mean, stddev);
    return dist(engine_);
}

std::vector<double> RandomSource::normals(size_t n, double mean, double stddev) {
    std::vector<double> samples(n, mean);
    if (!(stddev > 0)) return samples;

    std::normal_distribution<double> dist(mean, stddev);
    for (size_t i = 0; i < n; ++i) samples[i] = dist(engine_);
    return samples;
}

size_t RandomSource::index(size_t n) {
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    return dist(engine_);
}

void RandomSource::shuffle(std::vector<double>& values) {
    if (values.size() < 2) return;
    for (size_t i = values.size() - 1; i > 0; --i) {
        size_t j = index(i + 1);
        std::swap(values[i], values[j]);
    }
}

std::vector<double> RandomSource::resample(const std::vector<double>& values) {
    std::vector<double> sample(values.size());
    if (values.empty()) return sample;
    for (size_t i = 0; i < values.size(); ++i) {
        sample[i] = values[index(values.size())];
    }
    return sample;
}

} // namespace optval
