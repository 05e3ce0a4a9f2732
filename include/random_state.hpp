#pragma once

#include <cstdint>
#include <optional>
#include <random>

// Seedable pseudo-random generator state shared by the samplers and the
// bootstrap. Not thread safe: concurrent users must serialize access.
class RandomState {
public:
    // Seeded from std::random_device
    RandomState();

    explicit RandomState(uint64_t seed);

    // Reset to a deterministic state
    void seed(uint64_t s);

    // Reseed only when a seed is given
    void seed(const std::optional<uint64_t>& s) {
        if (s) seed(*s);
    }

    // Uniform draw in [low, high)
    double uniform(double low, double high);

    // Uniform integer draw in [0, n)
    size_t index(size_t n);

    uint32_t bits32();

    std::mt19937_64& engine() { return engine_; }

    // Process-wide default instance, for the outermost call boundary only
    static RandomState& global();

private:
    std::mt19937_64 engine_;
};
