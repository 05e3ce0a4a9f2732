#include "random_state.hpp"

#include <cmath>
#include <stdexcept>

RandomState::RandomState() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    engine_.seed(seq);
}

RandomState::RandomState(uint64_t seed) : engine_(seed) {}

void RandomState::seed(uint64_t s) {
    engine_.seed(s);
}

double RandomState::uniform(double low, double high) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    double u = dist(engine_);
    // generate_canonical may round up to 1.0
    if (u >= 1.0) {
        u = std::nextafter(1.0, 0.0);
    }
    return low + u * (high - low);
}

size_t RandomState::index(size_t n) {
    if (n == 0) {
        throw std::invalid_argument("RandomState::index: range must be non-empty");
    }
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    return dist(engine_);
}

uint32_t RandomState::bits32() {
    return static_cast<uint32_t>(engine_() >> 32);
}

RandomState& RandomState::global() {
    static RandomState instance;
    return instance;
}
