#include "sampling.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

// Maximum number of bits for Sobol sequence
static constexpr size_t MAX_BITS = 32;
static constexpr double SOBOL_SCALE = 1.0 / static_cast<double>(1ULL << MAX_BITS);

SobolSequence::SobolSequence(size_t dim)
    : SobolSequence(dim, std::vector<uint32_t>(dim, 0U)) {}

SobolSequence::SobolSequence(size_t dim, const std::vector<uint32_t>& shifts)
    : dim_(dim), index_(0), x_(dim, 0), shifts_(shifts), engine_(checkedDimension(dim)) {
    if (shifts_.size() != dim) {
        throw std::invalid_argument("SobolSequence: expected " + std::to_string(dim) +
                                    " shifts, got " + std::to_string(shifts_.size()));
    }
}

size_t SobolSequence::checkedDimension(size_t dim) {
    if (dim < 1 || dim > MAX_DIM) {
        throw std::invalid_argument("SobolSequence: dimension must be 1-" +
                                    std::to_string(MAX_DIM) + ", got " + std::to_string(dim));
    }
    return dim;
}

std::vector<double> SobolSequence::next() {
    std::vector<double> result(dim_);

    if (index_ >= (1ULL << MAX_BITS)) {
        throw std::runtime_error("SobolSequence: exhausted 2^32 points");
    }

    // The engine starts after the origin, so index 0 is served from the zero state
    if (index_ > 0) {
        engine_.generate(x_.begin(), x_.end());
    }

    for (size_t d = 0; d < dim_; ++d) {
        // Convert to [0,1) by dividing by 2^32
        result[d] = static_cast<double>(x_[d] ^ shifts_[d]) * SOBOL_SCALE;
    }

    index_++;
    return result;
}

void SobolSequence::reset() {
    index_ = 0;
    std::fill(x_.begin(), x_.end(), 0);
    engine_.seed();
}

size_t SobolSequence::index() const {
    return index_;
}

Eigen::MatrixXd SobolSequence::sample(size_t count, size_t dim) {
    return sample(count, std::vector<uint32_t>(dim, 0U));
}

Eigen::MatrixXd SobolSequence::sample(size_t count, const std::vector<uint32_t>& shifts) {
    SobolSequence seq(shifts.size(), shifts);
    Eigen::MatrixXd points(static_cast<Eigen::Index>(count),
                           static_cast<Eigen::Index>(shifts.size()));
    for (size_t i = 0; i < count; ++i) {
        std::vector<double> pt = seq.next();
        for (size_t d = 0; d < pt.size(); ++d) {
            points(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(d)) = pt[d];
        }
    }
    return points;
}
