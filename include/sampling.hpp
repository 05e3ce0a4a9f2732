#pragma once

#include <Eigen/Dense>
#include <boost/random/sobol.hpp>

#include <cstdint>
#include <vector>

// Sobol quasi-random sequence generator
// Joe & Kuo direction numbers (Boost.Random) with Gray code ordering.
// The first point is the origin.
class SobolSequence {
public:
    static constexpr size_t MAX_DIM = boost::random::default_sobol_table::max_dimension;

    // Create generator for given dimension (1-MAX_DIM)
    explicit SobolSequence(size_t dim);

    // Create generator whose points are XOR-ed with one 32-bit shift per dimension
    SobolSequence(size_t dim, const std::vector<uint32_t>& shifts);

    // Generate next point in [0,1)^dim
    std::vector<double> next();

    // Reset sequence to beginning
    void reset();

    // Current index in sequence (0-based)
    size_t index() const;

    size_t dimension() const { return dim_; }

    // First `count` points as a count x dim matrix
    static Eigen::MatrixXd sample(size_t count, size_t dim);
    static Eigen::MatrixXd sample(size_t count, const std::vector<uint32_t>& shifts);

private:
    using Engine = boost::random::sobol_engine<uint32_t, 32>;

    size_t dim_;
    size_t index_;
    std::vector<uint32_t> x_;       // Current point, unshifted
    std::vector<uint32_t> shifts_;  // Digital shift per dimension
    Engine engine_;                 // Points 1, 2, ... of the sequence

    static size_t checkedDimension(size_t dim);
};
