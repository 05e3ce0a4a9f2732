#pragma once

#include "problem.hpp"
#include "random_state.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <optional>

// Latin hypercube design in [0,1)^D: each column holds exactly one value in
// each of the N strata [j/N, (j+1)/N), in random order.
Eigen::MatrixXd latinUnitSample(int num_vars, int N, RandomState& rng);

// Latin hypercube sample of N points scaled to the problem's bounds (or
// distributions when the problem defines them). Returns an N x D matrix.
Eigen::MatrixXd latinSample(const Problem& problem, int N, RandomState& rng);

// Same, drawing from RandomState::global(), reseeded first when a seed is given
Eigen::MatrixXd latinSample(const Problem& problem, int N,
                            std::optional<uint64_t> seed = std::nullopt);
