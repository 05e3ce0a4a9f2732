#pragma once

#include "problem.hpp"
#include "random_state.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <optional>
#include <vector>

// Leading Sobol points dropped from the baseline stream. Early points of a
// short Sobol sequence are correlated (Campolongo et al. 2011, R = r + 4).
constexpr int RADIAL_DISCARD = 4;

// Radial one-at-a-time design (Campolongo, Saltelli & Cariboni 2011).
//
// Returns N*(D+1) rows in blocks of D+1:
//   [x_1,  x_2,  ..., x_D ]   baseline
//   [b_1,  x_2,  ..., x_D ]
//   [x_1,  b_2,  ..., x_D ]
//   ...
//   [x_1,  x_2,  ..., b_D ]
// where x is a Sobol point and b comes from a later, non-overlapping slice of
// the same sequence. A perturbation b_j that scales to exactly 0 leaves that
// row equal to the baseline.
//
// rng supplies one random digital shift per dimension, so a seeded state
// reproduces the design and different seeds give different designs.
// Bounds are applied linearly; problem.dists is not consulted.
Eigen::MatrixXd radialSample(const Problem& problem, int N, RandomState& rng);

// Same, with the digital shift given explicitly (one entry per parameter).
// All-zero shifts give the plain Sobol design.
Eigen::MatrixXd radialSample(const Problem& problem, int N, const std::vector<uint32_t>& shifts);

// Same, drawing from RandomState::global(), reseeded first when a seed is given
Eigen::MatrixXd radialSample(const Problem& problem, int N,
                             std::optional<uint64_t> seed = std::nullopt);
