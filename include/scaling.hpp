#pragma once

#include "problem.hpp"

#include <Eigen/Dense>

#include <vector>

// Map each column of a unit-cube sample from [0,1) to [low, high).
// Throws std::invalid_argument if the column count does not match bounds or
// any low >= high.
Eigen::MatrixXd scaleLinear(const Eigen::MatrixXd& unit, const std::vector<Bounds>& bounds);

// In-place variant of scaleLinear. `samples` must not be shared with other
// owners that expect unit-cube values afterwards.
void scaleLinearInPlace(Eigen::MatrixXd& samples, const std::vector<Bounds>& bounds);

// Map each column through the inverse CDF of its distribution (see Distribution
// for the meaning of the bounds per distribution).
Eigen::MatrixXd scaleNonuniform(const Eigen::MatrixXd& unit,
                                const std::vector<Bounds>& bounds,
                                const std::vector<Distribution>& dists);

// Linear or inverse-CDF scaling, whichever the problem calls for
Eigen::MatrixXd scaleToProblem(const Eigen::MatrixXd& unit, const Problem& problem);
