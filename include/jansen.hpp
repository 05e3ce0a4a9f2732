#pragma once

#include "problem.hpp"
#include "random_state.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Y length does not match sample_sets * (num_vars + 1)
class ShapeMismatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Confidence level outside (0, 1)
class InvalidConfidenceLevelError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Baseline outputs have zero (or non-finite) variance, so no index is defined
class DegenerateStatisticsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SensitivityResult {
    std::vector<std::string> names;
    std::vector<double> ST;       // Total-effect index per parameter
    std::vector<double> ST_conf;  // Confidence half-width per parameter
};

// Jansen estimator per column: sum(v^2) / (2 * rows)
Eigen::RowVectorXd jansenEstimator(const Eigen::MatrixXd& effects);

// Bootstrap confidence half-width of the Jansen total-effect index.
// effects is sample_sets x D; rows are resampled with replacement.
Eigen::RowVectorXd radialConfidence(const Eigen::MatrixXd& effects, double base_variance,
                                    int num_resamples, double conf_level, RandomState& rng);

// Total-effect indices for outputs Y of a radial OAT design
// (Campolongo, Saltelli & Cariboni 2011; Jansen 1999).
//
// Y holds sample_sets blocks of num_vars + 1 outputs in the row order produced
// by radialSample. Throws ShapeMismatchError, InvalidConfidenceLevelError,
// std::invalid_argument (num_resamples < 2) or DegenerateStatisticsError.
SensitivityResult jansenAnalyze(const Problem& problem, const Eigen::VectorXd& Y,
                                int sample_sets, RandomState& rng,
                                int num_resamples = 1000, double conf_level = 0.95);

// Same, drawing from RandomState::global(), reseeded first when a seed is given
SensitivityResult jansenAnalyze(const Problem& problem, const Eigen::VectorXd& Y,
                                int sample_sets, int num_resamples = 1000,
                                double conf_level = 0.95,
                                std::optional<uint64_t> seed = std::nullopt);
