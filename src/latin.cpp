#include "latin.hpp"
#include "scaling.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

Eigen::MatrixXd latinUnitSample(int num_vars, int N, RandomState& rng) {
    if (N < 1) {
        throw std::invalid_argument("latinSample: N must be >= 1, got " + std::to_string(N));
    }
    if (num_vars < 1) {
        throw std::invalid_argument("latinSample: num_vars must be >= 1, got " +
                                    std::to_string(num_vars));
    }

    Eigen::MatrixXd result(N, num_vars);
    std::vector<double> temp(static_cast<size_t>(N));
    const double d = 1.0 / N;

    for (int i = 0; i < num_vars; ++i) {
        for (int j = 0; j < N; ++j) {
            const double upper = (j + 1) * d;
            double value = rng.uniform(j * d, upper);
            // Rounding can land exactly on the next stratum's edge
            if (value >= upper) {
                value = std::nextafter(upper, 0.0);
            }
            temp[static_cast<size_t>(j)] = value;
        }

        std::shuffle(temp.begin(), temp.end(), rng.engine());

        for (int j = 0; j < N; ++j) {
            result(j, i) = temp[static_cast<size_t>(j)];
        }
    }

    return result;
}

Eigen::MatrixXd latinSample(const Problem& problem, int N, RandomState& rng) {
    return scaleToProblem(latinUnitSample(problem.num_vars, N, rng), problem);
}

Eigen::MatrixXd latinSample(const Problem& problem, int N, std::optional<uint64_t> seed) {
    RandomState& rng = RandomState::global();
    rng.seed(seed);
    return latinSample(problem, N, rng);
}
