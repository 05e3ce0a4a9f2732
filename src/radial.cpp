#include "radial.hpp"
#include "sampling.hpp"
#include "scaling.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

Eigen::MatrixXd radialSample(const Problem& problem, int N, const std::vector<uint32_t>& shifts) {
    const int num_vars = problem.num_vars;
    if (N < 1) {
        throw std::invalid_argument("radialSample: N must be >= 1, got " + std::to_string(N));
    }
    if (num_vars < 1) {
        throw std::invalid_argument("radialSample: num_vars must be >= 1, got " +
                                    std::to_string(num_vars));
    }
    if (shifts.size() != static_cast<size_t>(num_vars)) {
        throw std::invalid_argument("radialSample: expected " + std::to_string(num_vars) +
                                    " shifts, got " + std::to_string(shifts.size()));
    }

    const int R = N + RADIAL_DISCARD;
    const int group = num_vars + 1;

    // Nominal points: Sobol rows [discard, R)
    Eigen::MatrixXd sequence = SobolSequence::sample(static_cast<size_t>(R + N), shifts);
    Eigen::MatrixXd base = scaleLinear(sequence.middleRows(RADIAL_DISCARD, N), problem.bounds);

    // Perturbations: rows [R, R + N), disjoint from the nominal slice
    Eigen::MatrixXd perturbations = scaleLinear(sequence.bottomRows(N), problem.bounds);

    Eigen::MatrixXd sample_set(static_cast<Eigen::Index>(N) * group, num_vars);
    for (int i = 0; i < N; ++i) {
        const Eigen::Index grp_start = static_cast<Eigen::Index>(i) * group;
        sample_set.middleRows(grp_start, group) = base.row(i).replicate(group, 1);

        for (int j = 0; j < num_vars; ++j) {
            const double b = perturbations(i, j);
            if (b != 0.0) {
                sample_set(grp_start + 1 + j, j) = b;
            }
        }
    }

    return sample_set;
}

Eigen::MatrixXd radialSample(const Problem& problem, int N, RandomState& rng) {
    std::vector<uint32_t> shifts(static_cast<size_t>(std::max(problem.num_vars, 0)));
    for (auto& s : shifts) {
        s = rng.bits32();
    }
    return radialSample(problem, N, shifts);
}

Eigen::MatrixXd radialSample(const Problem& problem, int N, std::optional<uint64_t> seed) {
    RandomState& rng = RandomState::global();
    rng.seed(seed);
    return radialSample(problem, N, rng);
}
