#include "jansen.hpp"
#include "radial.hpp"

#include <cmath>
#include <cstdint>
#include <functional>
#include <iostream>
#include <stdexcept>

namespace {

template <typename E>
bool expectThrowType(const std::function<void()>& fn) {
    try {
        fn();
        return false;
    } catch (const E&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

Problem makeProblem(int num_vars) {
    Problem problem;
    problem.num_vars = num_vars;
    for (int i = 0; i < num_vars; ++i) {
        problem.names.push_back("x" + std::to_string(i + 1));
        problem.bounds.push_back({0.0, 1.0});
    }
    return problem;
}

}  // namespace

// Two blocks of D+1 = 3 outputs with hand-computed indices:
// baselines 10, 20 (population variance 25),
// effects [-2, 1] and [-2, -1] give Jansen sums 8/4 and 2/4.
bool testHandComputedIndices() {
    std::cout << "Test: Total-effect indices match hand-computed values\n";

    Problem problem = makeProblem(2);
    Eigen::VectorXd Y(6);
    Y << 10.0, 12.0, 9.0, 20.0, 22.0, 21.0;

    bool passed = true;
    try {
        SensitivityResult result = jansenAnalyze(problem, Y, 2, 1000, 0.95, uint64_t{1});

        if (result.names != problem.names) {
            passed = false;
            std::cout << "  FAILED: names not carried through\n";
        }
        if (result.ST.size() != 2 || std::abs(result.ST[0] - 0.08) > 1e-12 ||
            std::abs(result.ST[1] - 0.02) > 1e-12) {
            passed = false;
            std::cout << "  FAILED: ST = [" << result.ST[0] << ", " << result.ST[1]
                      << "], expected [0.08, 0.02]\n";
        }
        if (result.ST_conf.size() != 2 || !(result.ST_conf[0] >= 0.0) ||
            !(result.ST_conf[1] >= 0.0)) {
            passed = false;
            std::cout << "  FAILED: ST_conf must be non-negative\n";
        }
        // Column 0 effects have equal magnitude, so every resample gives 0.08
        if (result.ST_conf[0] > 1e-12) {
            passed = false;
            std::cout << "  FAILED: ST_conf[0] = " << result.ST_conf[0] << ", expected 0\n";
        }
    } catch (const std::exception& e) {
        passed = false;
        std::cout << "  FAILED: unexpected exception: " << e.what() << "\n";
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

// Blocks whose first perturbed row repeats the baseline output, as a zero
// perturbation in the radial design produces: effects [0, 1] and [0, -1].
bool testDuplicateBaselineRow() {
    std::cout << "Test: Row equal to its baseline gives a zero elementary effect\n";

    Problem problem = makeProblem(2);
    Eigen::VectorXd Y(6);
    Y << 10.0, 10.0, 9.0, 20.0, 20.0, 21.0;

    bool passed = true;
    try {
        SensitivityResult result = jansenAnalyze(problem, Y, 2, 500, 0.95, uint64_t{3});
        if (result.ST[0] != 0.0 || result.ST_conf[0] != 0.0) {
            passed = false;
            std::cout << "  FAILED: ST[0] = " << result.ST[0] << ", ST_conf[0] = "
                      << result.ST_conf[0] << ", expected 0\n";
        }
        if (std::abs(result.ST[1] - 0.02) > 1e-12) {
            passed = false;
            std::cout << "  FAILED: ST[1] = " << result.ST[1] << ", expected 0.02\n";
        }
    } catch (const std::exception& e) {
        passed = false;
        std::cout << "  FAILED: unexpected exception: " << e.what() << "\n";
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testJansenEstimator() {
    std::cout << "Test: Jansen estimator is sum of squares over 2r\n";

    Eigen::MatrixXd effects(3, 2);
    effects << 1.0, 0.0,
              -2.0, 3.0,
               3.0, -3.0;
    Eigen::RowVectorXd est = jansenEstimator(effects);

    bool passed = std::abs(est(0) - 14.0 / 6.0) < 1e-14 && std::abs(est(1) - 18.0 / 6.0) < 1e-14;
    if (!passed) {
        std::cout << "  FAILED: got [" << est(0) << ", " << est(1) << "]\n";
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testConfidenceReproducibility() {
    std::cout << "Test: Bootstrap intervals are reproducible with a seed\n";

    Problem problem = makeProblem(3);
    Eigen::MatrixXd X = radialSample(problem, 30, uint64_t{9});
    Eigen::VectorXd Y(X.rows());
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        Y(i) = X(i, 0) + X(i, 1) * X(i, 2);
    }

    bool passed = true;
    RandomState rng_a(77);
    RandomState rng_b(77);
    SensitivityResult a = jansenAnalyze(problem, Y, 30, rng_a, 200, 0.9);
    SensitivityResult b = jansenAnalyze(problem, Y, 30, rng_b, 200, 0.9);

    if (a.ST != b.ST || a.ST_conf != b.ST_conf) {
        passed = false;
        std::cout << "  FAILED: same seed gave different results\n";
    }
    for (double c : a.ST_conf) {
        if (!(c > 0.0) || !std::isfinite(c)) {
            passed = false;
            std::cout << "  FAILED: ST_conf value " << c << "\n";
        }
    }

    // A wider interval for a higher confidence level with the same resamples
    RandomState rng_c(77);
    SensitivityResult wide = jansenAnalyze(problem, Y, 30, rng_c, 200, 0.99);
    for (size_t i = 0; i < wide.ST_conf.size(); ++i) {
        if (!(wide.ST_conf[i] > a.ST_conf[i])) {
            passed = false;
            std::cout << "  FAILED: 0.99 interval not wider than 0.9 for " << i << "\n";
        }
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testLinearModelRanking() {
    std::cout << "Test: Additive model ranks inputs by weight\n";

    // Y = 4 x1 + 2 x2 + 0 x3 on the unit cube: ST ~ [16, 4, 0] / 20
    Problem problem = makeProblem(3);
    const int N = 256;
    Eigen::MatrixXd X = radialSample(problem, N, uint64_t{5});
    Eigen::VectorXd Y(X.rows());
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        Y(i) = 4.0 * X(i, 0) + 2.0 * X(i, 1) + 0.0 * X(i, 2);
    }

    bool passed = true;
    SensitivityResult result = jansenAnalyze(problem, Y, N, 100, 0.95, uint64_t{5});

    if (!(result.ST[0] > result.ST[1] && result.ST[1] > result.ST[2])) {
        passed = false;
        std::cout << "  FAILED: ranking [" << result.ST[0] << ", " << result.ST[1] << ", "
                  << result.ST[2] << "]\n";
    }
    if (result.ST[2] != 0.0 || result.ST_conf[2] != 0.0) {
        passed = false;
        std::cout << "  FAILED: inactive input has ST " << result.ST[2] << "\n";
    }
    if (std::abs(result.ST[0] - 0.8) > 0.15 || std::abs(result.ST[1] - 0.2) > 0.1) {
        passed = false;
        std::cout << "  FAILED: ST far from analytic values\n";
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

bool testErrors() {
    std::cout << "Test: Typed errors for invalid inputs\n";

    Problem problem = makeProblem(2);
    Eigen::VectorXd Y(6);
    Y << 10.0, 12.0, 9.0, 20.0, 22.0, 21.0;
    RandomState rng(1);

    bool passed = true;

    Eigen::VectorXd short_Y = Y.head(5);
    if (!expectThrowType<ShapeMismatchError>([&]() {
            (void)jansenAnalyze(problem, short_Y, 2, rng);
        })) {
        passed = false;
        std::cout << "  FAILED: length 5 for 2 sets of 3 accepted\n";
    }
    if (!expectThrowType<ShapeMismatchError>([&]() {
            (void)jansenAnalyze(problem, Y, 3, rng);
        })) {
        passed = false;
        std::cout << "  FAILED: wrong sample_sets accepted\n";
    }

    const double bad_levels[] = {0.0, 1.0, -0.5, 1.5};
    for (double level : bad_levels) {
        if (!expectThrowType<InvalidConfidenceLevelError>([&]() {
                (void)jansenAnalyze(problem, Y, 2, rng, 100, level);
            })) {
            passed = false;
            std::cout << "  FAILED: conf_level " << level << " accepted\n";
        }
    }

    // Shape is checked before the confidence level
    if (!expectThrowType<ShapeMismatchError>([&]() {
            (void)jansenAnalyze(problem, short_Y, 2, rng, 100, 1.5);
        })) {
        passed = false;
        std::cout << "  FAILED: shape not checked first\n";
    }

    if (!expectThrowType<std::invalid_argument>([&]() {
            (void)jansenAnalyze(problem, Y, 2, rng, 1, 0.95);
        })) {
        passed = false;
        std::cout << "  FAILED: num_resamples=1 accepted\n";
    }

    Eigen::VectorXd flat(6);
    flat << 5.0, 1.0, 2.0, 5.0, 3.0, 4.0;
    if (!expectThrowType<DegenerateStatisticsError>([&]() {
            (void)jansenAnalyze(problem, flat, 2, rng);
        })) {
        passed = false;
        std::cout << "  FAILED: constant baseline accepted\n";
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

int main() {
    std::cout << "Jansen Estimator Tests\n";
    std::cout << "======================\n\n";

    int passed = 0;
    const int total = 6;

    if (testHandComputedIndices()) passed++;
    if (testDuplicateBaselineRow()) passed++;
    if (testJansenEstimator()) passed++;
    if (testConfidenceReproducibility()) passed++;
    if (testLinearModelRanking()) passed++;
    if (testErrors()) passed++;

    std::cout << "Summary: " << passed << "/" << total << " tests passed\n";
    return (passed == total) ? 0 : 1;
}
