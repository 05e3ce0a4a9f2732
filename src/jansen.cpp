#include "jansen.hpp"

#include <boost/math/distributions/normal.hpp>

#include <cmath>

Eigen::RowVectorXd jansenEstimator(const Eigen::MatrixXd& effects) {
    const double r = static_cast<double>(effects.rows());
    return effects.array().square().colwise().sum().matrix() / (2.0 * r);
}

Eigen::RowVectorXd radialConfidence(const Eigen::MatrixXd& effects, double base_variance,
                                    int num_resamples, double conf_level, RandomState& rng) {
    if (!(conf_level > 0.0 && conf_level < 1.0)) {
        throw InvalidConfidenceLevelError("Confidence level must be between 0-1, got " +
                                          std::to_string(conf_level));
    }
    if (num_resamples < 2) {
        throw std::invalid_argument("num_resamples must be >= 2, got " +
                                    std::to_string(num_resamples));
    }

    const Eigen::Index r = effects.rows();
    const Eigen::Index D = effects.cols();

    // One row per bootstrap trial
    Eigen::MatrixXd trials(num_resamples, D);
    Eigen::MatrixXd resampled(r, D);
    for (int t = 0; t < num_resamples; ++t) {
        for (Eigen::Index k = 0; k < r; ++k) {
            const size_t pick = rng.index(static_cast<size_t>(r));
            resampled.row(k) = effects.row(static_cast<Eigen::Index>(pick));
        }
        trials.row(t) = jansenEstimator(resampled) / base_variance;
    }

    // Sample standard deviation (ddof = 1) across trials
    const Eigen::RowVectorXd mean = trials.colwise().mean();
    const Eigen::RowVectorXd stdev =
        ((trials.rowwise() - mean).array().square().colwise().sum() /
         static_cast<double>(num_resamples - 1)).sqrt().matrix();

    boost::math::normal_distribution<double> standard_normal;
    const double z = boost::math::quantile(standard_normal, 0.5 + conf_level / 2.0);
    return z * stdev;
}

SensitivityResult jansenAnalyze(const Problem& problem, const Eigen::VectorXd& Y,
                                int sample_sets, RandomState& rng,
                                int num_resamples, double conf_level) {
    const int num_vars = problem.num_vars;
    const int group = num_vars + 1;

    if (sample_sets < 1 || num_vars < 1 ||
        Y.size() != static_cast<Eigen::Index>(sample_sets) * group) {
        throw ShapeMismatchError("Number of result set groups must match number of parameters + 1: "
                                 "got " + std::to_string(Y.size()) + " outputs for " +
                                 std::to_string(sample_sets) + " sample sets of " +
                                 std::to_string(group));
    }
    if (!(conf_level > 0.0 && conf_level < 1.0)) {
        throw InvalidConfidenceLevelError("Confidence level must be between 0-1, got " +
                                          std::to_string(conf_level));
    }
    if (num_resamples < 2) {
        throw std::invalid_argument("num_resamples must be >= 2, got " +
                                    std::to_string(num_resamples));
    }

    // Position 0 of each block is the baseline output
    Eigen::VectorXd Y_base(sample_sets);
    Eigen::MatrixXd effects(sample_sets, num_vars);
    for (int k = 0; k < sample_sets; ++k) {
        const Eigen::Index start = static_cast<Eigen::Index>(k) * group;
        Y_base(k) = Y(start);
        for (int i = 0; i < num_vars; ++i) {
            effects(k, i) = Y_base(k) - Y(start + 1 + i);
        }
    }

    // Population variance (ddof = 0)
    const double base_variance = (Y_base.array() - Y_base.mean()).square().mean();
    if (!(base_variance > 0.0) || !std::isfinite(base_variance)) {
        throw DegenerateStatisticsError("Variance of baseline outputs is " +
                                        std::to_string(base_variance) +
                                        "; total-effect indices are undefined (sample_sets=" +
                                        std::to_string(sample_sets) + ")");
    }

    const Eigen::RowVectorXd st = jansenEstimator(effects) / base_variance;
    const Eigen::RowVectorXd st_conf =
        radialConfidence(effects, base_variance, num_resamples, conf_level, rng);

    SensitivityResult result;
    result.names = problem.names;
    result.ST.assign(st.data(), st.data() + st.size());
    result.ST_conf.assign(st_conf.data(), st_conf.data() + st_conf.size());
    return result;
}

SensitivityResult jansenAnalyze(const Problem& problem, const Eigen::VectorXd& Y,
                                int sample_sets, int num_resamples, double conf_level,
                                std::optional<uint64_t> seed) {
    RandomState& rng = RandomState::global();
    rng.seed(seed);
    return jansenAnalyze(problem, Y, sample_sets, rng, num_resamples, conf_level);
}
