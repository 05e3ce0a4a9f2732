#include "scaling.hpp"

#include <boost/math/distributions/normal.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

void checkColumns(const Eigen::MatrixXd& m, size_t expected, const char* fn) {
    if (static_cast<size_t>(m.cols()) != expected) {
        throw std::invalid_argument(std::string(fn) + ": sample has " +
                                    std::to_string(m.cols()) + " columns but " +
                                    std::to_string(expected) + " parameters were given");
    }
}

void checkLinearBounds(const std::vector<Bounds>& bounds) {
    for (size_t j = 0; j < bounds.size(); ++j) {
        if (!(bounds[j].low < bounds[j].high)) {
            throw std::invalid_argument("Bounds are not legal for parameter " + std::to_string(j) +
                                        ": lower bound " + std::to_string(bounds[j].low) +
                                        " must be less than upper bound " +
                                        std::to_string(bounds[j].high));
        }
    }
}

// Inverse CDF of the triangular distribution on [0, scale] with mode peak*scale
double triangularQuantile(double q, double scale, double peak) {
    if (q < peak) {
        return scale * std::sqrt(peak * q);
    }
    return scale * (1.0 - std::sqrt((1.0 - peak) * (1.0 - q)));
}

// Normal quantile; q == 0 maps to -inf
double normalQuantile(double q, double mean, double stdev) {
    if (q <= 0.0) {
        return -std::numeric_limits<double>::infinity();
    }
    boost::math::normal_distribution<double> dist(mean, stdev);
    return boost::math::quantile(dist, q);
}

// u * (high - low) + low, kept below high where rounding would reach it
Eigen::VectorXd scaleColumn(const Eigen::VectorXd& u, double low, double high) {
    const double top = std::nextafter(high, low);
    return (u.array() * (high - low) + low).min(top).matrix();
}

}  // namespace

Eigen::MatrixXd scaleLinear(const Eigen::MatrixXd& unit, const std::vector<Bounds>& bounds) {
    Eigen::MatrixXd scaled = unit;
    scaleLinearInPlace(scaled, bounds);
    return scaled;
}

void scaleLinearInPlace(Eigen::MatrixXd& samples, const std::vector<Bounds>& bounds) {
    checkColumns(samples, bounds.size(), "scaleLinear");
    checkLinearBounds(bounds);

    for (Eigen::Index j = 0; j < samples.cols(); ++j) {
        const Bounds& b = bounds[static_cast<size_t>(j)];
        samples.col(j) = scaleColumn(samples.col(j), b.low, b.high);
    }
}

Eigen::MatrixXd scaleNonuniform(const Eigen::MatrixXd& unit,
                                const std::vector<Bounds>& bounds,
                                const std::vector<Distribution>& dists) {
    checkColumns(unit, bounds.size(), "scaleNonuniform");
    if (dists.size() != bounds.size()) {
        throw std::invalid_argument("scaleNonuniform: expected " + std::to_string(bounds.size()) +
                                    " distributions, got " + std::to_string(dists.size()));
    }

    Eigen::MatrixXd scaled(unit.rows(), unit.cols());
    for (Eigen::Index j = 0; j < unit.cols(); ++j) {
        const size_t p = static_cast<size_t>(j);
        const double b1 = bounds[p].low;
        const double b2 = bounds[p].high;

        switch (dists[p]) {
            case Distribution::Uniform:
                if (b1 >= b2) {
                    throw std::invalid_argument(
                        "Uniform distribution: lower bound must be less than upper bound");
                }
                scaled.col(j) = scaleColumn(unit.col(j), b1, b2);
                break;

            case Distribution::Triangular:
                if (b1 <= 0.0 || b2 <= 0.0 || b2 >= 1.0) {
                    throw std::invalid_argument(
                        "Triangular distribution: scale must be greater than zero; peak on interval (0,1)");
                }
                for (Eigen::Index i = 0; i < unit.rows(); ++i) {
                    scaled(i, j) = triangularQuantile(unit(i, j), b1, b2);
                }
                break;

            case Distribution::Normal:
                if (b2 <= 0.0) {
                    throw std::invalid_argument("Normal distribution: stdev must be > 0");
                }
                for (Eigen::Index i = 0; i < unit.rows(); ++i) {
                    scaled(i, j) = normalQuantile(unit(i, j), b1, b2);
                }
                break;

            case Distribution::LogNormal:
                if (b2 <= 0.0) {
                    throw std::invalid_argument("Lognormal distribution: stdev must be > 0");
                }
                for (Eigen::Index i = 0; i < unit.rows(); ++i) {
                    scaled(i, j) = std::exp(normalQuantile(unit(i, j), b1, b2));
                }
                break;
        }
    }
    return scaled;
}

Eigen::MatrixXd scaleToProblem(const Eigen::MatrixXd& unit, const Problem& problem) {
    if (problem.hasDists()) {
        return scaleNonuniform(unit, problem.bounds, problem.dists);
    }
    return scaleLinear(unit, problem.bounds);
}
