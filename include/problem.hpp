#pragma once

#include "config.hpp"

#include <string>
#include <vector>

// Marginal distribution of one input parameter.
//
// The two numbers stored in Bounds mean different things per distribution:
//   Uniform:    [low, high]           low < high
//   Triangular: [scale, peak]         scale > 0, 0 < peak < 1, support [0, scale]
//   Normal:     [mean, stdev]         stdev > 0
//   LogNormal:  [mean, stdev] of log  stdev > 0
enum class Distribution {
    Uniform,
    Triangular,
    Normal,
    LogNormal
};

Distribution parseDistribution(const std::string& name);
std::string toString(Distribution dist);

struct Bounds {
    double low = 0.0;
    double high = 0.0;
};

// Problem definition shared by the samplers and the estimator
struct Problem {
    int num_vars = 0;
    std::vector<std::string> names;
    std::vector<Bounds> bounds;
    std::vector<Distribution> dists;  // empty: all uniform over bounds

    bool hasDists() const { return !dists.empty(); }

    // Throws std::runtime_error on length mismatches, duplicate names or num_vars < 1
    void validate() const;

    // Build from the [[param]] sections of a config file
    static Problem fromConfig(const Config& cfg);
};
